/*
 * Copyright 2025 Lamina Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Lamina HTTP Protocol - Implementation

#include "http.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace lamina::http {

namespace {

template <typename Headers>
const Header* find_in(const Headers& headers, std::string_view name) noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

}  // namespace

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

bool Request::keep_alive() const noexcept {
    auto connection = get_header("Connection");

    // HTTP/1.1 defaults to keep-alive
    if (version == Version::HTTP_1_1) {
        // Only close if explicitly requested
        return !header_name_equals(connection, "close");
    }

    // HTTP/1.0 defaults to close
    return header_name_equals(connection, "keep-alive");
}

// Response helper methods

const Header* Response::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Response::set_header(std::string_view name, std::string_view value) {
    remove_header(name);
    headers.push_back({std::string(name), std::string(value)});
}

void Response::set_header(std::string_view name, const std::vector<std::string>& values) {
    remove_header(name);
    for (const auto& value : values) {
        headers.push_back({std::string(name), value});
    }
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.push_back({std::string(name), std::string(value)});
}

size_t Response::remove_header(std::string_view name) {
    auto removed = std::erase_if(
        headers, [name](const Header& header) { return header_name_equals(header.name, name); });
    return static_cast<size_t>(removed);
}

bool status_forbids_body(uint16_t status) noexcept {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

std::string serialize_response(const Response& response, bool keep_alive, bool head_request) {
    std::string out;
    bool with_body = !head_request && !status_forbids_body(response.status);

    // Estimate: status line + headers + body
    size_t estimated_size = 128 + response.body.size();
    for (const auto& header : response.headers) {
        estimated_size += header.name.size() + header.value.size() + 4;  // ": \r\n"
    }
    out.reserve(estimated_size);

    out += fmt::format("HTTP/1.1 {} {}\r\n", response.status, to_reason_phrase(response.status));

    for (const auto& header : response.headers) {
        // Skip headers we'll add ourselves
        if (header_name_equals(header.name, "Content-Length") ||
            header_name_equals(header.name, "Connection")) {
            continue;
        }
        out += header.name;
        out += ": ";
        out += header.value;
        out += "\r\n";
    }

    if (with_body) {
        out += fmt::format("Content-Length: {}\r\n", response.body.size());
    }
    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";
    if (with_body) {
        out += response.body;
    }
    return out;
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        case Version::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view to_reason_phrase(uint16_t code) noexcept {
    switch (code) {
        case 100:
            return "Continue";
        case 200:
            return "OK";
        case 201:
            return "Created";
        case 202:
            return "Accepted";
        case 204:
            return "No Content";
        case 301:
            return "Moved Permanently";
        case 302:
            return "Found";
        case 303:
            return "See Other";
        case 304:
            return "Not Modified";
        case 307:
            return "Temporary Redirect";
        case 308:
            return "Permanent Redirect";
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 408:
            return "Request Timeout";
        case 409:
            return "Conflict";
        case 413:
            return "Payload Too Large";
        case 422:
            return "Unprocessable Entity";
        case 429:
            return "Too Many Requests";
        case 500:
            return "Internal Server Error";
        case 501:
            return "Not Implemented";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        case 504:
            return "Gateway Timeout";
        default:
            return "Unknown";
    }
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

bool is_valid_header_name(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }

    // tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
    //         "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
    constexpr std::string_view kTokenSymbols = "!#$%&'*+-.^_`|~";
    return std::all_of(name.begin(), name.end(), [&](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               kTokenSymbols.find(c) != std::string_view::npos;
    });
}

bool is_valid_header_value(std::string_view value) noexcept {
    return value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos;
}

}  // namespace lamina::http
