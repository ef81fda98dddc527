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

// Lamina Event - Implementation

#include "event.hpp"

#include <algorithm>
#include <cctype>

namespace lamina::gateway {

namespace {

nlohmann::json fields_to_json(const FieldList& fields) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : fields) {
        out[key] = value;
    }
    return out;
}

nlohmann::json multi_fields_to_json(const MultiFieldList& fields) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, values] : fields) {
        out[key] = values;
    }
    return out;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_scheme_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

}  // anonymous namespace

nlohmann::json Event::to_json() const {
    nlohmann::json j;
    j["resource"] = resource;
    j["path"] = path;
    j["httpMethod"] = http_method;
    j["headers"] = fields_to_json(headers);
    j["multiValueHeaders"] = multi_fields_to_json(multi_value_headers);
    j["queryStringParameters"] = fields_to_json(query_string_parameters);
    j["multiValueQueryStringParameters"] = multi_fields_to_json(multi_value_query_string_parameters);
    j["pathParameters"] = nlohmann::json::object();
    j["stageVariables"] = nlohmann::json::object();
    j["requestContext"] = request_context;
    j["body"] = body;
    j["isBase64Encoded"] = is_base64_encoded;
    return j;
}

Event build_event(const http::Request& request) {
    Event event;
    event.path = request.uri.empty() ? std::string("/") : request.uri;
    event.http_method =
        request.method_name.empty() ? std::string("GET") : request.method_name;

    // Header names keep their wire spelling
    FieldList raw_headers;
    raw_headers.reserve(request.headers.size());
    for (const auto& header : request.headers) {
        raw_headers.emplace_back(header.name, header.value);
    }
    event.headers = first_values(raw_headers);
    event.multi_value_headers = group_values(raw_headers);

    FieldList query = parse_query_string(request.query);
    event.query_string_parameters = first_values(query);
    event.multi_value_query_string_parameters = group_values(query);

    event.body = request.body;
    return event;
}

FieldList first_values(const FieldList& fields) {
    FieldList out;
    for (const auto& [key, value] : fields) {
        bool seen = std::any_of(out.begin(), out.end(),
                                [&key](const auto& entry) { return entry.first == key; });
        if (!seen) {
            out.emplace_back(key, value);
        }
    }
    return out;
}

MultiFieldList group_values(const FieldList& fields) {
    MultiFieldList out;
    for (const auto& [key, value] : fields) {
        auto it = std::find_if(out.begin(), out.end(),
                               [&key](const auto& entry) { return entry.first == key; });
        if (it == out.end()) {
            out.emplace_back(key, std::vector<std::string>{value});
        } else {
            it->second.push_back(value);
        }
    }
    return out;
}

FieldList parse_query_string(std::string_view query) {
    FieldList out;

    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view segment = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

        if (segment.empty()) {
            continue;
        }

        size_t eq = segment.find('=');
        if (eq == std::string_view::npos) {
            out.emplace_back(url_decode(segment), std::string());
        } else {
            out.emplace_back(url_decode(segment.substr(0, eq)),
                             url_decode(segment.substr(eq + 1)));
        }
    }

    return out;
}

std::string url_decode(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }

    return out;
}

std::optional<std::string> url_hostname(std::string_view url) {
    // Optional scheme
    size_t colon = url.find(':');
    if (colon != std::string_view::npos && colon > 0 &&
        std::isalpha(static_cast<unsigned char>(url[0])) &&
        std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(colon),
                    is_scheme_char)) {
        url.remove_prefix(colon + 1);
    }

    // Authority must be introduced by "//"
    if (!url.starts_with("//")) {
        return std::nullopt;
    }
    url.remove_prefix(2);

    std::string_view authority = url.substr(0, url.find_first_of("/?#"));

    // Drop userinfo
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    if (authority.starts_with('[')) {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host = authority.substr(1, close - 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }

    if (host.empty()) {
        return std::nullopt;
    }

    std::string hostname(host);
    std::transform(hostname.begin(), hostname.end(), hostname.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return hostname;
}

std::string_view host_component(std::string_view host) noexcept {
    return host.substr(0, host.find(':'));
}

}  // namespace lamina::gateway
