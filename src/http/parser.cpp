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


// Lamina HTTP Parser - Implementation

#include "parser.hpp"

#include <cstring>

namespace lamina::http {

Parser::Parser() {
    // Initialize llhttp settings
    llhttp_settings_init(&settings_);

    // Register callbacks
    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    // Initialize parser
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;
}

Parser::~Parser() = default;

Parser::Parser(Parser&& other) noexcept
    : parser_(other.parser_)
    , settings_(other.settings_)
    , ctx_(std::move(other.ctx_)) {
    rebind();
}

Parser& Parser::operator=(Parser&& other) noexcept {
    if (this != &other) {
        parser_ = other.parser_;
        settings_ = other.settings_;
        ctx_ = std::move(other.ctx_);
        rebind();
    }
    return *this;
}

void Parser::rebind() noexcept {
    // llhttp keeps raw pointers to the settings and the user data
    parser_.settings = &settings_;
    parser_.data = &ctx_;
}

std::pair<ParseResult, size_t> Parser::parse_request(
    std::span<const uint8_t> data,
    Request& request) {

    // Set up context
    ctx_.request = &request;
    ctx_.error = HPE_OK;

    if (ctx_.message_complete) {
        // Previous message not yet reset - nothing more to consume
        return {ParseResult::Complete, 0};
    }

    // Execute parser
    llhttp_errno_t err = llhttp_execute(
        &parser_,
        reinterpret_cast<const char*>(data.data()),
        data.size());

    // Calculate bytes consumed
    size_t consumed = data.size();

    if (err == HPE_PAUSED) {
        // Paused by on_message_complete - the rest is the next request
        const char* error_pos = llhttp_get_error_pos(&parser_);
        if (error_pos) {
            consumed = static_cast<size_t>(
                reinterpret_cast<const uint8_t*>(error_pos) - data.data());
        }
        return {ParseResult::Complete, consumed};
    }

    // On error, get actual error position
    if (err != HPE_OK) {
        const char* error_pos = llhttp_get_error_pos(&parser_);
        if (error_pos) {
            consumed = static_cast<size_t>(
                reinterpret_cast<const uint8_t*>(error_pos) - data.data());
        }
        ctx_.error = err;
        return {ParseResult::Error, consumed};
    }

    if (ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }

    // Need more data (incomplete request)
    return {ParseResult::Incomplete, consumed};
}

void Parser::reset() {
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    ctx_ = Context{};
    parser_.data = &ctx_;
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.error == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(ctx_.error);
}

llhttp_errno_t Parser::error_code() const noexcept {
    return ctx_.error;
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = false;
    ctx->last_was_field = false;
    ctx->current_header_field.clear();
    ctx->error = HPE_OK;
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    // May be called more than once when the target spans reads
    ctx->request->uri.append(at, length);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    if (ctx->last_was_field) {
        // Continuation of a field split across reads
        ctx->current_header_field.append(at, length);
    } else {
        ctx->current_header_field.assign(at, length);
    }

    ctx->last_was_field = true;
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    if (ctx->last_was_field || ctx->request->headers.empty()) {
        ctx->request->headers.push_back({ctx->current_header_field, std::string(at, length)});
    } else {
        // Continuation of the previous value
        ctx->request->headers.back().value.append(at, length);
    }

    ctx->last_was_field = false;
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    Request& request = *ctx->request;

    uint8_t major = parser->http_major;
    uint8_t minor = parser->http_minor;
    if (major == 1 && minor == 0) {
        request.version = Version::HTTP_1_0;
    } else if (major == 1 && minor == 1) {
        request.version = Version::HTTP_1_1;
    } else {
        request.version = Version::UNKNOWN;
    }

    auto method = static_cast<llhttp_method_t>(llhttp_get_method(parser));
    request.method_name = llhttp_method_name(method);
    request.method = parse_method(request.method_name);

    // Split path and query
    size_t query_pos = request.uri.find('?');
    if (query_pos != std::string::npos) {
        request.path = request.uri.substr(0, query_pos);
        request.query = request.uri.substr(query_pos + 1);
    } else {
        request.path = request.uri;
        request.query.clear();
    }

    return 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    // Whole body is buffered in memory (chunked bodies arrive in pieces)
    ctx->request->body.append(at, length);
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = true;
    return HPE_PAUSED;
}

// Convenience wrappers

std::optional<Request> parse_http_request(std::span<const uint8_t> data) {
    Parser parser;
    Request request;

    auto [result, consumed] = parser.parse_request(data, request);

    if (result == ParseResult::Complete) {
        return request;
    }

    return std::nullopt;
}

std::optional<Request> parse_http_request(std::string_view data) {
    return parse_http_request(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

} // namespace lamina::http
