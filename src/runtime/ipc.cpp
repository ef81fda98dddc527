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

// Lamina IPC Protocol - Implementation

#include "ipc.hpp"

#include <fmt/format.h>

#include "../http/http.hpp"

namespace lamina::runtime {

namespace {

// Header values may be strings, numbers or booleans; anything else is malformed
std::optional<std::string> render_header_value(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    return std::nullopt;
}

// Rendered headers go onto the wire verbatim, so reject anything that could split the head
bool check_header(std::string_view name, std::string_view value, std::string& error_out) {
    if (!http::is_valid_header_name(name)) {
        error_out = fmt::format("invalid header name '{}'", name);
        return false;
    }
    if (!http::is_valid_header_value(value)) {
        error_out = fmt::format("invalid character in header '{}'", name);
        return false;
    }
    return true;
}

}  // anonymous namespace

std::string encode_event_message(std::string_view id, const nlohmann::json& event) {
    nlohmann::json message;
    message["type"] = "event";
    message["id"] = std::string(id);
    message["eventObject"] = event;

    std::string out = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out += '\n';
    return out;
}

std::optional<ResultMessage> decode_result_message(std::string_view line,
                                                   std::string_view expected_id,
                                                   std::string& error_out) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        error_out = fmt::format("unparseable message from worker: {}", e.what());
        return std::nullopt;
    }

    if (!message.is_object()) {
        error_out = fmt::format("bad data type from worker: {}", message.type_name());
        return std::nullopt;
    }

    auto type = message.find("type");
    if (type == message.end() || !type->is_string() || type->get<std::string>() != "result") {
        error_out = fmt::format("incorrect type field from worker: {}",
                                type == message.end() ? std::string("<missing>") : type->dump());
        return std::nullopt;
    }

    auto id = message.find("id");
    if (id == message.end() || !id->is_string()) {
        error_out = "missing id from worker";
        return std::nullopt;
    }
    if (id->get<std::string>() != expected_id) {
        error_out = fmt::format("unknown response id from worker: {}", id->get<std::string>());
        return std::nullopt;
    }

    auto result = message.find("result");
    if (result == message.end()) {
        error_out = "missing result from worker";
        return std::nullopt;
    }

    std::string shape_error;
    auto parsed = parse_invocation_result(*result, shape_error);
    if (!parsed) {
        error_out = fmt::format("malformed result from worker: {}", shape_error);
        return std::nullopt;
    }

    ResultMessage decoded;
    decoded.id = id->get<std::string>();
    decoded.result = std::move(*parsed);

    auto memory = message.find("memoryUsedBytes");
    if (memory != message.end() && !memory->is_null()) {
        if (!memory->is_number()) {
            error_out = "memoryUsedBytes must be a number";
            return std::nullopt;
        }
        decoded.memory_used_bytes = memory->get<double>();
    }

    return decoded;
}

std::optional<InvocationResult> parse_invocation_result(const nlohmann::json& value,
                                                        std::string& error_out) {
    if (!value.is_object()) {
        error_out = "result is not an object";
        return std::nullopt;
    }

    InvocationResult result;

    auto base64 = value.find("isBase64Encoded");
    if (base64 == value.end() || !base64->is_boolean()) {
        error_out = "isBase64Encoded must be a boolean";
        return std::nullopt;
    }
    result.is_base64_encoded = base64->get<bool>();

    auto status = value.find("statusCode");
    if (status == value.end() || !status->is_number()) {
        error_out = "statusCode must be a number";
        return std::nullopt;
    }
    double status_value = status->get<double>();
    if (status_value < 100 || status_value > 999 ||
        status_value != static_cast<double>(static_cast<int>(status_value))) {
        error_out = fmt::format("invalid statusCode {}", status->dump());
        return std::nullopt;
    }
    result.status_code = static_cast<int>(status_value);

    auto headers = value.find("headers");
    if (headers == value.end() || !headers->is_object()) {
        error_out = "headers must be an object";
        return std::nullopt;
    }
    for (const auto& [name, header_value] : headers->items()) {
        auto rendered = render_header_value(header_value);
        if (!rendered) {
            error_out = fmt::format("invalid value for header '{}'", name);
            return std::nullopt;
        }
        if (!check_header(name, *rendered, error_out)) {
            return std::nullopt;
        }
        result.headers.emplace_back(name, std::move(*rendered));
    }

    // null/absent multiValueHeaders are allowed
    auto multi = value.find("multiValueHeaders");
    if (multi != value.end() && !multi->is_null()) {
        if (!multi->is_object()) {
            error_out = "multiValueHeaders must be an object";
            return std::nullopt;
        }
        std::vector<std::pair<std::string, std::vector<std::string>>> entries;
        for (const auto& [name, values] : multi->items()) {
            std::vector<std::string> rendered_values;
            if (values.is_array()) {
                for (const auto& item : values) {
                    auto rendered = render_header_value(item);
                    if (!rendered) {
                        error_out = fmt::format("invalid value for header '{}'", name);
                        return std::nullopt;
                    }
                    rendered_values.push_back(std::move(*rendered));
                }
            } else {
                auto rendered = render_header_value(values);
                if (!rendered) {
                    error_out = fmt::format("invalid value for header '{}'", name);
                    return std::nullopt;
                }
                rendered_values.push_back(std::move(*rendered));
            }
            for (const auto& rendered : rendered_values) {
                if (!check_header(name, rendered, error_out)) {
                    return std::nullopt;
                }
            }
            entries.emplace_back(name, std::move(rendered_values));
        }
        result.multi_value_headers = std::move(entries);
    }

    auto body = value.find("body");
    if (body == value.end() || !body->is_string()) {
        error_out = "body must be a string";
        return std::nullopt;
    }
    result.body = body->get<std::string>();

    return result;
}

nlohmann::json to_json(const InvocationResult& result) {
    nlohmann::json j;
    j["statusCode"] = result.status_code;
    j["headers"] = nlohmann::json::object();
    for (const auto& [name, value] : result.headers) {
        j["headers"][name] = value;
    }
    if (result.multi_value_headers) {
        j["multiValueHeaders"] = nlohmann::json::object();
        for (const auto& [name, values] : *result.multi_value_headers) {
            j["multiValueHeaders"][name] = values;
        }
    }
    j["body"] = result.body;
    j["isBase64Encoded"] = result.is_base64_encoded;
    return j;
}

std::optional<std::string> LineBuffer::next_line() {
    size_t newline = buffer_.find('\n', cursor_);
    if (newline == std::string::npos) {
        // Compact consumed prefix
        if (cursor_ > 0) {
            buffer_.erase(0, cursor_);
            cursor_ = 0;
        }
        return std::nullopt;
    }

    std::string line = buffer_.substr(cursor_, newline - cursor_);
    cursor_ = newline + 1;
    if (cursor_ == buffer_.size()) {
        buffer_.clear();
        cursor_ = 0;
    }
    return line;
}

std::optional<std::string> LineBuffer::take_rest() {
    if (cursor_ >= buffer_.size()) {
        buffer_.clear();
        cursor_ = 0;
        return std::nullopt;
    }
    std::string rest = buffer_.substr(cursor_);
    buffer_.clear();
    cursor_ = 0;
    return rest;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

}  // namespace lamina::runtime
