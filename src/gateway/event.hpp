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

// Lamina Event - Header
// Proxy-integration event object built from one buffered HTTP request

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../http/http.hpp"

namespace lamina::gateway {

/// Ordered key/value list (keys may repeat)
using FieldList = std::vector<std::pair<std::string, std::string>>;

/// Ordered key -> all values in arrival order
using MultiFieldList = std::vector<std::pair<std::string, std::vector<std::string>>>;

/// Event object handed to a function
///
/// Serialized with the proxy-integration field names: resource, path,
/// httpMethod, headers, multiValueHeaders, queryStringParameters,
/// multiValueQueryStringParameters, pathParameters, stageVariables,
/// requestContext, body, isBase64Encoded.
struct Event {
    std::string resource = "/{proxy+}";
    std::string path;         // Raw request target including the query string
    std::string http_method;

    FieldList headers;                  // First occurrence of each name
    MultiFieldList multi_value_headers; // Every occurrence
    FieldList query_string_parameters;
    MultiFieldList multi_value_query_string_parameters;

    nlohmann::json request_context = nlohmann::json::object();
    std::string body;
    bool is_base64_encoded = false;

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Build the event for a fully buffered request
[[nodiscard]] Event build_event(const http::Request& request);

/// Keep the first value of each key, preserving first-seen order
[[nodiscard]] FieldList first_values(const FieldList& fields);

/// Group every value by key, keys in first-seen order
[[nodiscard]] MultiFieldList group_values(const FieldList& fields);

/// Split a query string ("a=1&b=2&a=3") into decoded pairs in order.
/// A key without '=' gets an empty value; empty segments are skipped.
[[nodiscard]] FieldList parse_query_string(std::string_view query);

/// Percent-decode; '+' becomes a space. Malformed escapes are kept verbatim.
[[nodiscard]] std::string url_decode(std::string_view input);

/// Lowercased hostname of an absolute or scheme-relative URL
/// ("http://localhost:3000/x" -> "localhost"), nullopt when there is none
[[nodiscard]] std::optional<std::string> url_hostname(std::string_view url);

/// Host component of a Host header value: text before the first ':'
[[nodiscard]] std::string_view host_component(std::string_view host) noexcept;

}  // namespace lamina::gateway
