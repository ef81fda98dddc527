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

// Lamina HTTP Protocol - Header
// Owned HTTP value types (requests are fully buffered before dispatch)

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lamina::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes used by the gateway itself
/// (worker results may carry any numeric status)
enum class StatusCode : uint16_t {
    OK = 200,
    NoContent = 204,
    BadRequest = 400,
    Forbidden = 403,
    NotFound = 404,
    InternalServerError = 500,
    BadGateway = 502,
};

/// HTTP header (name-value pair), names keep their original case
struct Header {
    std::string name;
    std::string value;
};

/// HTTP request
struct Request {
    Method method = Method::UNKNOWN;
    std::string method_name;  // Raw method token (for methods outside the enum)
    Version version = Version::HTTP_1_1;

    std::string uri;    // Raw request target, including the query string
    std::string path;   // URI without query string
    std::string query;  // Query string (if present, without '?')

    // Headers in arrival order, duplicates preserved
    std::vector<Header> headers;

    std::string body;

    // Helper: Find first header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Connection: keep-alive helper
    [[nodiscard]] bool keep_alive() const noexcept;
};

/// HTTP response
struct Response {
    uint16_t status = static_cast<uint16_t>(StatusCode::OK);
    std::vector<Header> headers;
    std::string body;

    // Helper: Find first header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Replace every header with this name by a single value
    void set_header(std::string_view name, std::string_view value);

    // Replace every header with this name by one line per value
    void set_header(std::string_view name, const std::vector<std::string>& values);

    // Append a header line (duplicates allowed)
    void add_header(std::string_view name, std::string_view value);

    // Remove all headers with this name, returns number removed
    size_t remove_header(std::string_view name);

    void set_status(StatusCode code) noexcept { status = static_cast<uint16_t>(code); }
};

/// Serialize response head and body for the wire.
/// Content-Length and Connection are always computed here. Responses to HEAD
/// and 1xx/204/304 responses carry neither a body nor a Content-Length.
[[nodiscard]] std::string serialize_response(const Response& response, bool keep_alive,
                                             bool head_request = false);

/// Status codes whose responses never carry a body
[[nodiscard]] bool status_forbids_body(uint16_t status) noexcept;

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert Version to string
[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Convert status code to reason phrase (empty phrase becomes "Unknown")
[[nodiscard]] std::string_view to_reason_phrase(uint16_t code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Header name is a non-empty RFC 7230 token
[[nodiscard]] bool is_valid_header_name(std::string_view name) noexcept;

/// Header value holds no CR, LF or NUL
[[nodiscard]] bool is_valid_header_value(std::string_view value) noexcept;

}  // namespace lamina::http
