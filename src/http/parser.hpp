// Lamina HTTP Parser - Header
// Streaming request parser wrapping llhttp

#pragma once

#include "http.hpp"

#include <llhttp.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <span>
#include <string_view>
#include <utility>

namespace lamina::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,      // Request fully parsed
    Incomplete,    // Need more data
    Error          // Parse error
};

/// HTTP/1.1 request parser (wraps llhttp)
///
/// Data is fed incrementally; callbacks append into the owned Request, so a
/// token split across two reads is reassembled. Parsing pauses after each
/// complete message: bytes past the returned `consumed` belong to the next
/// pipelined request and must be fed again after reset().
class Parser {
public:
    Parser();
    ~Parser();

    // Non-copyable, movable
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;
    Parser(Parser&&) noexcept;
    Parser& operator=(Parser&&) noexcept;

    /// Feed bytes into the parser
    /// Returns ParseResult and number of bytes consumed
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(
        std::span<const uint8_t> data,
        Request& request);

    /// Reset parser state for next request (keep-alive)
    void reset();

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    /// Get last error code
    [[nodiscard]] llhttp_errno_t error_code() const noexcept;

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    void rebind() noexcept;

    // Parser state
    llhttp_t parser_;
    llhttp_settings_t settings_;

    // Parsing context (used by callbacks)
    struct Context {
        Request* request = nullptr;

        // Header assembly across chunk boundaries
        std::string current_header_field;
        bool last_was_field = false;
        bool message_complete = false;
        llhttp_errno_t error = HPE_OK;
    };

    Context ctx_;
};

/// Helper: Parse entire HTTP request (convenience wrapper)
/// Returns std::nullopt on error or incomplete input
[[nodiscard]] std::optional<Request> parse_http_request(std::span<const uint8_t> data);

/// Helper: parse from text
[[nodiscard]] std::optional<Request> parse_http_request(std::string_view data);

} // namespace lamina::http
