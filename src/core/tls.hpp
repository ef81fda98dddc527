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


// Lamina TLS - Header
// TLS/SSL utilities for the HTTPS listener (PEM material held in memory)

#pragma once

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace lamina::core {

/// TLS error category for std::error_code
class TlsErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "tls";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get TLS error category instance
[[nodiscard]] const TlsErrorCategory& tls_category() noexcept;

/// Create error_code from current OpenSSL error queue
[[nodiscard]] std::error_code make_tls_error() noexcept;

/// SSL_CTX deleter for std::unique_ptr
struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const noexcept {
        if (ctx) {
            SSL_CTX_free(ctx);
        }
    }
};

/// SSL deleter for std::unique_ptr
struct SslDeleter {
    void operator()(SSL* ssl) const noexcept {
        if (ssl) {
            SSL_free(ssl);
        }
    }
};

/// BIO deleter for std::unique_ptr
struct BioDeleter {
    void operator()(BIO* bio) const noexcept {
        if (bio) {
            BIO_free(bio);
        }
    }
};

/// Unique pointer types for SSL objects
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

/// TLS configuration and context management
class TlsContext {
public:
    /// Create TLS context from in-memory PEM text
    /// @param cert_pem Certificate, optionally followed by its chain (PEM format)
    /// @param key_pem Private key (PEM format)
    /// @param error_out Output parameter for error code
    /// @return TlsContext or nullopt on error
    [[nodiscard]] static std::optional<TlsContext>
    create(std::string_view cert_pem,
           std::string_view key_pem,
           std::error_code& error_out);

    /// Create server-side SSL connection object
    [[nodiscard]] SslPtr create_ssl(int sockfd) const;

    /// Get underlying SSL_CTX pointer (for advanced use)
    [[nodiscard]] SSL_CTX* native_handle() const noexcept {
        return ctx_.get();
    }

    // Movable but not copyable
    TlsContext(TlsContext&&) = default;
    TlsContext& operator=(TlsContext&&) = default;
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

private:
    explicit TlsContext(SslCtxPtr ctx)
        : ctx_(std::move(ctx)) {}

    SslCtxPtr ctx_;
};

/// TLS handshake result
enum class TlsHandshakeResult {
    Complete,     // Handshake completed successfully
    WantRead,     // Need more data from socket (call again after read)
    WantWrite,    // Need to write data to socket (call again after write)
    Error,        // Fatal error occurred
};

/// Perform TLS server handshake (non-blocking)
/// @param ssl SSL connection object
/// @return Handshake result
[[nodiscard]] TlsHandshakeResult ssl_accept_nonblocking(SSL* ssl) noexcept;

/// Read data from TLS connection (non-blocking)
/// @param ssl SSL connection object
/// @param buffer Buffer to read into
/// @return Bytes read, or negative on error (check SSL_get_error)
[[nodiscard]] int ssl_read_nonblocking(SSL* ssl, std::span<uint8_t> buffer) noexcept;

/// Write data to TLS connection (non-blocking)
/// @param ssl SSL connection object
/// @param data Data to write
/// @return Bytes written, or negative on error (check SSL_get_error)
[[nodiscard]] int ssl_write_nonblocking(SSL* ssl, std::span<const uint8_t> data) noexcept;

/// Initialize OpenSSL library (call once at startup)
void initialize_openssl() noexcept;

} // namespace lamina::core
