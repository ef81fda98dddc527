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

// Lamina TLS - Implementation
// TLS/SSL utilities for the HTTPS listener (PEM material held in memory)

#include "tls.hpp"

#include <openssl/pem.h>
#include <openssl/x509.h>

namespace lamina::core {

// ============================
// Error Handling
// ============================

std::string TlsErrorCategory::message(int ev) const {
    char buf[256];
    ERR_error_string_n(static_cast<unsigned long>(ev), buf, sizeof(buf));
    return std::string(buf);
}

const TlsErrorCategory& tls_category() noexcept {
    static TlsErrorCategory instance;
    return instance;
}

std::error_code make_tls_error() noexcept {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        // No error in queue - return generic TLS error
        return std::error_code(1, tls_category());
    }
    return std::error_code(static_cast<int>(err), tls_category());
}

// ============================
// PEM Loading
// ============================

static BioPtr make_memory_bio(std::string_view pem) noexcept {
    return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}

/// Load leaf certificate plus any chain certificates that follow it
static bool load_certificate_chain(SSL_CTX* ctx, std::string_view cert_pem) noexcept {
    BioPtr bio = make_memory_bio(cert_pem);
    if (!bio) {
        return false;
    }

    X509* leaf = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
    if (!leaf) {
        return false;
    }

    int ok = SSL_CTX_use_certificate(ctx, leaf);
    X509_free(leaf);  // SSL_CTX_use_certificate takes its own reference
    if (ok <= 0) {
        return false;
    }

    // Remaining certificates form the chain (ownership passes to the context)
    while (X509* extra = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
        if (SSL_CTX_add_extra_chain_cert(ctx, extra) <= 0) {
            X509_free(extra);
            return false;
        }
    }

    // Reading past the last certificate leaves a PEM "no start line" error
    ERR_clear_error();
    return true;
}

static bool load_private_key(SSL_CTX* ctx, std::string_view key_pem) noexcept {
    BioPtr bio = make_memory_bio(key_pem);
    if (!bio) {
        return false;
    }

    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!key) {
        return false;
    }

    int ok = SSL_CTX_use_PrivateKey(ctx, key);
    EVP_PKEY_free(key);
    return ok > 0;
}

// ============================
// TLS Context
// ============================

std::optional<TlsContext> TlsContext::create(std::string_view cert_pem, std::string_view key_pem,
                                             std::error_code& error_out) {
    ERR_clear_error();

    // Create SSL context (TLS 1.2+)
    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    // Set minimum TLS version (TLS 1.2)
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);

    // Load certificate
    if (!load_certificate_chain(ctx.get(), cert_pem)) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    // Load private key
    if (!load_private_key(ctx.get(), key_pem)) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    // Verify private key matches certificate
    if (!SSL_CTX_check_private_key(ctx.get())) {
        error_out = make_tls_error();
        return std::nullopt;
    }

    // Enable session resumption for better performance
    SSL_CTX_set_session_cache_mode(ctx.get(), SSL_SESS_CACHE_SERVER);

    return TlsContext(std::move(ctx));
}

SslPtr TlsContext::create_ssl(int sockfd) const {
    SslPtr ssl(SSL_new(ctx_.get()));
    if (!ssl) {
        return nullptr;
    }

    // Attach socket to SSL object
    SSL_set_fd(ssl.get(), sockfd);

    // Set server mode
    SSL_set_accept_state(ssl.get());

    // Responses are queued in a growing buffer and written as far as possible
    SSL_set_mode(ssl.get(), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    return ssl;
}

// ============================
// TLS Operations
// ============================

TlsHandshakeResult ssl_accept_nonblocking(SSL* ssl) noexcept {
    ERR_clear_error();  // Clear error queue before operation

    int result = SSL_accept(ssl);

    if (result == 1) {
        // Handshake completed successfully
        return TlsHandshakeResult::Complete;
    }

    int err = SSL_get_error(ssl, result);

    switch (err) {
        case SSL_ERROR_WANT_READ:
            return TlsHandshakeResult::WantRead;

        case SSL_ERROR_WANT_WRITE:
            return TlsHandshakeResult::WantWrite;

        default:
            // Fatal error
            return TlsHandshakeResult::Error;
    }
}

int ssl_read_nonblocking(SSL* ssl, std::span<uint8_t> buffer) noexcept {
    ERR_clear_error();
    return SSL_read(ssl, buffer.data(), static_cast<int>(buffer.size()));
}

int ssl_write_nonblocking(SSL* ssl, std::span<const uint8_t> data) noexcept {
    ERR_clear_error();
    return SSL_write(ssl, data.data(), static_cast<int>(data.size()));
}

// ============================
// OpenSSL Initialization
// ============================

void initialize_openssl() noexcept {
    // OpenSSL 1.1.0+ auto-initializes, but we call this for compatibility
    OPENSSL_init_ssl(0, nullptr);
}

}  // namespace lamina::core
