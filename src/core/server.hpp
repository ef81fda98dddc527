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

// Lamina Server - Header
// HTTP/HTTPS front end: connections, security pipeline and dispatch

#pragma once

#include <openssl/ssl.h>
#include <quill/Logger.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../control/config.hpp"
#include "../gateway/dispatcher.hpp"
#include "../gateway/event.hpp"
#include "../gateway/pipeline.hpp"
#include "../http/parser.hpp"
#include "containers.hpp"
#include "event_loop.hpp"
#include "tls.hpp"

namespace lamina::core {

/// Active client connection
struct Connection {
    int fd = -1;
    uint64_t serial = 0;  // Distinguishes reuses of the same descriptor number

    // TLS state
    SslPtr ssl;
    bool tls_enabled = false;
    bool tls_handshake_complete = false;
    bool tls_want_write = false;

    std::vector<uint8_t> recv_buffer;
    size_t recv_cursor = 0;  // Current read position in recv_buffer (avoids expensive erase)

    // HTTP/1.1 state
    http::Parser parser;
    http::Request request;
    http::Response response;
    bool keep_alive = true;
    bool head_request = false;  // Current response goes out without a body

    bool busy = false;               // A request is being served (one at a time)
    bool peer_closed = false;        // Client finished sending
    bool close_after_write = false;  // Close once out_buffer is flushed

    std::string out_buffer;  // Serialized responses not yet written
    size_t out_cursor = 0;
};

/// HTTP server managing listeners, connections and request processing
///
/// Everything runs on the thread that calls run()/run_once(); only stop()
/// may be called from elsewhere.
class Server {
public:
    /// Build router, pipeline and supervisors; write the worker bootstrap.
    /// Throws std::runtime_error if TLS material or the bootstrap is unusable.
    explicit Server(control::Config config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Start server (bind and listen on the HTTP and, if configured, HTTPS port)
    [[nodiscard]] std::error_code start();

    /// "localhost:<bound HTTP port>"
    [[nodiscard]] std::string host_port() const;

    /// Bound HTTP port (0 before start)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// Bound HTTPS port, if the TLS listener is open
    [[nodiscard]] std::optional<uint16_t> https_port() const noexcept { return https_port_; }

    /// Close both listeners and reopen them on port (HTTPS keeps its configured port)
    [[nodiscard]] std::error_code change_port(uint16_t port);

    /// Close listeners and connections, kill every worker. Call with the loop stopped.
    void close();

    /// Serve until stop()
    [[nodiscard]] std::error_code run();

    /// Serve one batch of events
    [[nodiscard]] std::error_code run_once(int timeout_ms);

    /// Ask run() to return (thread-safe)
    void stop() noexcept { loop_.stop(); }

    [[nodiscard]] EventLoop& loop() noexcept { return loop_; }
    [[nodiscard]] gateway::Dispatcher& dispatcher() noexcept { return *dispatcher_; }
    [[nodiscard]] const control::Config& config() const noexcept { return config_; }
    [[nodiscard]] const std::string& bootstrap_path() const noexcept { return bootstrap_path_; }
    [[nodiscard]] size_t connection_count() const noexcept { return connections_.size(); }

    /// Set logger for this server and its supervisors
    void set_logger(quill::Logger* logger) noexcept;

private:
    [[nodiscard]] std::error_code open_listeners(uint16_t port);
    void close_listeners();

    void handle_accept(int listen_fd, bool tls);
    void handle_event(int fd, uint64_t serial, uint32_t events);
    void handle_read(Connection& conn);
    void handle_close(int fd);

    /// Drive the TLS handshake, false if the connection was closed
    bool continue_handshake(Connection& conn);

    /// Parse and serve buffered requests while the connection is idle
    void process_buffered(int fd, uint64_t serial);

    void process_request(Connection& conn, http::Request request);
    void populate_context(Connection& conn, gateway::Event event);
    void dispatch_request(int fd, uint64_t serial, gateway::Event event);
    void complete_request(int fd, uint64_t serial, const runtime::InvocationOutcome& outcome);
    void fail_request(int fd, uint64_t serial, std::string_view message);

    /// Queue the current response, false if the connection was closed
    bool send_response(Connection& conn);

    /// Write queued output, false if the connection was closed
    bool flush_output(Connection& conn);
    void update_interest(Connection& conn);

    [[nodiscard]] Connection* find_connection(int fd, uint64_t serial) noexcept;

    control::Config config_;
    EventLoop loop_;

    int listen_fd_ = -1;
    int https_listen_fd_ = -1;
    uint16_t port_ = 0;
    std::optional<uint16_t> https_port_;
    bool started_ = false;
    bool closed_ = false;

    std::string bootstrap_path_;
    std::unique_ptr<gateway::Pipeline> pipeline_;
    std::unique_ptr<gateway::Dispatcher> dispatcher_;

    quill::Logger* logger_ = nullptr;

    // TLS support
    std::optional<TlsContext> tls_context_;

    uint64_t next_connection_serial_ = 1;
    fast_map<int, std::unique_ptr<Connection>> connections_;
};

}  // namespace lamina::core
