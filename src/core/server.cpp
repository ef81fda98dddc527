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

// Lamina Server - Implementation

#include "server.hpp"

#include <fmt/format.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>

#include "../gateway/factory.hpp"
#include "../runtime/bootstrap.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace lamina::core {

namespace {
constexpr size_t kReadChunkSize = 8192;
constexpr size_t kInitialRecvBufferSize = 8192;

// Compact the receive buffer once this much has been consumed
constexpr size_t kCompactThreshold = 4096;
}  // anonymous namespace

Server::Server(control::Config config) : config_(std::move(config)) {
    logger_ = logging::ensure_gateway_logger(config_.logging);

    // Initialize TLS if enabled
    if (config_.https_enabled()) {
        std::error_code error;
        auto result = TlsContext::create(config_.https_cert, config_.https_key, error);

        if (result) {
            tls_context_ = std::move(*result);
        } else {
            throw std::runtime_error("Failed to initialize TLS context: " + error.message());
        }
    }

    std::error_code error;
    std::string_view source = config_.bootstrap_source
                                  ? std::string_view(*config_.bootstrap_source)
                                  : runtime::default_bootstrap_source();
    bootstrap_path_ = runtime::materialize_bootstrap(config_.tmp, source, error);
    if (error) {
        throw std::runtime_error("Failed to write worker bootstrap: " + error.message());
    }

    if (auto ec = loop_.open(); ec) {
        throw std::runtime_error("Failed to create event loop: " + ec.message());
    }

    runtime::RuntimeSettings settings;
    settings.bin = config_.bin;
    settings.bootstrap_path = bootstrap_path_;
    settings.env = config_.env;

    pipeline_ = gateway::build_pipeline(config_);
    dispatcher_ = std::make_unique<gateway::Dispatcher>(
        loop_, control::registered_functions(config_), settings, config_.silent);
    dispatcher_->set_logger(logger_);
}

Server::~Server() {
    close();
}

void Server::set_logger(quill::Logger* logger) noexcept {
    logger_ = logger;
    dispatcher_->set_logger(logger);
}

std::error_code Server::start() {
    if (started_) {
        return {};
    }

    if (auto ec = open_listeners(config_.port); ec) {
        return ec;
    }

    started_ = true;
    closed_ = false;
    LOG_INFO(logger_, "Gateway listening: address={}, port={}, https_port={}, functions={}",
             config_.listen_address, port_, https_port_ ? fmt::format("{}", *https_port_) : "-",
             dispatcher_->functions().size());
    return {};
}

std::string Server::host_port() const {
    return fmt::format("localhost:{}", port_);
}

std::error_code Server::change_port(uint16_t port) {
    close_listeners();
    config_.port = port;
    if (auto ec = open_listeners(port); ec) {
        return ec;
    }
    LOG_INFO(logger_, "Gateway rebound: port={}", port_);
    return {};
}

std::error_code Server::open_listeners(uint16_t port) {
    int fd = create_listening_socket(config_.listen_address, port,
                                     static_cast<int>(config_.backlog));
    if (fd < 0) {
        return std::error_code(errno, std::system_category());
    }
    if (auto ec = loop_.add(fd, EPOLLIN, [this, fd](uint32_t) { handle_accept(fd, false); });
        ec) {
        close_fd(fd);
        return ec;
    }
    listen_fd_ = fd;
    port_ = bound_port(fd);

    if (tls_context_) {
        int tls_fd = create_listening_socket(config_.listen_address, *config_.https_port,
                                             static_cast<int>(config_.backlog));
        if (tls_fd < 0) {
            std::error_code ec(errno, std::system_category());
            close_listeners();
            return ec;
        }
        if (auto ec = loop_.add(tls_fd, EPOLLIN,
                                [this, tls_fd](uint32_t) { handle_accept(tls_fd, true); });
            ec) {
            close_fd(tls_fd);
            close_listeners();
            return ec;
        }
        https_listen_fd_ = tls_fd;
        https_port_ = bound_port(tls_fd);
    }

    return {};
}

void Server::close_listeners() {
    for (int* fd : {&listen_fd_, &https_listen_fd_}) {
        if (*fd >= 0) {
            loop_.remove(*fd);
            close_fd(*fd);
            *fd = -1;
        }
    }
    port_ = 0;
    https_port_.reset();
}

void Server::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    started_ = false;

    close_listeners();

    std::vector<int> fds;
    fds.reserve(connections_.size());
    for (const auto& [fd, conn] : connections_) {
        fds.push_back(fd);
    }
    for (int fd : fds) {
        handle_close(fd);
    }

    size_t workers = dispatcher_->active_workers();
    dispatcher_->close_all();
    LOG_INFO(logger_, "Gateway closed: killed_workers={}", workers);
}

std::error_code Server::run() {
    return loop_.run();
}

std::error_code Server::run_once(int timeout_ms) {
    return loop_.run_once(timeout_ms);
}

Connection* Server::find_connection(int fd, uint64_t serial) noexcept {
    auto it = connections_.find(fd);
    if (it == connections_.end() || it->second->serial != serial) {
        return nullptr;
    }
    return it->second.get();
}

void Server::handle_accept(int listen_fd, bool tls) {
    while (true) {
        int client_fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARNING(logger_, "accept failed: {}",
                            std::error_code(errno, std::system_category()).message());
            }
            return;
        }

        auto conn = std::make_unique<Connection>();
        conn->fd = client_fd;
        conn->serial = next_connection_serial_++;
        conn->recv_buffer.reserve(kInitialRecvBufferSize);

        // Create SSL object on the TLS listener
        if (tls) {
            conn->ssl = tls_context_->create_ssl(client_fd);
            if (!conn->ssl) {
                LOG_WARNING(logger_, "Failed to create TLS session: fd={}", client_fd);
                close_fd(client_fd);
                continue;
            }
            conn->tls_enabled = true;
        }

        uint64_t serial = conn->serial;
        if (auto ec = loop_.add(client_fd, EPOLLIN,
                                [this, client_fd, serial](uint32_t events) {
                                    handle_event(client_fd, serial, events);
                                });
            ec) {
            LOG_WARNING(logger_, "Failed to watch connection: fd={}, error={}", client_fd,
                        ec.message());
            close_fd(client_fd);
            continue;
        }

        connections_[client_fd] = std::move(conn);
    }
}

void Server::handle_event(int fd, uint64_t serial, uint32_t events) {
    Connection* conn = find_connection(fd, serial);
    if (!conn) {
        return;
    }

    if (conn->tls_enabled && !conn->tls_handshake_complete) {
        if (continue_handshake(*conn) && conn->tls_handshake_complete) {
            // Application data may already be buffered by OpenSSL
            handle_read(*conn);
        }
        return;
    }

    if (events & EPOLLOUT) {
        if (!flush_output(*conn)) {
            return;
        }
    }

    if (events & EPOLLIN) {
        handle_read(*conn);
    } else if (events & (EPOLLERR | EPOLLHUP)) {
        handle_close(fd);
    }
}

bool Server::continue_handshake(Connection& conn) {
    auto result = ssl_accept_nonblocking(conn.ssl.get());

    switch (result) {
        case TlsHandshakeResult::Complete:
            conn.tls_handshake_complete = true;
            conn.tls_want_write = false;
            update_interest(conn);
            return true;
        case TlsHandshakeResult::WantRead:
            conn.tls_want_write = false;
            update_interest(conn);
            return true;
        case TlsHandshakeResult::WantWrite:
            conn.tls_want_write = true;
            update_interest(conn);
            return true;
        case TlsHandshakeResult::Error:
            break;
    }

    LOG_DEBUG(logger_, "TLS handshake failed: fd={}", conn.fd);
    handle_close(conn.fd);
    return false;
}

void Server::handle_read(Connection& conn) {
    int fd = conn.fd;
    uint64_t serial = conn.serial;

    uint8_t buffer[kReadChunkSize];
    bool eof = false;

    while (true) {
        ssize_t n;
        if (conn.tls_enabled) {
            n = ssl_read_nonblocking(conn.ssl.get(), buffer);
            if (n <= 0) {
                int err = SSL_get_error(conn.ssl.get(), static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                    break;
                }
                if (err == SSL_ERROR_ZERO_RETURN) {
                    eof = true;
                    break;
                }
                handle_close(fd);
                return;
            }
        } else {
            n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n == 0) {
                eof = true;
                break;
            }
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    break;
                }
                handle_close(fd);
                return;
            }
        }

        conn.recv_buffer.insert(conn.recv_buffer.end(), buffer, buffer + n);
    }

    if (eof) {
        // An in-flight request is still answered when possible
        conn.peer_closed = true;
        update_interest(conn);
    }

    process_buffered(fd, serial);
}

void Server::process_buffered(int fd, uint64_t serial) {
    while (true) {
        Connection* conn = find_connection(fd, serial);
        if (!conn) {
            return;
        }

        if (conn->busy) {
            return;
        }

        if (conn->close_after_write) {
            // Pipelined data after a closing response is ignored
            return;
        }

        auto remaining = std::span<const uint8_t>(conn->recv_buffer.data() + conn->recv_cursor,
                                                  conn->recv_buffer.size() - conn->recv_cursor);
        if (remaining.empty()) {
            if (conn->peer_closed && conn->out_cursor >= conn->out_buffer.size()) {
                handle_close(fd);
            }
            return;
        }

        auto [result, consumed] = conn->parser.parse_request(remaining, conn->request);

        if (result == http::ParseResult::Error) {
            LOG_DEBUG(logger_, "Malformed request: fd={}, error={}", fd,
                      conn->parser.error_message());
            handle_close(fd);
            return;
        }

        // Advance cursor (no expensive erase/memmove)
        conn->recv_cursor += consumed;
        if (conn->recv_cursor > kCompactThreshold &&
            conn->recv_cursor > conn->recv_buffer.size() / 2) {
            conn->recv_buffer.erase(conn->recv_buffer.begin(),
                                    conn->recv_buffer.begin() + conn->recv_cursor);
            conn->recv_cursor = 0;
        }

        if (result == http::ParseResult::Incomplete) {
            if (conn->peer_closed) {
                handle_close(fd);
            }
            return;
        }

        http::Request request = std::move(conn->request);
        conn->request = http::Request{};
        conn->parser.reset();

        process_request(*conn, std::move(request));
    }
}

void Server::process_request(Connection& conn, http::Request request) {
    conn.busy = true;
    conn.keep_alive = request.keep_alive();
    conn.head_request = request.method_name == "HEAD";
    conn.response = http::Response{};

    gateway::RequestContext ctx;
    ctx.request = &request;
    ctx.response = &conn.response;

    // Execute security middleware
    if (pipeline_->execute_request(ctx) == gateway::MiddlewareResult::Stop) {
        // Middleware answered the request (preflight, rejection)
        send_response(conn);
        return;
    }

    gateway::Event event = gateway::build_event(request);

    if (config_.populate_request_context) {
        populate_context(conn, std::move(event));
        return;
    }

    dispatch_request(conn.fd, conn.serial, std::move(event));
}

void Server::populate_context(Connection& conn, gateway::Event event) {
    int fd = conn.fd;
    uint64_t serial = conn.serial;

    control::RequestContextValue value;
    try {
        value = config_.populate_request_context(event.to_json());
    } catch (const std::exception& e) {
        fail_request(fd, serial, e.what());
        return;
    }

    if (auto* ready = std::get_if<nlohmann::json>(&value)) {
        event.request_context = std::move(*ready);
        dispatch_request(fd, serial, std::move(event));
        return;
    }

    auto future = std::make_shared<std::future<nlohmann::json>>(
        std::move(std::get<std::future<nlohmann::json>>(value)));
    if (!future->valid()) {
        fail_request(fd, serial, "request context hook returned an empty future");
        return;
    }

    // Dispatch resumes once the deferred value is ready
    auto pending = std::make_shared<gateway::Event>(std::move(event));
    loop_.add_poller([this, fd, serial, future, pending]() {
        if (closed_) {
            return true;
        }
        if (future->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }

        nlohmann::json context;
        try {
            context = future->get();
        } catch (const std::exception& e) {
            fail_request(fd, serial, e.what());
            return true;
        }

        pending->request_context = std::move(context);
        dispatch_request(fd, serial, std::move(*pending));
        return true;
    });
}

void Server::dispatch_request(int fd, uint64_t serial, gateway::Event event) {
    dispatcher_->dispatch(event, [this, fd, serial](runtime::InvocationOutcome outcome) {
        complete_request(fd, serial, outcome);
    });
}

void Server::complete_request(int fd, uint64_t serial, const runtime::InvocationOutcome& outcome) {
    Connection* conn = find_connection(fd, serial);
    if (!conn) {
        // Client went away while the function ran
        LOG_DEBUG(logger_, "Discarding result for closed connection: fd={}", fd);
        return;
    }

    gateway::apply_outcome(outcome, conn->response);
    if (send_response(*conn)) {
        process_buffered(fd, serial);
    }
}

void Server::fail_request(int fd, uint64_t serial, std::string_view message) {
    LOG_ERROR(logger_, "Request context hook failed: fd={}, error={}", fd, message);

    Connection* conn = find_connection(fd, serial);
    if (!conn) {
        return;
    }

    conn->response.set_status(http::StatusCode::InternalServerError);
    conn->response.body = nlohmann::json{{"message", message}}.dump(
        2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (send_response(*conn)) {
        process_buffered(fd, serial);
    }
}

bool Server::send_response(Connection& conn) {
    bool keep_alive = conn.keep_alive && !conn.peer_closed;
    conn.out_buffer += http::serialize_response(conn.response, keep_alive, conn.head_request);
    conn.response = http::Response{};
    conn.busy = false;
    if (!keep_alive) {
        conn.close_after_write = true;
    }
    return flush_output(conn);
}

bool Server::flush_output(Connection& conn) {
    int fd = conn.fd;

    while (conn.out_cursor < conn.out_buffer.size()) {
        auto data = std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(conn.out_buffer.data()) + conn.out_cursor,
            conn.out_buffer.size() - conn.out_cursor);

        ssize_t n;
        if (conn.tls_enabled) {
            n = ssl_write_nonblocking(conn.ssl.get(), data);
            if (n <= 0) {
                int err = SSL_get_error(conn.ssl.get(), static_cast<int>(n));
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
                    update_interest(conn);
                    return true;
                }
                handle_close(fd);
                return false;
            }
        } else {
            n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    update_interest(conn);
                    return true;
                }
                handle_close(fd);
                return false;
            }
        }

        conn.out_cursor += static_cast<size_t>(n);
    }

    conn.out_buffer.clear();
    conn.out_cursor = 0;

    if (conn.close_after_write || (conn.peer_closed && !conn.busy)) {
        handle_close(fd);
        return false;
    }

    update_interest(conn);
    return true;
}

void Server::update_interest(Connection& conn) {
    uint32_t events = 0;
    if (!conn.peer_closed) {
        events |= EPOLLIN;
    }
    if (conn.out_cursor < conn.out_buffer.size() || conn.tls_want_write) {
        events |= EPOLLOUT;
    }
    if (auto ec = loop_.modify(conn.fd, events); ec) {
        LOG_WARNING(logger_, "Failed to update connection interest: fd={}, error={}", conn.fd,
                    ec.message());
    }
}

void Server::handle_close(int fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }

    loop_.remove(fd);
    if (it->second->ssl && it->second->tls_handshake_complete) {
        (void)SSL_shutdown(it->second->ssl.get());
    }
    it->second->ssl.reset();
    close_fd(fd);
    connections_.erase(it);
}

}  // namespace lamina::core
