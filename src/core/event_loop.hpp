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

// Lamina Event Loop - Header
// Single-threaded epoll reactor shared by listeners, clients and workers

#pragma once

#include <sys/epoll.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <system_error>
#include <vector>

#include "containers.hpp"

namespace lamina::core {

/// Called with the epoll event mask (EPOLLIN, EPOLLOUT, EPOLLERR, ...)
using IoHandler = std::function<void(uint32_t events)>;

/// Called after every wait; returns true when it is done and can be dropped
using Poller = std::function<bool()>;

/// epoll based reactor
///
/// Handlers run on the thread calling run()/run_once(). A handler may add or
/// remove registrations (including its own); events already fetched for a
/// removed descriptor are discarded, even if the number is reused.
/// Exceptions thrown by handlers propagate out of run_once().
class EventLoop {
public:
    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Create the epoll instance and the wake-up eventfd (idempotent)
    [[nodiscard]] std::error_code open();

    [[nodiscard]] bool is_open() const noexcept { return epoll_fd_ >= 0; }

    /// Register descriptor; the loop does not take ownership of fd
    [[nodiscard]] std::error_code add(int fd, uint32_t events, IoHandler handler);

    /// Change the interest set of a registered descriptor
    [[nodiscard]] std::error_code modify(int fd, uint32_t events);

    /// Deregister descriptor (no-op if unknown). Call before closing fd.
    void remove(int fd) noexcept;

    [[nodiscard]] bool contains(int fd) const noexcept { return handlers_.contains(fd); }

    /// Run poller after every wait until it returns true.
    /// While pollers are registered the loop wakes at least every kPollIntervalMs.
    void add_poller(Poller poller);

    /// Wait up to timeout_ms (-1 = until an event) and dispatch ready handlers
    [[nodiscard]] std::error_code run_once(int timeout_ms);

    /// Dispatch until stop() is called
    [[nodiscard]] std::error_code run();

    /// Ask run() to return (thread-safe, callable from signal-free contexts)
    void stop() noexcept;

    /// Interrupt a blocking wait (thread-safe)
    void wake() noexcept;

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    [[nodiscard]] size_t handler_count() const noexcept { return handlers_.size(); }

    static constexpr int kPollIntervalMs = 5;

private:
    struct Registration {
        uint32_t generation = 0;
        std::shared_ptr<IoHandler> handler;
    };

    void drain_wake_fd() noexcept;
    void run_pollers();

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    uint32_t next_generation_ = 1;

    fast_map<int, Registration> handlers_;
    std::vector<Poller> pollers_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
};

}  // namespace lamina::core
