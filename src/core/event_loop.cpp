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

// Lamina Event Loop - Implementation

#include "event_loop.hpp"

#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>

#include "socket.hpp"

namespace lamina::core {

namespace {
constexpr int MAX_EVENTS = 256;

// epoll user data: generation in the high half, fd in the low half
constexpr uint64_t pack(int fd, uint32_t generation) noexcept {
    return (static_cast<uint64_t>(generation) << 32) | static_cast<uint32_t>(fd);
}
}  // anonymous namespace

EventLoop::~EventLoop() {
    close_fd(wake_fd_);
    close_fd(epoll_fd_);
}

std::error_code EventLoop::open() {
    if (epoll_fd_ >= 0) {
        return {};
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        return std::error_code(errno, std::system_category());
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::error_code ec(errno, std::system_category());
        close_fd(epoll_fd_);
        epoll_fd_ = -1;
        return ec;
    }

    // Generation 0 is reserved for the wake-up descriptor
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.u64 = pack(wake_fd_, 0);
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        std::error_code ec(errno, std::system_category());
        close_fd(wake_fd_);
        close_fd(epoll_fd_);
        wake_fd_ = -1;
        epoll_fd_ = -1;
        return ec;
    }

    return {};
}

std::error_code EventLoop::add(int fd, uint32_t events, IoHandler handler) {
    if (epoll_fd_ < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    if (handlers_.contains(fd)) {
        return std::make_error_code(std::errc::file_exists);
    }

    uint32_t generation = next_generation_++;
    if (next_generation_ == 0) {
        next_generation_ = 1;
    }

    epoll_event ev{};
    ev.events = events;
    ev.data.u64 = pack(fd, generation);
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        return std::error_code(errno, std::system_category());
    }

    handlers_[fd] = Registration{generation, std::make_shared<IoHandler>(std::move(handler))};
    return {};
}

std::error_code EventLoop::modify(int fd, uint32_t events) {
    auto it = handlers_.find(fd);
    if (it == handlers_.end()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    epoll_event ev{};
    ev.events = events;
    ev.data.u64 = pack(fd, it->second.generation);
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

void EventLoop::remove(int fd) noexcept {
    auto it = handlers_.find(fd);
    if (it == handlers_.end()) {
        return;
    }
    // Failure means fd was already closed, which also drops it from the set
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    handlers_.erase(it);
}

void EventLoop::add_poller(Poller poller) {
    pollers_.push_back(std::move(poller));
    wake();
}

std::error_code EventLoop::run_once(int timeout_ms) {
    if (epoll_fd_ < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    if (!pollers_.empty() && (timeout_ms < 0 || timeout_ms > kPollIntervalMs)) {
        timeout_ms = kPollIntervalMs;
    }

    epoll_event events[MAX_EVENTS];
    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            run_pollers();
            return {};
        }
        return std::error_code(errno, std::system_category());
    }

    for (int i = 0; i < n; ++i) {
        int fd = static_cast<int>(events[i].data.u64 & 0xFFFFFFFFu);
        uint32_t generation = static_cast<uint32_t>(events[i].data.u64 >> 32);

        if (generation == 0 && fd == wake_fd_) {
            drain_wake_fd();
            continue;
        }

        auto it = handlers_.find(fd);
        if (it == handlers_.end() || it->second.generation != generation) {
            continue;  // Removed (or replaced) by an earlier handler in this batch
        }

        // Keep the handler alive even if it removes itself
        std::shared_ptr<IoHandler> handler = it->second.handler;
        (*handler)(events[i].events);
    }

    run_pollers();
    return {};
}

std::error_code EventLoop::run() {
    running_ = true;
    std::error_code result;

    while (!stop_requested_.load()) {
        try {
            result = run_once(-1);
        } catch (...) {
            running_ = false;
            stop_requested_ = false;
            throw;
        }
        if (result) {
            break;
        }
    }

    stop_requested_ = false;
    running_ = false;
    return result;
}

void EventLoop::stop() noexcept {
    stop_requested_ = true;
    wake();
}

void EventLoop::wake() noexcept {
    if (wake_fd_ < 0) {
        return;
    }
    uint64_t one = 1;
    // EAGAIN means the counter is already non-zero, which is enough
    [[maybe_unused]] ssize_t n = write(wake_fd_, &one, sizeof(one));
}

void EventLoop::drain_wake_fd() noexcept {
    uint64_t value = 0;
    while (read(wake_fd_, &value, sizeof(value)) > 0) {
    }
}

void EventLoop::run_pollers() {
    if (pollers_.empty()) {
        return;
    }

    // Pollers may register new pollers, so run a snapshot
    std::vector<Poller> current;
    current.swap(pollers_);

    std::vector<Poller> remaining;
    for (size_t i = 0; i < current.size(); ++i) {
        bool done = false;
        try {
            done = current[i]();
        } catch (...) {
            // Keep the untried pollers before propagating
            for (size_t j = i + 1; j < current.size(); ++j) {
                remaining.push_back(std::move(current[j]));
            }
            for (auto& p : pollers_) {
                remaining.push_back(std::move(p));
            }
            pollers_.swap(remaining);
            throw;
        }
        if (!done) {
            remaining.push_back(std::move(current[i]));
        }
    }

    for (auto& p : pollers_) {
        remaining.push_back(std::move(p));
    }
    pollers_.swap(remaining);
}

}  // namespace lamina::core
