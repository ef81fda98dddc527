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

// Lamina Log Sinks - Header
// Destinations for worker output and Lambda-style lifecycle lines

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace lamina::runtime {

/// Text destination (called on the event loop thread only)
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write text as-is (callers supply the trailing newline)
    virtual void write(std::string_view text) = 0;
};

/// Writes to a file descriptor it does not own (stdout, stderr, a log file)
class FdLogSink : public LogSink {
public:
    explicit FdLogSink(int fd) noexcept : fd_(fd) {}

    void write(std::string_view text) override;

    [[nodiscard]] int fd() const noexcept { return fd_; }

private:
    int fd_;
};

/// Discards everything (used for silent gateways)
class NullLogSink : public LogSink {
public:
    void write(std::string_view text) override { (void)text; }
};

/// Process stdout sink shared by every function without its own sink
[[nodiscard]] std::shared_ptr<LogSink> default_stdout_sink();

/// Process stderr sink shared by every function without its own sink
[[nodiscard]] std::shared_ptr<LogSink> default_stderr_sink();

/// Shared discarding sink
[[nodiscard]] std::shared_ptr<LogSink> null_sink();

/// ISO-8601 UTC timestamp with milliseconds ("2025-01-31T12:00:00.000Z")
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point tp);

}  // namespace lamina::runtime
