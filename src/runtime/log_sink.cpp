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

// Lamina Log Sinks - Implementation

#include "log_sink.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <cerrno>
#include <ctime>

namespace lamina::runtime {

void FdLogSink::write(std::string_view text) {
    const char* data = text.data();
    size_t remaining = text.size();

    while (remaining > 0) {
        ssize_t n = ::write(fd_, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            // Destination gone (closed pipe, full disk): log output is best effort
            return;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
}

std::shared_ptr<LogSink> default_stdout_sink() {
    static const std::shared_ptr<LogSink> sink = std::make_shared<FdLogSink>(STDOUT_FILENO);
    return sink;
}

std::shared_ptr<LogSink> default_stderr_sink() {
    static const std::shared_ptr<LogSink> sink = std::make_shared<FdLogSink>(STDERR_FILENO);
    return sink;
}

std::shared_ptr<LogSink> null_sink() {
    static const std::shared_ptr<LogSink> sink = std::make_shared<NullLogSink>();
    return sink;
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto since_epoch = tp.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds);
    if (millis.count() < 0) {
        seconds -= std::chrono::seconds(1);
        millis += std::chrono::seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&t, &utc);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", utc.tm_year + 1900,
                       utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                       millis.count());
}

}  // namespace lamina::runtime
