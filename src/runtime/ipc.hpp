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

// Lamina IPC Protocol - Header
// Event/result messages exchanged with a worker over its IPC channel

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lamina::runtime {

/// Descriptor number of the IPC channel inside the worker
constexpr int kIpcChannelFd = 3;

/// Result object returned by a function
struct InvocationResult {
    int status_code = 200;
    std::vector<std::pair<std::string, std::string>> headers;  // Values rendered as text
    std::optional<std::vector<std::pair<std::string, std::vector<std::string>>>>
        multi_value_headers;
    std::string body;
    bool is_base64_encoded = false;
};

/// Why an invocation produced no result
enum class InvocationErrorKind : uint8_t {
    WorkerCrash,        // Process exited before sending a result
    WorkerSpawnError,   // Process or channel could not be set up
    ProtocolViolation,  // Worker sent a malformed message
};

/// Invocation failure delivered to the dispatcher
struct InvocationError {
    InvocationErrorKind kind = InvocationErrorKind::WorkerCrash;
    std::string message;
    std::vector<std::string> stack_lines;
};

/// Terminal outcome of one invocation: exactly one of result / error is set
struct InvocationOutcome {
    std::optional<InvocationResult> result;
    std::optional<InvocationError> error;

    [[nodiscard]] bool ok() const noexcept { return result.has_value(); }

    [[nodiscard]] static InvocationOutcome success(InvocationResult value) {
        InvocationOutcome outcome;
        outcome.result = std::move(value);
        return outcome;
    }

    [[nodiscard]] static InvocationOutcome failure(InvocationErrorKind kind, std::string message,
                                                   std::vector<std::string> stack_lines = {}) {
        InvocationOutcome outcome;
        outcome.error = InvocationError{kind, std::move(message), std::move(stack_lines)};
        return outcome;
    }
};

/// Decoded result message
struct ResultMessage {
    std::string id;
    InvocationResult result;
    std::optional<double> memory_used_bytes;
};

/// Encode {"type":"event","id":...,"eventObject":...} followed by '\n'.
/// Invalid UTF-8 in the event is replaced with U+FFFD.
[[nodiscard]] std::string encode_event_message(std::string_view id, const nlohmann::json& event);

/// Decode and validate one result message line.
/// @param line One framed message (without the trailing newline)
/// @param expected_id Correlation id the worker was invoked with
/// @param error_out Description of the violation on failure
/// @return Decoded message or nullopt on any protocol violation
[[nodiscard]] std::optional<ResultMessage> decode_result_message(std::string_view line,
                                                                 std::string_view expected_id,
                                                                 std::string& error_out);

/// Validate a result object against the result shape
/// (statusCode number, headers object, optional multiValueHeaders object,
/// body string, isBase64Encoded boolean)
[[nodiscard]] std::optional<InvocationResult> parse_invocation_result(const nlohmann::json& value,
                                                                      std::string& error_out);

/// Result object back to JSON (field names as on the wire)
[[nodiscard]] nlohmann::json to_json(const InvocationResult& result);

/// Newline framing for byte streams (IPC channel, worker stdout/stderr)
class LineBuffer {
public:
    /// Append raw bytes
    void append(std::string_view data) { buffer_.append(data); }

    /// Pop the next complete line (without '\n'), nullopt if none is complete
    [[nodiscard]] std::optional<std::string> next_line();

    /// Pop whatever is left (an unterminated last line), nullopt if empty
    [[nodiscard]] std::optional<std::string> take_rest();

    [[nodiscard]] bool empty() const noexcept { return cursor_ >= buffer_.size(); }

private:
    std::string buffer_;
    size_t cursor_ = 0;
};

/// Split text on '\n' keeping empty fields ("a\nb\n" -> {"a", "b", ""})
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

}  // namespace lamina::runtime
