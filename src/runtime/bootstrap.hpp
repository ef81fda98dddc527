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

// Lamina Worker Bootstrap - Header
// Entry script every worker process is started against

#pragma once

#include <string>
#include <string_view>
#include <system_error>

namespace lamina::runtime {

/// File name of the bootstrap artifact inside the tmp directory
constexpr std::string_view kBootstrapFileName = "worker.js";

/// Built-in Node.js bootstrap: loads argv[2], calls export argv[3] with the
/// event from the IPC channel and sends the result back
[[nodiscard]] std::string_view default_bootstrap_source() noexcept;

/// Write source to <dir>/worker.js.
/// A path already written with identical content by this process is not
/// rewritten; otherwise the file is replaced atomically (write + rename).
/// @return Absolute artifact path, empty with ec set on failure
[[nodiscard]] std::string materialize_bootstrap(std::string_view dir, std::string_view source,
                                                std::error_code& ec);

}  // namespace lamina::runtime
