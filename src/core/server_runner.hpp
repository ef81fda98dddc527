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

// Lamina Server Runner - Header
// Foreground server loop used by the CLI

#pragma once

#include "server.hpp"
#include "../control/config.hpp"

#include <atomic>
#include <system_error>

namespace lamina::core {

/// Server currently inside run_server (nullptr otherwise)
extern std::atomic<Server*> g_active_server;

/// Start the gateway, print its address and serve until request_shutdown().
/// The server is closed (listeners, connections, workers) before returning.
[[nodiscard]] std::error_code run_server(const control::Config& config);

/// Ask the running server to stop (async-signal-safe)
void request_shutdown() noexcept;

} // namespace lamina::core
