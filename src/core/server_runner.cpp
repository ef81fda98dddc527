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

// Lamina Server Runner - Implementation

#include "server_runner.hpp"

#include <cstdio>

#include "logging.hpp"

namespace lamina::core {

std::atomic<Server*> g_active_server{nullptr};

std::error_code run_server(const control::Config& config) {
    Server server(config);

    if (auto ec = server.start(); ec) {
        return ec;
    }

    printf("Lamina listening on http://%s\n", server.host_port().c_str());
    if (auto https = server.https_port()) {
        printf("Lamina listening on https://localhost:%u\n", static_cast<unsigned>(*https));
    }
    fflush(stdout);

    g_active_server.store(&server);
    std::error_code ec = server.run();
    g_active_server.store(nullptr);

    if (ec) {
        LOG_ERROR(logging::get_current_logger(), "Event loop failed: {}", ec.message());
    }

    server.close();
    return ec;
}

void request_shutdown() noexcept {
    if (Server* server = g_active_server.load()) {
        server->stop();
    }
}

} // namespace lamina::core
