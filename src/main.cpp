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

// Lamina Gateway - Main Entry Point
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server_runner.hpp"
#include "core/tls.hpp"

extern "C" void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        lamina::core::request_shutdown();
    }
}

int main(int argc, char* argv[]) {
    printf("Lamina local API gateway v0.1.0\n\n");

    // Initialize OpenSSL
    lamina::core::initialize_openssl();

    if (argc < 3 || std::string(argv[1]) != "--config") {
        fprintf(stderr, "Usage: %s --config <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    printf("Loading configuration from %s...\n", config_path.c_str());

    // Parse errors and validation errors are printed by the loader
    auto config = lamina::control::ConfigLoader::load_from_file(config_path);
    if (!config) {
        fprintf(stderr, "Failed to load configuration\n");
        return EXIT_FAILURE;
    }

    lamina::logging::init_logging_system();
    lamina::logging::init_gateway_logger(config->logging);

    // Client disconnects surface as write errors, not signals
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal

    std::error_code ec;
    try {
        ec = lamina::core::run_server(*config);
    } catch (const std::exception& e) {
        fprintf(stderr, "Server error: %s\n", e.what());
        lamina::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    if (ec) {
        fprintf(stderr, "Server error: %s\n", ec.message().c_str());
        lamina::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    printf("Lamina stopped.\n");
    lamina::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
