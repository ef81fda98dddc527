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

// Lamina Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace lamina::control {

// Forward declaration for helper function
static void validate_function(const FunctionConfig& function, const std::string& context,
                              ValidationResult& result);

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    // Read file contents
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::ordered_json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Parse error - log detailed error message
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    // Validate configuration
    auto validation = validate(config);

    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "Configuration warning: %s\n", warning.c_str());
    }

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    if (config.listen_address.empty()) {
        result.add_error("listen_address cannot be empty");
    }

    if (config.backlog == 0) {
        result.add_error("backlog must be > 0");
    }

    // TLS listener needs all three settings
    bool any_tls = config.https_port.has_value() || !config.https_key.empty() ||
                   !config.https_cert.empty();
    if (any_tls && !config.https_enabled()) {
        result.add_warning(
            "https_port, https_key and https_cert must all be set; TLS listener disabled");
    }

    if (config.https_enabled() && config.https_port == config.port && config.port != 0) {
        result.add_error("https_port must differ from port");
    }

    if (config.bin.empty()) {
        result.add_error("bin cannot be empty");
    }

    if (config.tmp.empty()) {
        result.add_error("tmp cannot be empty");
    }

    if (config.docker) {
        result.add_warning("docker execution mode is not supported, workers run as local processes");
    }

    // Validate function registrations
    if (!config.routes.empty() && !config.functions.empty()) {
        result.add_warning("Both routes and functions configured; functions are ignored");
    }

    auto functions = registered_functions(config);
    if (functions.empty()) {
        result.add_warning("No functions configured (every request will be rejected)");
    }

    for (const auto& function : functions) {
        validate_function(function, "function '" + function.path + "'", result);
    }

    for (const auto& [name, value] : config.env) {
        if (name.empty() || name.find('=') != std::string::npos) {
            result.add_error("Invalid environment variable name '" + name + "'");
        }
    }

    // Validate logging level
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    // Validate logging format
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    if (config.logging.output.empty()) {
        result.add_error("logging output directory cannot be empty");
    }

    return result;
}

static void validate_function(const FunctionConfig& function, const std::string& context,
                              ValidationResult& result) {
    if (function.path.empty()) {
        result.add_error("Function path cannot be empty");
        return;
    }

    if (function.path.front() != '/') {
        result.add_error(context + " path must start with '/'");
    }

    // Proxy patterns need a '{' to delimit the literal prefix
    if (function.path.ends_with("+}") && function.path.rfind('{') == std::string::npos) {
        result.add_error(context + " has a malformed proxy pattern");
    }

    if (function.entry.empty()) {
        result.add_error(context + " has no entry");
    }

    if (function.handler.empty()) {
        result.add_error(context + " has no handler");
    }
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::ordered_json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

std::vector<FunctionConfig> registered_functions(const Config& config) {
    std::vector<FunctionConfig> functions;

    if (!config.routes.empty()) {
        functions.reserve(config.routes.size());
        for (const auto& [path, entry] : config.routes) {
            FunctionConfig function;
            function.path = path;
            function.entry = entry;
            functions.push_back(std::move(function));
        }
        return functions;
    }

    return config.functions;
}

}  // namespace lamina::control
