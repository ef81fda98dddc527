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

// Lamina Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// Forward declaration to avoid circular dependency
namespace lamina::runtime {
class LogSink;
}

namespace lamina::control {

/// Value produced by a request-context hook: ready now, or resolved later
using RequestContextValue = std::variant<nlohmann::json, std::future<nlohmann::json>>;

/// Hook called with the serialized event before dispatch.
/// The returned value becomes the event's requestContext.
using RequestContextHook = std::function<RequestContextValue(const nlohmann::json& event)>;

/// One function registration
struct FunctionConfig {
    std::string path;                  // Exact path or proxy pattern ("/api/{proxy+}")
    std::string entry;                 // Entry reference handed to the worker
    std::string handler = "handler";   // Exported handler name

    // In-process only: worker output destinations (nullptr = gateway default)
    std::shared_ptr<lamina::runtime::LogSink> stdout_sink;
    std::shared_ptr<lamina::runtime::LogSink> stderr_sink;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";            // debug, info, warning, error
    std::string format = "text";           // json, text
    std::string output = "/tmp/lamina";    // Log directory (gateway.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Lamina configuration
struct Config {
    // Network settings
    uint16_t port = 0;  // 0 = ephemeral
    std::string listen_address = "127.0.0.1";
    uint32_t backlog = 128;

    // TLS listener, enabled only when port, key and certificate are all set
    std::optional<uint16_t> https_port;
    std::string https_key;   // PEM text
    std::string https_cert;  // PEM text

    // Worker settings
    std::map<std::string, std::string> env;  // Complete worker environment
    std::string bin = "node";                // Worker executable (PATH lookup)
    std::string tmp = "/tmp";                // Directory of the bootstrap artifact
    bool docker = false;                     // Reserved execution mode, not used

    // Routes: path -> entry (handler "handler") in file order; takes precedence over functions
    std::vector<std::pair<std::string, std::string>> routes;
    std::vector<FunctionConfig> functions;

    bool enable_cors = false;
    bool silent = false;

    LogConfig logging;

    // In-process only
    RequestContextHook populate_request_context;
    std::optional<std::string> bootstrap_source;  // Replaces the built-in worker script

    [[nodiscard]] bool https_enabled() const noexcept {
        return https_port.has_value() && !https_key.empty() && !https_cert.empty();
    }
};

// All config types use custom from_json/to_json (no macros - avoids conflicts).
// ordered_json keeps object keys in file order, which is route registration order.

inline void from_json(const nlohmann::ordered_json& j, FunctionConfig& f) {
    j.at("path").get_to(f.path);    // path is required
    j.at("entry").get_to(f.entry);  // entry is required
    f.handler = j.value("handler", std::string("handler"));
}

inline void to_json(nlohmann::ordered_json& j, const FunctionConfig& f) {
    j = nlohmann::ordered_json{{"path", f.path}, {"entry", f.entry}, {"handler", f.handler}};
}

inline void from_json(const nlohmann::ordered_json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::ordered_json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("/tmp/lamina"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::ordered_json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::ordered_json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::ordered_json& j, const LogConfig& l) {
    j = nlohmann::ordered_json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::ordered_json& j, Config& c) {
    c.port = j.value("port", uint16_t(0));
    c.listen_address = j.value("listen_address", std::string("127.0.0.1"));
    c.backlog = j.value("backlog", 128u);

    if (j.contains("https_port") && !j.at("https_port").is_null()) {
        c.https_port = j.at("https_port").get<uint16_t>();
    }
    c.https_key = j.value("https_key", std::string());
    c.https_cert = j.value("https_cert", std::string());

    // Use contains() + get() for containers and nested structs
    if (j.contains("env")) {
        j.at("env").get_to(c.env);
    }
    c.bin = j.value("bin", std::string("node"));
    c.tmp = j.value("tmp", std::string("/tmp"));
    c.docker = j.value("docker", false);

    if (j.contains("routes")) {
        auto routes = j.at("routes").get<nlohmann::ordered_json::object_t>();
        for (const auto& [path, entry] : routes) {
            c.routes.emplace_back(path, entry.get<std::string>());
        }
    }
    if (j.contains("functions")) {
        j.at("functions").get_to(c.functions);
    }

    c.enable_cors = j.value("enable_cors", false);
    c.silent = j.value("silent", false);

    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
}

inline void to_json(nlohmann::ordered_json& j, const Config& c) {
    j["port"] = c.port;
    j["listen_address"] = c.listen_address;
    j["backlog"] = c.backlog;
    j["https_port"] =
        c.https_port.has_value() ? nlohmann::ordered_json(*c.https_port) : nlohmann::ordered_json();
    j["https_key"] = c.https_key;
    j["https_cert"] = c.https_cert;
    j["env"] = c.env;
    j["bin"] = c.bin;
    j["tmp"] = c.tmp;
    j["docker"] = c.docker;
    auto routes = nlohmann::ordered_json::object();
    for (const auto& [path, entry] : c.routes) {
        routes[path] = entry;
    }
    j["routes"] = std::move(routes);
    j["functions"] = c.functions;
    j["enable_cors"] = c.enable_cors;
    j["silent"] = c.silent;
    j["logging"] = c.logging;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Function registrations in registration order.
/// Non-empty routes win (handler "handler" for every entry, file order),
/// otherwise the function list is copied.
[[nodiscard]] std::vector<FunctionConfig> registered_functions(const Config& config);

}  // namespace lamina::control
