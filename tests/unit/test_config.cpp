// Lamina Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/control/config.hpp"

using namespace lamina::control;

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config;
    config.port = 3000;
    config.routes.emplace_back("/hello", "hello.js");

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());
    REQUIRE(json.find("\"port\": 3000") != std::string::npos);
    REQUIRE(json.find("\"/hello\": \"hello.js\"") != std::string::npos);
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "port": 3000,
        "bin": "/usr/bin/node",
        "tmp": "/var/tmp",
        "env": {"PATH": "/usr/bin", "HOME": "/home/dev"},
        "routes": {"/hello": "./hello.js", "/api/{proxy+}": "./api.js"},
        "enable_cors": true,
        "silent": true
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.port == 3000);
    REQUIRE(config.bin == "/usr/bin/node");
    REQUIRE(config.tmp == "/var/tmp");
    REQUIRE(config.env.size() == 2);
    REQUIRE(config.env.at("HOME") == "/home/dev");
    REQUIRE(config.routes.size() == 2);
    REQUIRE(config.enable_cors);
    REQUIRE(config.silent);
    REQUIRE_FALSE(config.https_enabled());
}

TEST_CASE("Config defaults", "[control][config]") {
    auto config = ConfigLoader::load_from_json("{}");
    REQUIRE(config.has_value());

    REQUIRE(config->port == 0);
    REQUIRE(config->listen_address == "127.0.0.1");
    REQUIRE(config->bin == "node");
    REQUIRE(config->tmp == "/tmp");
    REQUIRE_FALSE(config->docker);
    REQUIRE_FALSE(config->enable_cors);
    REQUIRE_FALSE(config->silent);
    REQUIRE(config->env.empty());
    REQUIRE(config->logging.level == "info");
}

TEST_CASE("Function list deserialization", "[control][config]") {
    const char* json = R"({
        "functions": [
            {"path": "/a", "entry": "a.js"},
            {"path": "/b/{proxy+}", "entry": "b.js", "handler": "main"}
        ]
    })";

    auto config = ConfigLoader::load_from_json(json);
    REQUIRE(config.has_value());
    REQUIRE(config->functions.size() == 2);
    REQUIRE(config->functions[0].handler == "handler");
    REQUIRE(config->functions[1].handler == "main");
}

TEST_CASE("Function entry is required", "[control][config]") {
    auto config = ConfigLoader::load_from_json(R"({"functions": [{"path": "/a"}]})");
    REQUIRE_FALSE(config.has_value());
}

TEST_CASE("Malformed JSON is rejected", "[control][config]") {
    REQUIRE_FALSE(ConfigLoader::load_from_json("{\"port\": ").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"port": "eighty"})").has_value());
}

TEST_CASE("Registered functions", "[control][config]") {
    Config config;

    SECTION("Routes in registration order with default handler") {
        config.routes.emplace_back("/zeta", "z.js");
        config.routes.emplace_back("/alpha", "a.js");

        auto functions = registered_functions(config);
        REQUIRE(functions.size() == 2);
        REQUIRE(functions[0].path == "/zeta");
        REQUIRE(functions[0].entry == "z.js");
        REQUIRE(functions[0].handler == "handler");
        REQUIRE(functions[1].path == "/alpha");
    }

    SECTION("Routes take precedence over functions") {
        config.routes.emplace_back("/r", "r.js");
        config.functions.push_back({"/f", "f.js", "handler"});

        auto functions = registered_functions(config);
        REQUIRE(functions.size() == 1);
        REQUIRE(functions[0].path == "/r");

        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE_FALSE(result.warnings.empty());
    }

    SECTION("Function list in registration order") {
        config.functions.push_back({"/second", "2.js", "handler"});
        config.functions.push_back({"/first", "1.js", "other"});

        auto functions = registered_functions(config);
        REQUIRE(functions.size() == 2);
        REQUIRE(functions[0].path == "/second");
        REQUIRE(functions[1].handler == "other");
    }
}

TEST_CASE("Routes keep file order", "[control][config]") {
    // "/api/special" sorts before "/api/{proxy+}" but is registered after it
    auto config = ConfigLoader::load_from_json(
        R"({"routes": {"/api/{proxy+}": "catchall.js", "/api/special": "special.js"}})");
    REQUIRE(config.has_value());

    auto functions = registered_functions(*config);
    REQUIRE(functions.size() == 2);
    REQUIRE(functions[0].path == "/api/{proxy+}");
    REQUIRE(functions[0].entry == "catchall.js");
    REQUIRE(functions[1].path == "/api/special");

    SECTION("Order survives serialization") {
        auto reloaded = ConfigLoader::load_from_json(ConfigLoader::to_json(*config));
        REQUIRE(reloaded.has_value());
        REQUIRE(reloaded->routes[0].first == "/api/{proxy+}");
        REQUIRE(reloaded->routes[1].first == "/api/special");
    }
}

TEST_CASE("Routes must be an object of strings", "[control][config]") {
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"routes": ["/a", "a.js"]})").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"routes": {"/a": 1}})").has_value());
}

TEST_CASE("Config validation - valid config", "[control][config]") {
    Config config;
    config.routes.emplace_back("/hello", "hello.js");

    auto result = ConfigLoader::validate(config);
    REQUIRE(result.valid);
    REQUIRE(result.errors.empty());
}

TEST_CASE("Config validation - errors", "[control][config]") {
    Config config;
    config.routes.emplace_back("/hello", "hello.js");

    SECTION("Empty bin") {
        config.bin.clear();
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Empty tmp") {
        config.tmp.clear();
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Relative route path") {
        config.routes.emplace_back("hello", "hello.js");
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Empty entry") {
        config.routes.emplace_back("/empty", "");
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Invalid env name") {
        config.env["BAD=NAME"] = "x";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Unknown log level") {
        config.logging.level = "verbose";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("Unknown log format") {
        config.logging.format = "xml";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("TLS port equal to HTTP port") {
        config.port = 3000;
        config.https_port = 3000;
        config.https_key = "key";
        config.https_cert = "cert";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }
}

TEST_CASE("Config validation - warnings", "[control][config]") {
    Config config;

    SECTION("No functions") {
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE_FALSE(result.warnings.empty());
    }

    SECTION("Partial TLS settings") {
        config.routes.emplace_back("/hello", "hello.js");
        config.https_port = 3443;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE_FALSE(config.https_enabled());
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("Docker mode") {
        config.routes.emplace_back("/hello", "hello.js");
        config.docker = true;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 1);
    }
}

TEST_CASE("Config load from file", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "lamina_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"port": 4000, "routes": {"/x": "x.js"}})";
    }

    auto config = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->port == 4000);
    REQUIRE(registered_functions(*config).size() == 1);

    REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/lamina.json").has_value());
}

TEST_CASE("Config round trip", "[control][config]") {
    Config config;
    config.port = 3100;
    config.https_port = 3443;
    config.env["PATH"] = "/usr/bin";
    config.routes.emplace_back("/api/{proxy+}", "api.js");
    config.enable_cors = true;

    auto reloaded = ConfigLoader::load_from_json(ConfigLoader::to_json(config));
    REQUIRE(reloaded.has_value());
    REQUIRE(reloaded->port == 3100);
    REQUIRE(reloaded->https_port == uint16_t{3443});
    REQUIRE(reloaded->env.at("PATH") == "/usr/bin");
    REQUIRE(reloaded->routes.size() == 1);
    REQUIRE(reloaded->routes[0].first == "/api/{proxy+}");
    REQUIRE(reloaded->routes[0].second == "api.js");
    REQUIRE(reloaded->enable_cors);
}
