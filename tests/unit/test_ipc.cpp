// Lamina IPC Unit Tests
// Event encoding, result validation and line framing

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>

#include "../../src/runtime/ipc.hpp"

using namespace lamina::runtime;
using nlohmann::json;

namespace {

std::string result_line(const std::string& id, const json& result) {
    json message = {{"type", "result"}, {"id", id}, {"result", result}};
    return message.dump();
}

json basic_result() {
    return json{{"statusCode", 200},
                {"headers", {{"Content-Type", "text/plain"}}},
                {"body", "hi"},
                {"isBase64Encoded", false}};
}

}  // namespace

TEST_CASE("Event message framing", "[ipc]") {
    json event = {{"path", "/hello"}, {"httpMethod", "GET"}};
    std::string line = encode_event_message("abc-123", event);

    REQUIRE(line.back() == '\n');
    REQUIRE(line.find('\n') == line.size() - 1);

    auto decoded = json::parse(line);
    REQUIRE(decoded["type"] == "event");
    REQUIRE(decoded["id"] == "abc-123");
    REQUIRE(decoded["eventObject"]["path"] == "/hello");
}

TEST_CASE("Event message replaces invalid UTF-8", "[ipc]") {
    json event = {{"body", std::string("ok\xff")}};
    std::string line = encode_event_message("id", event);

    auto decoded = json::parse(line);
    REQUIRE(decoded["eventObject"]["body"] == "ok\xEF\xBF\xBD");
}

TEST_CASE("Valid result message decodes", "[ipc]") {
    json result = basic_result();
    result["headers"]["X-Count"] = 3;
    result["headers"]["X-Flag"] = true;
    result["multiValueHeaders"] = {{"Set-Cookie", {"a=1", "b=2"}}, {"X-One", "single"}};

    json message = {{"type", "result"}, {"id", "id-1"}, {"result", result},
                    {"memoryUsedBytes", 1048576}};

    std::string error;
    auto decoded = decode_result_message(message.dump(), "id-1", error);
    REQUIRE(decoded.has_value());
    REQUIRE(error.empty());

    REQUIRE(decoded->id == "id-1");
    REQUIRE(decoded->result.status_code == 200);
    REQUIRE(decoded->result.body == "hi");
    REQUIRE_FALSE(decoded->result.is_base64_encoded);
    REQUIRE(decoded->memory_used_bytes == 1048576.0);

    const auto& headers = decoded->result.headers;
    REQUIRE(headers.size() == 3);
    bool saw_count = false;
    bool saw_flag = false;
    for (const auto& [name, value] : headers) {
        if (name == "X-Count") {
            saw_count = value == "3";
        }
        if (name == "X-Flag") {
            saw_flag = value == "true";
        }
    }
    REQUIRE(saw_count);
    REQUIRE(saw_flag);

    REQUIRE(decoded->result.multi_value_headers.has_value());
    const auto& multi = *decoded->result.multi_value_headers;
    REQUIRE(multi.size() == 2);
    REQUIRE(multi[0].first == "Set-Cookie");
    REQUIRE(multi[0].second == std::vector<std::string>{"a=1", "b=2"});
    REQUIRE(multi[1].second == std::vector<std::string>{"single"});
}

TEST_CASE("Null multiValueHeaders and missing memory are allowed", "[ipc]") {
    json result = basic_result();
    result["multiValueHeaders"] = nullptr;

    std::string error;
    auto decoded = decode_result_message(result_line("x", result), "x", error);
    REQUIRE(decoded.has_value());
    REQUIRE_FALSE(decoded->result.multi_value_headers.has_value());
    REQUIRE_FALSE(decoded->memory_used_bytes.has_value());
}

TEST_CASE("Protocol violations are rejected", "[ipc]") {
    std::string error;

    SECTION("Unparseable line") {
        REQUIRE_FALSE(decode_result_message("{not json", "x", error));
        REQUIRE(error.find("unparseable") != std::string::npos);
    }

    SECTION("Not an object") {
        REQUIRE_FALSE(decode_result_message("[1,2]", "x", error));
        REQUIRE(error.find("bad data type") != std::string::npos);
    }

    SECTION("Wrong type tag") {
        json message = {{"type", "event"}, {"id", "x"}, {"result", basic_result()}};
        REQUIRE_FALSE(decode_result_message(message.dump(), "x", error));
        REQUIRE(error.find("incorrect type") != std::string::npos);
    }

    SECTION("Unknown id") {
        REQUIRE_FALSE(decode_result_message(result_line("other", basic_result()), "x", error));
        REQUIRE(error.find("unknown response id") != std::string::npos);
    }

    SECTION("Missing result") {
        json message = {{"type", "result"}, {"id", "x"}};
        REQUIRE_FALSE(decode_result_message(message.dump(), "x", error));
        REQUIRE(error == "missing result from worker");
    }

    SECTION("statusCode as string") {
        json result = basic_result();
        result["statusCode"] = "200";
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
        REQUIRE(error.find("statusCode") != std::string::npos);
    }

    SECTION("Fractional statusCode") {
        json result = basic_result();
        result["statusCode"] = 200.5;
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
    }

    SECTION("Missing headers") {
        json result = basic_result();
        result.erase("headers");
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
        REQUIRE(error.find("headers") != std::string::npos);
    }

    SECTION("Object header value") {
        json result = basic_result();
        result["headers"]["X-Bad"] = json::object();
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
        REQUIRE(error.find("X-Bad") != std::string::npos);
    }

    SECTION("Body is not a string") {
        json result = basic_result();
        result["body"] = 42;
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
        REQUIRE(error.find("body") != std::string::npos);
    }

    SECTION("isBase64Encoded missing") {
        json result = basic_result();
        result.erase("isBase64Encoded");
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
        REQUIRE(error.find("isBase64Encoded") != std::string::npos);
    }

    SECTION("multiValueHeaders not an object") {
        json result = basic_result();
        result["multiValueHeaders"] = json::array({"a"});
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
    }

    SECTION("memoryUsedBytes not a number") {
        json message = {{"type", "result"}, {"id", "x"}, {"result", basic_result()},
                        {"memoryUsedBytes", "lots"}};
        REQUIRE_FALSE(decode_result_message(message.dump(), "x", error));
    }
}

TEST_CASE("Header injection is a protocol violation", "[ipc]") {
    std::string error;
    json result = basic_result();

    SECTION("CRLF in a header value") {
        result["headers"]["Location"] = "/next\r\nSet-Cookie: session=stolen";
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
        REQUIRE(error.find("Location") != std::string::npos);
    }

    SECTION("Bare LF in a header value") {
        result["headers"]["X-Note"] = "a\nb";
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
    }

    SECTION("NUL in a header value") {
        result["headers"]["X-Note"] = std::string("a\0b", 3);
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
    }

    SECTION("Header name is not a token") {
        result["headers"]["X Bad: 1\r\nX-Other"] = "v";
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
        REQUIRE(error.find("invalid header name") != std::string::npos);
    }

    SECTION("Empty header name") {
        result["headers"][""] = "v";
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
    }

    SECTION("CRLF inside a multiValueHeaders entry") {
        result["multiValueHeaders"] = {{"Set-Cookie", {"a=1", "b=2\r\nX-Injected: yes"}}};
        REQUIRE_FALSE(decode_result_message(result_line("x", result), "x", error));
        REQUIRE(error.find("Set-Cookie") != std::string::npos);
    }

    SECTION("Token punctuation and tabs are accepted") {
        result["headers"]["X-Custom_Header.v2"] = "a\tb; c=\"d\"";
        REQUIRE(decode_result_message(result_line("x", result), "x", error).has_value());
    }
}

TEST_CASE("Result back to wire JSON", "[ipc]") {
    InvocationResult result;
    result.status_code = 404;
    result.headers = {{"X-A", "1"}};
    result.body = "missing";

    auto j = to_json(result);
    REQUIRE(j["statusCode"] == 404);
    REQUIRE(j["headers"]["X-A"] == "1");
    REQUIRE_FALSE(j.contains("multiValueHeaders"));
    REQUIRE(j["body"] == "missing");
    REQUIRE(j["isBase64Encoded"] == false);

    std::string error;
    auto reparsed = parse_invocation_result(j, error);
    REQUIRE(reparsed.has_value());
    REQUIRE(reparsed->status_code == 404);
}

TEST_CASE("LineBuffer framing", "[ipc]") {
    LineBuffer buffer;
    REQUIRE(buffer.empty());
    REQUIRE_FALSE(buffer.next_line().has_value());

    buffer.append("first\nsec");
    REQUIRE(buffer.next_line() == "first");
    REQUIRE_FALSE(buffer.next_line().has_value());
    REQUIRE_FALSE(buffer.empty());

    buffer.append("ond\n\nthird");
    REQUIRE(buffer.next_line() == "second");
    REQUIRE(buffer.next_line() == "");
    REQUIRE_FALSE(buffer.next_line().has_value());

    REQUIRE(buffer.take_rest() == "third");
    REQUIRE(buffer.empty());
    REQUIRE_FALSE(buffer.take_rest().has_value());
}

TEST_CASE("split_lines keeps empty fields", "[ipc]") {
    REQUIRE(split_lines("a\nb\n") == std::vector<std::string>{"a", "b", ""});
    REQUIRE(split_lines("single") == std::vector<std::string>{"single"});
    REQUIRE(split_lines("") == std::vector<std::string>{""});
    REQUIRE(split_lines("\n") == std::vector<std::string>{"", ""});
}
