// Lamina HTTP Layer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <span>
#include <string>

#include "../../src/http/http.hpp"
#include "../../src/http/parser.hpp"

using namespace lamina::http;

namespace {

std::span<const uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

}  // namespace

TEST_CASE("HTTP method conversion", "[http][method]") {
    REQUIRE(to_string(Method::GET) == "GET");
    REQUIRE(to_string(Method::POST) == "POST");
    REQUIRE(to_string(Method::OPTIONS) == "OPTIONS");

    REQUIRE(parse_method("GET") == Method::GET);
    REQUIRE(parse_method("DELETE") == Method::DELETE);
    REQUIRE(parse_method("XMODIFY") == Method::UNKNOWN);
}

TEST_CASE("Header name comparison (case-insensitive)", "[http][headers]") {
    REQUIRE(header_name_equals("Content-Type", "content-type"));
    REQUIRE(header_name_equals("CONTENT-TYPE", "content-type"));
    REQUIRE_FALSE(header_name_equals("Content-Type", "Content-Length"));
}

TEST_CASE("Parse simple GET request", "[http][parser]") {
    std::string_view raw =
        "GET /hello HTTP/1.1\r\n"
        "Host: localhost:3000\r\n"
        "User-Agent: test\r\n"
        "\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(as_bytes(raw), request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(request.method == Method::GET);
    REQUIRE(request.method_name == "GET");
    REQUIRE(request.version == Version::HTTP_1_1);
    REQUIRE(request.path == "/hello");
    REQUIRE(request.headers.size() == 2);
    REQUIRE(request.get_header("host") == "localhost:3000");
}

TEST_CASE("Parse request target with query string", "[http][parser]") {
    auto request = parse_http_request(
        "GET /api/users?id=123&name=test HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "\r\n");

    REQUIRE(request.has_value());
    REQUIRE(request->path == "/api/users");
    REQUIRE(request->query == "id=123&name=test");
    REQUIRE(request->uri == "/api/users?id=123&name=test");
}

TEST_CASE("Header names keep their wire spelling and duplicates", "[http][parser]") {
    auto request = parse_http_request(
        "GET / HTTP/1.1\r\n"
        "X-Custom-Thing: one\r\n"
        "x-custom-thing: two\r\n"
        "\r\n");

    REQUIRE(request.has_value());
    REQUIRE(request->headers.size() == 2);
    REQUIRE(request->headers[0].name == "X-Custom-Thing");
    REQUIRE(request->headers[1].name == "x-custom-thing");
    REQUIRE(request->get_header("X-CUSTOM-THING") == "one");
}

TEST_CASE("Parse POST request with body", "[http][parser]") {
    auto request = parse_http_request(
        "POST /api/data HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 13\r\n"
        "\r\n"
        "{\"key\":\"val\"}");

    REQUIRE(request.has_value());
    REQUIRE(request->method == Method::POST);
    REQUIRE(request->body == "{\"key\":\"val\"}");
}

TEST_CASE("Parse chunked request body", "[http][parser]") {
    auto request = parse_http_request(
        "PUT /upload HTTP/1.1\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "6\r\n world\r\n"
        "0\r\n\r\n");

    REQUIRE(request.has_value());
    REQUIRE(request->body == "hello world");
}

TEST_CASE("Unknown methods keep their token", "[http][parser]") {
    auto request = parse_http_request(
        "PROPFIND /dav HTTP/1.1\r\n"
        "\r\n");

    REQUIRE(request.has_value());
    REQUIRE(request->method == Method::UNKNOWN);
    REQUIRE(request->method_name == "PROPFIND");
}

TEST_CASE("Parse request split across reads", "[http][parser]") {
    std::string_view part1 = "POST /split HTTP/1.1\r\nX-Lo";
    std::string_view part2 = "ng-Header: abc";
    std::string_view part3 = "def\r\nContent-Length: 4\r\n\r\nbo";
    std::string_view part4 = "dy";

    Parser parser;
    Request request;

    REQUIRE(parser.parse_request(as_bytes(part1), request).first == ParseResult::Incomplete);
    REQUIRE(parser.parse_request(as_bytes(part2), request).first == ParseResult::Incomplete);
    REQUIRE(parser.parse_request(as_bytes(part3), request).first == ParseResult::Incomplete);
    REQUIRE(parser.parse_request(as_bytes(part4), request).first == ParseResult::Complete);

    REQUIRE(request.uri == "/split");
    REQUIRE(request.get_header("X-Long-Header") == "abcdef");
    REQUIRE(request.body == "body");
}

TEST_CASE("Pipelined requests are parsed one at a time", "[http][pipelining]") {
    std::string_view raw =
        "GET /first HTTP/1.1\r\n\r\n"
        "GET /second HTTP/1.1\r\n\r\n";

    Parser parser;
    Request first;
    auto [result1, consumed1] = parser.parse_request(as_bytes(raw), first);
    REQUIRE(result1 == ParseResult::Complete);
    REQUIRE(consumed1 < raw.size());
    REQUIRE(first.uri == "/first");

    parser.reset();
    Request second;
    auto [result2, consumed2] = parser.parse_request(as_bytes(raw.substr(consumed1)), second);
    REQUIRE(result2 == ParseResult::Complete);
    REQUIRE(consumed1 + consumed2 == raw.size());
    REQUIRE(second.uri == "/second");
}

TEST_CASE("Malformed request is an error", "[http][parser]") {
    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(as_bytes("NOT A REQUEST\r\n\r\n"), request);

    REQUIRE(result == ParseResult::Error);
    REQUIRE_FALSE(parser.error_message().empty());
}

TEST_CASE("Request keep-alive detection", "[http][keepalive]") {
    SECTION("HTTP/1.1 defaults to keep-alive") {
        auto request = parse_http_request("GET / HTTP/1.1\r\n\r\n");
        REQUIRE(request.has_value());
        REQUIRE(request->keep_alive());
    }

    SECTION("Connection: close overrides HTTP/1.1 default") {
        auto request = parse_http_request("GET / HTTP/1.1\r\nConnection: close\r\n\r\n");
        REQUIRE(request.has_value());
        REQUIRE_FALSE(request->keep_alive());
    }

    SECTION("HTTP/1.0 needs Connection: keep-alive") {
        auto plain = parse_http_request("GET / HTTP/1.0\r\n\r\n");
        auto kept = parse_http_request("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
        REQUIRE(plain.has_value());
        REQUIRE(kept.has_value());
        REQUIRE_FALSE(plain->keep_alive());
        REQUIRE(kept->keep_alive());
    }
}

TEST_CASE("Response header helpers", "[http][response]") {
    Response response;
    response.add_header("Set-Cookie", "a=1");
    response.add_header("set-cookie", "b=2");
    response.set_header("X-Single", "one");

    REQUIRE(response.get_header("SET-COOKIE") == "a=1");

    response.set_header("Set-Cookie", std::vector<std::string>{"c=3", "d=4", "e=5"});
    size_t cookies = 0;
    for (const auto& header : response.headers) {
        if (header_name_equals(header.name, "Set-Cookie")) {
            ++cookies;
        }
    }
    REQUIRE(cookies == 3);

    REQUIRE(response.remove_header("x-single") == 1);
    REQUIRE_FALSE(response.has_header("X-Single"));
}

TEST_CASE("Response serialization computes framing headers", "[http][response]") {
    Response response;
    response.status = 201;
    response.set_header("Content-Length", "999");
    response.set_header("Connection", "upgrade");
    response.set_header("X-Test", "yes");
    response.body = "hello";

    std::string wire = serialize_response(response, true);

    REQUIRE(wire.starts_with("HTTP/1.1 201 Created\r\n"));
    REQUIRE(wire.find("X-Test: yes\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Length: 5\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Length: 999") == std::string::npos);
    REQUIRE(wire.find("Connection: keep-alive\r\n") != std::string::npos);
    REQUIRE(wire.find("upgrade") == std::string::npos);
    REQUIRE(wire.ends_with("\r\n\r\nhello"));

    std::string closing = serialize_response(response, false);
    REQUIRE(closing.find("Connection: close\r\n") != std::string::npos);
}

TEST_CASE("Responses without a body", "[http][response]") {
    Response response;
    response.set_header("X-Test", "yes");
    response.body = "ignored";

    SECTION("HEAD request") {
        std::string wire = serialize_response(response, true, true);
        REQUIRE(wire.starts_with("HTTP/1.1 200 OK\r\n"));
        REQUIRE(wire.find("X-Test: yes\r\n") != std::string::npos);
        REQUIRE(wire.find("Content-Length") == std::string::npos);
        REQUIRE(wire.ends_with("Connection: keep-alive\r\n\r\n"));
    }

    SECTION("204 No Content") {
        response.status = 204;
        std::string wire = serialize_response(response, true);
        REQUIRE(wire.find("Content-Length") == std::string::npos);
        REQUIRE(wire.ends_with("\r\n\r\n"));
    }

    SECTION("304 Not Modified") {
        response.status = 304;
        std::string wire = serialize_response(response, false);
        REQUIRE(wire.find("ignored") == std::string::npos);
        REQUIRE(wire.ends_with("Connection: close\r\n\r\n"));
    }

    SECTION("Statuses that forbid a body") {
        REQUIRE(status_forbids_body(101));
        REQUIRE(status_forbids_body(204));
        REQUIRE(status_forbids_body(304));
        REQUIRE_FALSE(status_forbids_body(200));
        REQUIRE_FALSE(status_forbids_body(404));
    }
}

TEST_CASE("Header name and value validation", "[http][headers]") {
    REQUIRE(is_valid_header_name("Content-Type"));
    REQUIRE(is_valid_header_name("X-Custom_Header.v2"));
    REQUIRE(is_valid_header_name("!#$%&'*+-.^_`|~"));
    REQUIRE_FALSE(is_valid_header_name(""));
    REQUIRE_FALSE(is_valid_header_name("Bad Name"));
    REQUIRE_FALSE(is_valid_header_name("Name:"));
    REQUIRE_FALSE(is_valid_header_name("X\r\nInjected"));

    REQUIRE(is_valid_header_value(""));
    REQUIRE(is_valid_header_value("text/html; charset=utf-8"));
    REQUIRE(is_valid_header_value("a\tb"));
    REQUIRE_FALSE(is_valid_header_value("a\r\nSet-Cookie: x=1"));
    REQUIRE_FALSE(is_valid_header_value("a\nb"));
    REQUIRE_FALSE(is_valid_header_value(std::string_view("a\0b", 3)));
}

TEST_CASE("Reason phrases", "[http][response]") {
    REQUIRE(to_reason_phrase(200) == "OK");
    REQUIRE(to_reason_phrase(403) == "Forbidden");
    REQUIRE(to_reason_phrase(500) == "Internal Server Error");
    REQUIRE(to_reason_phrase(599) == "Unknown");
}
