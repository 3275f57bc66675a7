#include <catch2/catch.hpp>
#include "transport/http.hpp"
#include <stdexcept>

using namespace tokflow;

// ── parse_url ────────────────────────────────────────────────────

TEST_CASE("parse_url: http with explicit port and path", "[http]") {
    auto u = parse_url("http://localhost:11434/api/chat");
    REQUIRE_FALSE(u.tls);
    REQUIRE(u.host == "localhost");
    REQUIRE(u.port == "11434");
    REQUIRE(u.path == "/api/chat");
}

TEST_CASE("parse_url: https default port and root path", "[http]") {
    auto u = parse_url("https://api.example.com");
    REQUIRE(u.tls);
    REQUIRE(u.host == "api.example.com");
    REQUIRE(u.port == "443");
    REQUIRE(u.path == "/");
}

TEST_CASE("parse_url: keeps the query string", "[http]") {
    auto u = parse_url("http://h/p?x=1&y=2");
    REQUIRE(u.port == "80");
    REQUIRE(u.path == "/p?x=1&y=2");
}

TEST_CASE("parse_url: rejects unusable URLs", "[http]") {
    REQUIRE_THROWS_AS(parse_url("localhost:11434"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("ftp://host/file"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("http:///path"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("http://host:/path"), std::invalid_argument);
}

// ── build_post_request ───────────────────────────────────────────

TEST_CASE("build_post_request: request line, host and length", "[http]") {
    auto u = parse_url("http://localhost:8080/api/chat");
    std::string req = build_post_request(u, "{\"a\":1}", {{"Content-Type", "application/json"}});
    REQUIRE(req.rfind("POST /api/chat HTTP/1.1\r\n", 0) == 0);
    REQUIRE(req.find("Host: localhost\r\n") != std::string::npos);
    REQUIRE(req.find("Content-Type: application/json\r\n") != std::string::npos);
    REQUIRE(req.find("Content-Length: 7\r\n") != std::string::npos);
    REQUIRE(req.find("Connection: close\r\n\r\n{\"a\":1}") != std::string::npos);
}

TEST_CASE("build_post_request: caller supplied length is not duplicated", "[http]") {
    auto u = parse_url("http://h/");
    std::string req = build_post_request(u, "xy", {{"Content-Length", "2"}});
    REQUIRE(req.find("Content-Length") == req.rfind("Content-Length"));
}

// ── describe_http_status ─────────────────────────────────────────

TEST_CASE("describe_http_status: status with body start", "[http]") {
    REQUIRE(describe_http_status(404, "") == "HTTP 404");
    REQUIRE(describe_http_status(500, "{\"error\":\"x\"}") == "HTTP 500: {\"error\":\"x\"}");
}

TEST_CASE("describe_http_status: long bodies are cut", "[http]") {
    std::string msg = describe_http_status(502, std::string(2000, 'e'));
    REQUIRE(msg.size() == std::string("HTTP 502: ").size() + 512);
}
