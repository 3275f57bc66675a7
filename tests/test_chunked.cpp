#include <catch2/catch.hpp>
#include "transport/chunked.hpp"

using namespace tokflow;

TEST_CASE("ChunkedBodyDecoder: decodes a complete body", "[chunked]") {
    ChunkedBodyDecoder d;
    std::string out;
    REQUIRE(d.feed("5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n", out));
    REQUIRE(out == "hello world");
    REQUIRE(d.complete());
}

TEST_CASE("ChunkedBodyDecoder: input split at every byte", "[chunked]") {
    const std::string wire = "4\r\nWiki\r\n5\r\npedia\r\nE\r\n in\r\n\r\nchunks.\r\n0\r\n\r\n";
    ChunkedBodyDecoder d;
    std::string out;
    for (char c : wire) REQUIRE(d.feed(&c, 1, out));
    REQUIRE(out == "Wikipedia in\r\n\r\nchunks.");
    REQUIRE(d.complete());
}

TEST_CASE("ChunkedBodyDecoder: payload is available before the chunk ends", "[chunked]") {
    ChunkedBodyDecoder d;
    std::string out;
    REQUIRE(d.feed("a\r\n{\"a\":", out));
    REQUIRE(out == "{\"a\":");
    REQUIRE_FALSE(d.complete());
    REQUIRE(d.feed("1}\n\r\n", out));
    REQUIRE(out == "{\"a\":1}\n");
}

TEST_CASE("ChunkedBodyDecoder: accepts uppercase hex and extensions", "[chunked]") {
    ChunkedBodyDecoder d;
    std::string out;
    REQUIRE(d.feed("1A;name=value\r\n", out));
    REQUIRE(d.feed(std::string(26, 'x') + "\r\n0\r\n\r\n", out));
    REQUIRE(out.size() == 26);
    REQUIRE(d.complete());
}

TEST_CASE("ChunkedBodyDecoder: skips trailers", "[chunked]") {
    ChunkedBodyDecoder d;
    std::string out;
    REQUIRE(d.feed("3\r\nabc\r\n0\r\nX-Trailer: 1\r\n\r\n", out));
    REQUIRE(out == "abc");
    REQUIRE(d.complete());
}

TEST_CASE("ChunkedBodyDecoder: tolerates bare LF framing", "[chunked]") {
    ChunkedBodyDecoder d;
    std::string out;
    REQUIRE(d.feed("3\nabc\n0\n\n", out));
    REQUIRE(out == "abc");
    REQUIRE(d.complete());
}

TEST_CASE("ChunkedBodyDecoder: rejects a non-hex size", "[chunked]") {
    ChunkedBodyDecoder d;
    std::string out;
    REQUIRE_FALSE(d.feed("zz\r\n", out));
    REQUIRE_FALSE(d.error().empty());
    REQUIRE_FALSE(d.feed("3\r\nabc\r\n", out));
}

TEST_CASE("ChunkedBodyDecoder: rejects data overrunning its chunk", "[chunked]") {
    ChunkedBodyDecoder d;
    std::string out;
    REQUIRE_FALSE(d.feed("2\r\nabc\r\n", out));
    REQUIRE(out == "ab");
}

TEST_CASE("ChunkedBodyDecoder: rejects an endless size line", "[chunked]") {
    ChunkedBodyDecoder d;
    std::string out;
    REQUIRE_FALSE(d.feed(std::string(5000, '1'), out));
}
