#include <catch2/catch.hpp>
#include "cancellation.hpp"
#include <thread>

using namespace tokflow;

TEST_CASE("CancellationSource: starts active", "[cancellation]") {
    CancellationSource source;
    REQUIRE_FALSE(source.is_cancelled());
    REQUIRE_FALSE(source.token().is_cancelled());
}

TEST_CASE("CancellationSource: cancel is seen through every token", "[cancellation]") {
    CancellationSource source;
    auto a = source.token();
    auto b = source.token();
    source.cancel();
    REQUIRE(source.is_cancelled());
    REQUIRE(a.is_cancelled());
    REQUIRE(b.is_cancelled());
}

TEST_CASE("CancellationSource: only the first cancel reports the transition", "[cancellation]") {
    CancellationSource source;
    REQUIRE(source.cancel());
    REQUIRE_FALSE(source.cancel());
    REQUIRE(source.is_cancelled());
}

TEST_CASE("CancellationToken: default token is never cancelled", "[cancellation]") {
    CancellationToken token;
    REQUIRE_FALSE(token.is_cancelled());
}

TEST_CASE("CancellationToken: outlives its source", "[cancellation]") {
    CancellationToken token;
    {
        CancellationSource source;
        token = source.token();
        source.cancel();
    }
    REQUIRE(token.is_cancelled());
}

TEST_CASE("CancellationSource: moved-from source is inert", "[cancellation]") {
    CancellationSource source;
    auto token = source.token();
    CancellationSource other = std::move(source);
    REQUIRE_FALSE(source.cancel()); // NOLINT(bugprone-use-after-move)
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE(other.cancel());
    REQUIRE(token.is_cancelled());
}

TEST_CASE("CancellationToken: cancel from another thread is observed", "[cancellation]") {
    CancellationSource source;
    auto token = source.token();
    std::thread t([&source] { source.cancel(); });
    t.join();
    REQUIRE(token.is_cancelled());
}
