#include <catch2/catch.hpp>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace tokflow;

namespace {

// Fresh directory per test; removed afterwards.
struct TempDir {
    std::filesystem::path path;
    TempDir() {
        static int counter = 0;
        path = std::filesystem::temp_directory_path() /
               ("tokflow_cfg_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::string file(const std::string& name) const { return (path / name).string(); }
};

// Clears the override variables for the duration of a test.
struct EnvGuard {
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }
    static void clear() {
        unsetenv("TOKFLOW_URL");
        unsetenv("TOKFLOW_MODEL");
        unsetenv("TOKFLOW_API_KEY");
    }
};

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

nlohmann::json read_json(const std::string& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
}

} // namespace

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values match the pipeline defaults", "[config]") {
    Config cfg;
    auto so = cfg.stream_options();
    StreamOptions defaults;
    REQUIRE(so.thresholds.max_batch_size == defaults.thresholds.max_batch_size);
    REQUIRE(so.thresholds.max_batch_delay == defaults.thresholds.max_batch_delay);
    REQUIRE(so.channel_capacity == defaults.channel_capacity);
    REQUIRE(so.cancellation.poll_interval == defaults.cancellation.poll_interval);
    REQUIRE(so.cancellation.stall_timeout == defaults.cancellation.stall_timeout);

    auto no = cfg.ndjson_options();
    NdjsonOptions nd;
    REQUIRE(no.done_pointer == nd.done_pointer);
    REQUIRE(no.error_pointer == nd.error_pointer);
    REQUIRE(no.skip_malformed == nd.skip_malformed);
    REQUIRE(no.max_line_bytes == nd.max_line_bytes);
}

TEST_CASE("Config::defaults_json: round-trips into default config", "[config]") {
    Config a = Config::from_json(Config::defaults_json());
    Config b;
    REQUIRE(a.url == b.url);
    REQUIRE(a.model == b.model);
    REQUIRE(a.stream.max_batch_size == b.stream.max_batch_size);
    REQUIRE(a.decoder.text_pointer == b.decoder.text_pointer);
    REQUIRE(a.display.frame_rate == b.display.frame_rate);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "url": "https://example.com/api/chat",
        "model": "m1",
        "api_key": "k",
        "connect_timeout": 5,
        "stream": {"max_batch_size": 8, "max_batch_delay_ms": 0, "channel_capacity": 4,
                   "poll_interval_ms": 20, "stall_timeout_ms": 1000},
        "decoder": {"done_pointer": "/fin", "error_pointer": "", "text_pointer": "/response",
                    "skip_malformed": true, "max_line_bytes": 4096},
        "display": {"frame_rate": 30, "show_stats": true}
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.url == "https://example.com/api/chat");
    REQUIRE(cfg.model == "m1");
    REQUIRE(cfg.api_key == "k");
    REQUIRE(cfg.connect_timeout == 5);

    auto so = cfg.stream_options();
    REQUIRE(so.thresholds.max_batch_size == 8);
    REQUIRE(so.thresholds.max_batch_delay.count() == 0);
    REQUIRE(so.channel_capacity == 4);
    REQUIRE(so.cancellation.poll_interval.count() == 20);
    REQUIRE(so.cancellation.stall_timeout.count() == 1000);

    auto no = cfg.ndjson_options();
    REQUIRE(no.done_pointer == "/fin");
    REQUIRE(no.error_pointer.empty());
    REQUIRE(no.skip_malformed);
    REQUIRE(no.max_line_bytes == 4096);
    REQUIRE(cfg.decoder.text_pointer == "/response");
    REQUIRE(cfg.display.frame_rate == 30);
    REQUIRE(cfg.display.show_stats);
}

TEST_CASE("Config::from_json: mistyped values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "url": 42,
        "stream": {"max_batch_size": "big", "max_batch_delay_ms": -5},
        "decoder": "nope",
        "display": {"show_stats": "yes"}
    })");
    Config cfg = Config::from_json(j);
    Config defaults;
    REQUIRE(cfg.url == defaults.url);
    REQUIRE(cfg.stream.max_batch_size == defaults.stream.max_batch_size);
    REQUIRE(cfg.stream.max_batch_delay_ms == defaults.stream.max_batch_delay_ms);
    REQUIRE(cfg.decoder.done_pointer == defaults.decoder.done_pointer);
    REQUIRE_FALSE(cfg.display.show_stats);
}

TEST_CASE("Config::from_json: values the pipeline cannot honour keep defaults", "[config]") {
    auto j = nlohmann::json::parse(
        R"({"stream": {"max_batch_size": 0, "poll_interval_ms": 0}, "display": {"frame_rate": 0}})");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.stream.max_batch_size == 32);
    REQUIRE(cfg.stream.poll_interval_ms == 50);
    REQUIRE(cfg.display.frame_rate == 60);
    REQUIRE_NOTHROW(validate(cfg.stream_options()));
}

TEST_CASE("Config::from_json: numbers too large to hold keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "connect_timeout": 18446744073709551615,
        "stream": {"channel_capacity": 4294967297, "max_batch_size": 4294967295},
        "decoder": {"max_line_bytes": 8589934592}
    })");
    Config cfg = Config::from_json(j);
    Config defaults;
    REQUIRE(cfg.connect_timeout == defaults.connect_timeout);
    REQUIRE(cfg.stream.channel_capacity == defaults.stream.channel_capacity);
    REQUIRE(cfg.stream.max_batch_size == 4294967295u);
    REQUIRE(cfg.decoder.max_line_bytes == defaults.decoder.max_line_bytes);
}

// ── request_headers ──────────────────────────────────────────────

TEST_CASE("Config::request_headers: bearer token only with a key", "[config]") {
    Config cfg;
    auto headers = cfg.request_headers();
    REQUIRE(headers.size() == 1);
    REQUIRE(headers[0].first == "Content-Type");

    cfg.api_key = "secret";
    headers = cfg.request_headers();
    REQUIRE(headers.size() == 2);
    REQUIRE(headers[1].first == "Authorization");
    REQUIRE(headers[1].second == "Bearer secret");
}

// ── load_from ────────────────────────────────────────────────────

TEST_CASE("Config::load_from: creates the file with defaults", "[config]") {
    EnvGuard env;
    TempDir dir;
    auto path = dir.file("sub/config.json");

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.url == Config{}.url);
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(read_json(path) == Config::defaults_json());
}

TEST_CASE("Config::load_from: fills missing keys and keeps user values", "[config]") {
    EnvGuard env;
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, R"({"model": "mine", "stream": {"max_batch_size": 4}})");

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.model == "mine");
    REQUIRE(cfg.stream.max_batch_size == 4);
    REQUIRE(cfg.stream.max_batch_delay_ms == 16);

    auto saved = read_json(path);
    REQUIRE(saved["model"] == "mine");
    REQUIRE(saved["stream"]["max_batch_size"] == 4);
    REQUIRE(saved["stream"].contains("poll_interval_ms"));
    REQUIRE(saved.contains("decoder"));
}

TEST_CASE("Config::load_from: malformed file falls back to defaults", "[config]") {
    EnvGuard env;
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, "{ this is not json");

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.model == Config{}.model);

    // The broken file is left for the user to fix.
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{ this is not json");
}

TEST_CASE("Config::load_from: environment overrides the file", "[config]") {
    EnvGuard env;
    TempDir dir;
    auto path = dir.file("config.json");
    write_file(path, R"({"url": "http://file/api", "model": "file-model", "api_key": "file-key"})");

    setenv("TOKFLOW_URL", "http://env/api", 1);
    setenv("TOKFLOW_MODEL", "env-model", 1);
    setenv("TOKFLOW_API_KEY", "env-key", 1);

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.url == "http://env/api");
    REQUIRE(cfg.model == "env-model");
    REQUIRE(cfg.api_key == "env-key");
}
