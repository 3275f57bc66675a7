#pragma once
#include "decoders/ndjson.hpp"
#include "stream_types.hpp"
#include "transport/http.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokflow {

struct StreamConfig {
    uint32_t max_batch_size = 32;
    uint32_t max_batch_delay_ms = 16;
    uint32_t channel_capacity = 0;   // 0 = unbounded
    uint32_t poll_interval_ms = 50;
    uint32_t stall_timeout_ms = 0;   // 0 = wait for the consumer forever
};

struct DecoderConfig {
    std::string done_pointer = "/done";
    std::string error_pointer = "/error";
    std::string text_pointer = "/message/content";
    bool skip_malformed = false;
    uint32_t max_line_bytes = 1024 * 1024;
};

struct DisplayConfig {
    uint32_t frame_rate = 60;
    bool show_stats = false;
};

struct Config {
    std::string url = "http://localhost:11434/api/chat";
    std::string model = "gpt-oss:20b";
    std::string api_key;
    long connect_timeout = 30; // seconds

    StreamConfig stream;
    DecoderConfig decoder;
    DisplayConfig display;

    // Load from ~/.tokflow/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults when missing).
    // Environment overrides are applied here too.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Typed view of a parsed config; mistyped keys keep their default.
    static Config from_json(const nlohmann::json& j);

    StreamOptions stream_options() const;
    NdjsonOptions ndjson_options() const;

    // Content-Type plus Authorization when an API key is set.
    std::vector<Header> request_headers() const;
};

} // namespace tokflow
