#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace tokflow {

nlohmann::json Config::defaults_json() {
    return {
        {"url", "http://localhost:11434/api/chat"},
        {"model", "gpt-oss:20b"},
        {"api_key", ""},
        {"connect_timeout", 30},
        {"stream", {
            {"max_batch_size", 32},
            {"max_batch_delay_ms", 16},
            {"channel_capacity", 0},
            {"poll_interval_ms", 50},
            {"stall_timeout_ms", 0}
        }},
        {"decoder", {
            {"done_pointer", "/done"},
            {"error_pointer", "/error"},
            {"text_pointer", "/message/content"},
            {"skip_malformed", false},
            {"max_line_bytes", 1024 * 1024}
        }},
        {"display", {
            {"frame_rate", 60},
            {"show_stats", false}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Values that do not fit are ignored like mistyped ones.
static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    auto value = obj[key].get<uint64_t>();
    if (value <= std::numeric_limits<uint32_t>::max())
        out = static_cast<uint32_t>(value);
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean())
        out = obj[key].get<bool>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_string(j, "url", cfg.url);
    read_string(j, "model", cfg.model);
    read_string(j, "api_key", cfg.api_key);
    uint32_t connect_timeout = static_cast<uint32_t>(cfg.connect_timeout);
    read_uint(j, "connect_timeout", connect_timeout);
    cfg.connect_timeout = static_cast<long>(connect_timeout);

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        read_uint(s, "max_batch_size", cfg.stream.max_batch_size);
        read_uint(s, "max_batch_delay_ms", cfg.stream.max_batch_delay_ms);
        read_uint(s, "channel_capacity", cfg.stream.channel_capacity);
        read_uint(s, "poll_interval_ms", cfg.stream.poll_interval_ms);
        read_uint(s, "stall_timeout_ms", cfg.stream.stall_timeout_ms);
        // A batch size of 0 cannot be honoured; keep the default.
        if (cfg.stream.max_batch_size == 0) cfg.stream.max_batch_size = StreamConfig{}.max_batch_size;
        if (cfg.stream.poll_interval_ms == 0) cfg.stream.poll_interval_ms = StreamConfig{}.poll_interval_ms;
    }

    if (j.contains("decoder") && j["decoder"].is_object()) {
        auto& d = j["decoder"];
        read_string(d, "done_pointer", cfg.decoder.done_pointer);
        read_string(d, "error_pointer", cfg.decoder.error_pointer);
        read_string(d, "text_pointer", cfg.decoder.text_pointer);
        read_bool(d, "skip_malformed", cfg.decoder.skip_malformed);
        read_uint(d, "max_line_bytes", cfg.decoder.max_line_bytes);
    }

    if (j.contains("display") && j["display"].is_object()) {
        auto& d = j["display"];
        read_uint(d, "frame_rate", cfg.display.frame_rate);
        read_bool(d, "show_stats", cfg.display.show_stats);
        if (cfg.display.frame_rate == 0) cfg.display.frame_rate = DisplayConfig{}.frame_rate;
    }
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.tokflow/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("TOKFLOW_URL"))
        cfg.url = v;
    if (const char* v = std::getenv("TOKFLOW_MODEL"))
        cfg.model = v;
    if (const char* v = std::getenv("TOKFLOW_API_KEY"))
        cfg.api_key = v;

    return cfg;
}

StreamOptions Config::stream_options() const {
    StreamOptions opts;
    opts.thresholds.max_batch_size = stream.max_batch_size;
    opts.thresholds.max_batch_delay = std::chrono::milliseconds(stream.max_batch_delay_ms);
    opts.channel_capacity = stream.channel_capacity;
    opts.cancellation.poll_interval = std::chrono::milliseconds(stream.poll_interval_ms);
    opts.cancellation.stall_timeout = std::chrono::milliseconds(stream.stall_timeout_ms);
    return opts;
}

NdjsonOptions Config::ndjson_options() const {
    NdjsonOptions opts;
    opts.done_pointer = decoder.done_pointer;
    opts.error_pointer = decoder.error_pointer;
    opts.skip_malformed = decoder.skip_malformed;
    opts.max_line_bytes = decoder.max_line_bytes;
    return opts;
}

std::vector<Header> Config::request_headers() const {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!api_key.empty())
        headers.push_back({"Authorization", "Bearer " + api_key});
    return headers;
}

} // namespace tokflow
