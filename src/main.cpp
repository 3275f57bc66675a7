#include "config.hpp"
#include "consumer.hpp"
#include "decoders/ndjson.hpp"
#include "poller.hpp"
#include "transcript.hpp"
#include "transport/http.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using json = nlohmann::json;

static std::atomic<bool> g_interrupt{false};
static std::atomic<bool> g_streaming{false};

// Ctrl+C cancels a running stream; at an idle prompt it exits.
static void signal_handler(int /*sig*/) {
    if (!g_streaming.load()) std::_Exit(130);
    g_interrupt.store(true);
}

static void print_usage() {
    std::cout << "Usage: tokflow [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Stream a chat reply to MSG and exit\n"
              << "  -d, --data JSON      POST a raw request body and stream the reply\n"
              << "  --url URL            Streaming endpoint (NDJSON response)\n"
              << "  --model NAME         Model name used with --message and the REPL\n"
              << "  --batch-size N       Most events per batch (1 disables batching)\n"
              << "  --batch-delay MS     Longest time a partial batch waits (0 = size only)\n"
              << "  --capacity N         Bound the delivery channel to N batches (0 = unbounded)\n"
              << "  --fps N              Display frame rate\n"
              << "  --stats              Print stream statistics after each reply\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /model NAME          Switch model\n"
              << "  /stats               Toggle statistics\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOKFLOW_URL          Streaming endpoint\n"
              << "  TOKFLOW_MODEL        Model name\n"
              << "  TOKFLOW_API_KEY      Sent as a bearer token\n";
}

static uint32_t parse_count(const char* flag, const char* value, uint32_t min) {
    char* end = nullptr;
    errno = 0;
    unsigned long n = std::strtoul(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || value[0] == '-' ||
        n < min || n > UINT32_MAX) {
        throw std::invalid_argument(std::string(flag) + " expects a number >= " +
                                    std::to_string(min) + ", got '" + value + "'");
    }
    return static_cast<uint32_t>(n);
}

static std::string chat_body(const std::string& model, const std::string& prompt) {
    json body = {
        {"model", model},
        {"messages", json::array({{{"role", "user"}, {"content", prompt}}})},
        {"stream", true}
    };
    return body.dump();
}

static void print_stats(const tokflow::StreamStats& st, const tokflow::Transcript& transcript) {
    std::cerr << "[stats] exit=" << tokflow::poller_exit_to_string(st.exit)
              << " batches=" << st.batches
              << " events=" << st.outcomes
              << " largest_batch=" << st.largest_batch
              << " chars=" << transcript.chars();
    if (st.first_batch_latency)
        std::cerr << " first_batch_ms=" << st.first_batch_latency->count();
    if (auto ttfc = transcript.time_to_first_content())
        std::cerr << " first_content_ms=" << ttfc->count();
    if (st.batches > 0)
        std::cerr << " avg_batch=" << static_cast<double>(st.outcomes) / st.batches;
    std::cerr << "\n";
}

// Streams one reply, rendering new text once per frame.
// Returns false when the user interrupted it.
static bool run_stream(const tokflow::Config& config, const std::string& body) {
    tokflow::HttpStreamRequest request;
    request.url = config.url;
    request.body = body;
    request.headers = config.request_headers();
    request.connect_timeout_seconds = config.connect_timeout;

    auto decoder = std::make_unique<tokflow::NdjsonDecoder>(
        tokflow::open_http_stream(std::move(request)), config.ndjson_options());

    tokflow::Transcript transcript(config.decoder.text_pointer);
    tokflow::ConsumerLoop<json> loop;
    std::optional<tokflow::StreamStats> final_stats;

    auto id = loop.add(
        tokflow::begin_stream<json>(std::move(decoder), config.stream_options()),
        [&transcript](const tokflow::StreamOutcome<json>& outcome) {
            transcript.apply(outcome);
        },
        [&final_stats](tokflow::ConsumerLoop<json>::StreamId, const tokflow::StreamStats& st) {
            final_stats = st;
        });
    g_interrupt.store(false);
    g_streaming.store(true);

    const auto frame = std::chrono::microseconds(1000000 / config.display.frame_rate);
    auto next_frame = std::chrono::steady_clock::now();
    bool interrupted = false;

    while (!loop.empty()) {
        next_frame += frame;
        auto now = std::chrono::steady_clock::now();
        if (next_frame < now) next_frame = now; // fell behind; don't try to catch up
        std::this_thread::sleep_until(next_frame);

        if (g_interrupt.exchange(false) && !interrupted) {
            loop.cancel(id);
            interrupted = true;
        }

        loop.pump();
        std::string fresh = transcript.take_new_text();
        if (!fresh.empty()) std::cout << fresh << std::flush;
    }
    g_streaming.store(false);
    std::cout << "\n";

    if (const auto& err = transcript.error()) {
        std::cerr << "Error (" << tokflow::error_kind_to_string(err->kind) << "): "
                  << err->message << "\n";
    }
    if (interrupted) std::cerr << "[cancelled]\n";
    if (config.display.show_stats && final_stats) print_stats(*final_stats, transcript);
    return !interrupted;
}

static void run_repl(tokflow::Config& config) {
    std::cout << "tokflow\n"
              << "Endpoint: " << config.url << " | Model: " << config.model << "\n"
              << "Type /help for commands, /quit to exit. Ctrl+C stops a reply.\n\n";

    std::string line;
    while (true) {
        std::cout << "tokflow> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/stats") {
                config.display.show_stats = !config.display.show_stats;
                std::cout << "Statistics " << (config.display.show_stats ? "on" : "off") << "\n";
            } else if (line.substr(0, 7) == "/model ") {
                config.model = line.substr(7);
                std::cout << "Model set to: " << config.model << "\n";
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /model X  Switch to model X\n"
                          << "  /stats    Toggle statistics\n"
                          << "  /quit     Exit\n"
                          << "  /exit     Exit\n"
                          << "  /help     Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        run_stream(config, chat_body(config.model, line));
        std::cout << "\n";
    }
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string data;
    std::string url;
    std::string model;
    std::optional<uint32_t> batch_size;
    std::optional<uint32_t> batch_delay;
    std::optional<uint32_t> capacity;
    std::optional<uint32_t> fps;
    bool stats = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if ((std::strcmp(argv[i], "-d") == 0 || std::strcmp(argv[i], "--data") == 0) && i + 1 < argc) {
            data = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            url = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model = argv[++i];
        } else if (std::strcmp(argv[i], "--batch-size") == 0 && i + 1 < argc) {
            batch_size = parse_count(argv[i], argv[i + 1], 1);
            ++i;
        } else if (std::strcmp(argv[i], "--batch-delay") == 0 && i + 1 < argc) {
            batch_delay = parse_count(argv[i], argv[i + 1], 0);
            ++i;
        } else if (std::strcmp(argv[i], "--capacity") == 0 && i + 1 < argc) {
            capacity = parse_count(argv[i], argv[i + 1], 0);
            ++i;
        } else if (std::strcmp(argv[i], "--fps") == 0 && i + 1 < argc) {
            fps = parse_count(argv[i], argv[i + 1], 1);
            ++i;
        } else if (std::strcmp(argv[i], "--stats") == 0) {
            stats = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (!message.empty() && !data.empty()) {
        std::cerr << "Use either --message or --data, not both.\n";
        return 1;
    }

    tokflow::http_init();
    auto config = tokflow::Config::load();

    // Override config with CLI args
    if (!url.empty()) config.url = url;
    if (!model.empty()) config.model = model;
    if (batch_size) config.stream.max_batch_size = *batch_size;
    if (batch_delay) config.stream.max_batch_delay_ms = *batch_delay;
    if (capacity) config.stream.channel_capacity = *capacity;
    if (fps) config.display.frame_rate = *fps;
    if (stats) config.display.show_stats = true;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int rc = 0;
    if (!message.empty()) {
        rc = run_stream(config, chat_body(config.model, message)) ? 0 : 130;
    } else if (!data.empty()) {
        rc = run_stream(config, data) ? 0 : 130;
    } else {
        run_repl(config);
    }

    tokflow::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
