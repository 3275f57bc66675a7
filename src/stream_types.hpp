#pragma once
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tokflow {

// One unit of generated content. `done` marks the final event of a stream.
template<typename P>
struct Event {
    P payload;
    bool done = false;
};

enum class StreamErrorKind { Transport, Decode };

inline const char* error_kind_to_string(StreamErrorKind kind) {
    switch (kind) {
        case StreamErrorKind::Transport: return "transport";
        case StreamErrorKind::Decode: return "decode";
    }
    return "unknown";
}

// Terminal: no outcome follows an error in the same stream.
struct StreamError {
    StreamErrorKind kind;
    std::string message;
};

// Thrown by begin_stream when the poller thread cannot be created.
class ResourceExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template<typename P>
class StreamOutcome {
public:
    static StreamOutcome success(Event<P> event) {
        return StreamOutcome(std::move(event));
    }

    static StreamOutcome failure(StreamError error) {
        return StreamOutcome(std::move(error));
    }

    bool ok() const { return value_.index() == 0; }
    const Event<P>& event() const { return std::get<0>(value_); }
    const StreamError& error() const { return std::get<1>(value_); }

    // An error or a done event ends the stream.
    bool is_terminal() const { return !ok() || event().done; }

private:
    explicit StreamOutcome(Event<P> event)
        : value_(std::in_place_index<0>, std::move(event)) {}
    explicit StreamOutcome(StreamError error)
        : value_(std::in_place_index<1>, std::move(error)) {}

    std::variant<Event<P>, StreamError> value_;
};

// Ordered, never empty.
template<typename P>
using Batch = std::vector<StreamOutcome<P>>;

struct Thresholds {
    size_t max_batch_size = 32;                      // >= 1; 1 disables batching
    std::chrono::milliseconds max_batch_delay{16};   // 0 = flush on size only
};

struct CancellationPolicy {
    // Longest single decoder wait; bounds how late cancellation is seen.
    std::chrono::milliseconds poll_interval{50};
    // How long the poller may block on a full channel before giving up.
    // 0 = wait as long as it takes.
    std::chrono::milliseconds stall_timeout{0};
};

struct StreamOptions {
    Thresholds thresholds;
    size_t channel_capacity = 0; // batches; 0 = unbounded
    CancellationPolicy cancellation;
};

// Throws std::invalid_argument on settings the pipeline cannot honour.
inline void validate(const StreamOptions& options) {
    if (options.thresholds.max_batch_size == 0)
        throw std::invalid_argument("max_batch_size must be at least 1");
    if (options.thresholds.max_batch_delay.count() < 0)
        throw std::invalid_argument("max_batch_delay must not be negative");
    if (options.cancellation.poll_interval.count() <= 0)
        throw std::invalid_argument("poll_interval must be positive");
    if (options.cancellation.stall_timeout.count() < 0)
        throw std::invalid_argument("stall_timeout must not be negative");
}

} // namespace tokflow
