#pragma once
#include "stream_types.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tokflow {

// Groups outcomes into batches bounded by count and by age.
//
// The very first outcome of a stream is released alone and at once.
// After that, outcomes accumulate until the batch holds max_batch_size
// of them or max_batch_delay has passed since the oldest one arrived.
// A terminal outcome flushes what is pending and is then released on
// its own; nothing is accepted after it.
//
// Time is passed in by the caller, so the class holds no clock and no
// thread of its own.
template<typename P>
class Batcher {
public:
    using Clock = std::chrono::steady_clock;

    explicit Batcher(Thresholds thresholds) : thresholds_(thresholds) {
        if (thresholds_.max_batch_size == 0)
            throw std::invalid_argument("max_batch_size must be at least 1");
    }

    // Accept one outcome. Returns the batches that became ready, in order.
    std::vector<Batch<P>> push(StreamOutcome<P> outcome, Clock::time_point now) {
        if (finished_)
            throw std::logic_error("outcome pushed after the terminal outcome");

        std::vector<Batch<P>> ready;

        // A pending batch whose delay ran out goes before the newcomer.
        if (auto due = poll_timer(now)) ready.push_back(std::move(*due));

        if (outcome.is_terminal()) {
            if (!pending_.empty()) ready.push_back(take_pending());
            ready.push_back(single(std::move(outcome)));
            first_released_ = true;
            finished_ = true;
            return ready;
        }

        if (!first_released_) {
            first_released_ = true;
            ready.push_back(single(std::move(outcome)));
            return ready;
        }

        if (pending_.empty()) oldest_at_ = now;
        pending_.push_back(std::move(outcome));
        if (pending_.size() >= thresholds_.max_batch_size)
            ready.push_back(take_pending());
        return ready;
    }

    // Release the pending batch if its delay has elapsed by `now`.
    std::optional<Batch<P>> poll_timer(Clock::time_point now) {
        auto due = deadline();
        if (!due || now < *due) return std::nullopt;
        return take_pending();
    }

    // When the pending batch must go out; empty when nothing is pending
    // or when batching is size-only (max_batch_delay == 0).
    std::optional<Clock::time_point> deadline() const {
        if (pending_.empty() || thresholds_.max_batch_delay.count() == 0)
            return std::nullopt;
        return oldest_at_ + thresholds_.max_batch_delay;
    }

    // Release whatever is pending regardless of thresholds.
    std::optional<Batch<P>> flush() {
        if (pending_.empty()) return std::nullopt;
        return take_pending();
    }

    bool finished() const { return finished_; }
    size_t pending() const { return pending_.size(); }

private:
    static Batch<P> single(StreamOutcome<P> outcome) {
        Batch<P> batch;
        batch.push_back(std::move(outcome));
        return batch;
    }

    Batch<P> take_pending() {
        Batch<P> batch;
        batch.swap(pending_);
        return batch;
    }

    Thresholds thresholds_;
    Batch<P> pending_;
    Clock::time_point oldest_at_{};
    bool first_released_ = false;
    bool finished_ = false;
};

} // namespace tokflow
