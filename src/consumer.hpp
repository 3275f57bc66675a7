#pragma once
#include "poller.hpp"
#include "stream_types.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <optional>
#include <utility>

namespace tokflow {

struct StreamStats {
    size_t batches = 0;
    size_t outcomes = 0;
    size_t largest_batch = 0;
    // From ConsumerLoop::add to the turn that saw the first batch.
    std::optional<std::chrono::milliseconds> first_batch_latency;
    bool terminal_seen = false;
    PollerExit exit = PollerExit::Running;
};

// Consumer side of any number of streams, driven by the host's own
// (frame-paced, cooperative) scheduler. Each pump() is one turn: every
// batch already delivered is applied, in order, and control returns.
// Nothing here waits for a batch to arrive.
template<typename P>
class ConsumerLoop {
public:
    using Clock = std::chrono::steady_clock;
    using StreamId = uint64_t;
    using ApplyFn = std::function<void(const StreamOutcome<P>&)>;
    using FinishedFn = std::function<void(StreamId, const StreamStats&)>;

    StreamId add(StreamHandle<P> handle, ApplyFn apply, FinishedFn on_finished = nullptr) {
        StreamId id = next_id_++;
        streams_.push_back(Subscription{id, std::move(handle), std::move(apply),
                                        std::move(on_finished), {}, Clock::now()});
        return id;
    }

    // Drain and apply everything available; retire closed streams.
    // Returns the number of outcomes applied. An exception from `apply`
    // propagates out of pump(); the outcomes after the one that threw
    // stay queued and are applied first on the next turn.
    size_t pump() {
        size_t applied = 0;
        auto now = Clock::now();
        for (auto& sub : streams_) {
            for (auto& batch : sub.handle.poll_batches()) sub.backlog.push_back(std::move(batch));

            auto& st = sub.stats;
            while (!sub.backlog.empty()) {
                const Batch<P>& batch = sub.backlog.front();
                if (sub.next_outcome == 0) {
                    if (!st.first_batch_latency) {
                        st.first_batch_latency =
                            std::chrono::duration_cast<std::chrono::milliseconds>(now - sub.added_at);
                    }
                    ++st.batches;
                    st.largest_batch = std::max(st.largest_batch, batch.size());
                }
                while (sub.next_outcome < batch.size()) {
                    const auto& outcome = batch[sub.next_outcome++];
                    ++st.outcomes;
                    ++applied;
                    if (outcome.is_terminal()) st.terminal_seen = true;
                    if (sub.apply) sub.apply(outcome);
                }
                sub.backlog.pop_front();
                sub.next_outcome = 0;
            }
        }
        retire_finished();
        return applied;
    }

    bool cancel(StreamId id) {
        auto it = find(id);
        if (it == streams_.end()) return false;
        it->handle.cancel();
        return true;
    }

    void cancel_all() {
        for (auto& sub : streams_) sub.handle.cancel();
    }

    bool contains(StreamId id) const {
        return std::any_of(streams_.begin(), streams_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    }

    const StreamStats* stats(StreamId id) const {
        for (const auto& sub : streams_) {
            if (sub.id == id) return &sub.stats;
        }
        return nullptr;
    }

    size_t active() const { return streams_.size(); }
    bool empty() const { return streams_.empty(); }

private:
    struct Subscription {
        StreamId id;
        StreamHandle<P> handle;
        ApplyFn apply;
        FinishedFn on_finished;
        StreamStats stats;
        Clock::time_point added_at;
        std::deque<Batch<P>> backlog; // drained, not yet fully applied
        size_t next_outcome = 0;      // into backlog.front()
    };

    typename std::list<Subscription>::iterator find(StreamId id) {
        return std::find_if(streams_.begin(), streams_.end(),
                            [id](const Subscription& s) { return s.id == id; });
    }

    // A closed, drained channel means the poller is on its way out, so
    // the join only waits for the thread to return.
    void retire_finished() {
        for (auto it = streams_.begin(); it != streams_.end();) {
            if (!it->backlog.empty() || !it->handle.finished()) {
                ++it;
                continue;
            }
            it->stats.exit = it->handle.join();
            StreamId id = it->id;
            StreamStats stats = it->stats;
            FinishedFn done = std::move(it->on_finished);
            it = streams_.erase(it);
            if (done) done(id, stats);
        }
    }

    std::list<Subscription> streams_;
    StreamId next_id_ = 1;
};

} // namespace tokflow
