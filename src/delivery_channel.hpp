#pragma once
#include "cancellation.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tokflow {

enum class SendStatus {
    Sent,
    Closed,    // receiver is gone
    Cancelled, // cancellation observed while waiting for room
    TimedOut   // no room within the stall timeout
};

// Single-producer / single-consumer FIFO between the poller thread and
// the consumer. capacity == 0 means unbounded. The consumer side never
// blocks; the producer blocks only while a bounded channel is full.
template<typename T>
class DeliveryChannel {
public:
    explicit DeliveryChannel(size_t capacity = 0) : capacity_(capacity) {}

    DeliveryChannel(const DeliveryChannel&) = delete;
    DeliveryChannel& operator=(const DeliveryChannel&) = delete;

    bool bounded() const { return capacity_ != 0; }

    // ── Producer side ───────────────────────────────────────────

    // Enqueue, waiting for room if bounded and full. Never drops: the
    // item is either enqueued or the status says why it was not.
    // stall_timeout of zero waits without limit.
    SendStatus send(T item, const CancellationToken& cancel,
                    std::chrono::milliseconds stall_timeout = std::chrono::milliseconds(0)) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [&] {
            return receiver_closed_ || cancel.is_cancelled() || has_room();
        };
        if (stall_timeout.count() > 0) {
            if (!not_full_.wait_for(lock, stall_timeout, ready))
                return SendStatus::TimedOut;
        } else {
            not_full_.wait(lock, ready);
        }
        if (receiver_closed_) return SendStatus::Closed;
        if (!has_room()) return SendStatus::Cancelled;
        queue_.push_back(std::move(item));
        return SendStatus::Sent;
    }

    // Enqueue only if there is room right now.
    bool try_send(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (receiver_closed_ || !has_room()) return false;
        queue_.push_back(std::move(item));
        return true;
    }

    // No more items will be sent.
    void close_sender() {
        std::lock_guard<std::mutex> lock(mutex_);
        sender_closed_ = true;
    }

    // Wake a producer blocked in send() so it re-checks cancellation.
    void wake() {
        { std::lock_guard<std::mutex> lock(mutex_); }
        not_full_.notify_all();
    }

    // ── Consumer side ───────────────────────────────────────────

    std::optional<T> try_recv() {
        std::optional<T> item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) return std::nullopt;
            item.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    // Take everything queued right now, oldest first.
    std::vector<T> drain() {
        std::vector<T> items;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items.reserve(queue_.size());
            while (!queue_.empty()) {
                items.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
        }
        if (!items.empty()) not_full_.notify_all();
        return items;
    }

    // Consumer is gone: drop what is queued and fail further sends.
    void close_receiver() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            receiver_closed_ = true;
            queue_.clear();
        }
        not_full_.notify_all();
    }

    // Sender closed and every item consumed.
    bool finished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sender_closed_ && queue_.empty();
    }

    bool sender_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sender_closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    bool has_room() const { return capacity_ == 0 || queue_.size() < capacity_; }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool sender_closed_ = false;
    bool receiver_closed_ = false;
};

} // namespace tokflow
