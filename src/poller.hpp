#pragma once
#include "batcher.hpp"
#include "cancellation.hpp"
#include "delivery_channel.hpp"
#include "record_decoder.hpp"
#include "stream_types.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace tokflow {

enum class PollerExit {
    Running,
    Completed,    // done event delivered or decoder exhausted
    Failed,       // terminal error delivered
    Cancelled,
    ConsumerGone, // receiving end dropped
    Stalled       // bounded channel stayed full past stall_timeout
};

const char* poller_exit_to_string(PollerExit exit);

// Logs exits that the consumer cannot see in-band.
void log_poller_exit(PollerExit exit, size_t batches_sent);
void log_decoder_exception(const char* what);

// Drives a RecordDecoder on its own thread and hands batches to the
// delivery channel. Owned by the thread that runs it.
template<typename P>
class Poller {
public:
    using Clock = std::chrono::steady_clock;
    using Channel = DeliveryChannel<Batch<P>>;

    Poller(std::unique_ptr<RecordDecoder<P>> decoder,
           CancellationToken cancel,
           std::shared_ptr<Channel> channel,
           const StreamOptions& options)
        : decoder_(std::move(decoder)),
          cancel_(std::move(cancel)),
          channel_(std::move(channel)),
          batcher_(options.thresholds),
          policy_(options.cancellation) {}

    // Runs until the stream terminates; always closes the sending end.
    PollerExit run() {
        PollerExit exit = drive();
        // Transport teardown happens here, so a consumer that joins once
        // the channel is finished waits only for the thread to return.
        decoder_.reset();
        channel_->close_sender();
        log_poller_exit(exit, batches_sent_);
        return exit;
    }

private:
    PollerExit drive() {
        while (true) {
            if (cancel_.is_cancelled()) return abandon();

            if (auto due = batcher_.poll_timer(Clock::now())) {
                if (auto stop = deliver(std::move(*due))) return *stop;
            }

            DecodeStep<P> step = decode(wait_budget(Clock::now()));
            switch (step.kind) {
                case DecodeStep<P>::Kind::Pending:
                    break;

                case DecodeStep<P>::Kind::End:
                    if (auto rest = batcher_.flush()) {
                        if (auto stop = deliver(std::move(*rest))) return *stop;
                    }
                    return PollerExit::Completed;

                case DecodeStep<P>::Kind::Record: {
                    bool failed = !step.outcome->ok();
                    auto ready = batcher_.push(std::move(*step.outcome), Clock::now());
                    for (auto& batch : ready) {
                        if (auto stop = deliver(std::move(batch))) return *stop;
                    }
                    if (batcher_.finished())
                        return failed ? PollerExit::Failed : PollerExit::Completed;
                    break;
                }
            }
        }
    }

    // A throwing decoder becomes a terminal decode error in-band.
    DecodeStep<P> decode(std::chrono::milliseconds timeout) {
        try {
            return decoder_->next(timeout);
        } catch (const std::exception& e) {
            log_decoder_exception(e.what());
            return DecodeStep<P>::record(StreamOutcome<P>::failure(
                {StreamErrorKind::Decode, std::string("decoder failed: ") + e.what()}));
        }
    }

    // Wait no longer than the poll interval, nor past the batch deadline.
    std::chrono::milliseconds wait_budget(Clock::time_point now) const {
        auto budget = policy_.poll_interval;
        if (auto due = batcher_.deadline()) {
            if (*due <= now) return std::chrono::milliseconds(0);
            auto left = std::chrono::ceil<std::chrono::milliseconds>(*due - now);
            if (left < budget) budget = left;
        }
        return budget;
    }

    // Empty result means the batch was enqueued.
    std::optional<PollerExit> deliver(Batch<P> batch) {
        switch (channel_->send(std::move(batch), cancel_, policy_.stall_timeout)) {
            case SendStatus::Sent:
                ++batches_sent_;
                return std::nullopt;
            case SendStatus::Closed:
                return PollerExit::ConsumerGone;
            case SendStatus::Cancelled:
                return PollerExit::Cancelled;
            case SendStatus::TimedOut:
                return PollerExit::Stalled;
        }
        return PollerExit::Cancelled;
    }

    // One non-blocking attempt to hand over the partial batch.
    PollerExit abandon() {
        if (auto rest = batcher_.flush()) {
            if (channel_->try_send(std::move(*rest))) ++batches_sent_;
        }
        return PollerExit::Cancelled;
    }

    std::unique_ptr<RecordDecoder<P>> decoder_;
    CancellationToken cancel_;
    std::shared_ptr<Channel> channel_;
    Batcher<P> batcher_;
    CancellationPolicy policy_;
    size_t batches_sent_ = 0;
};

// Caller-side capability for one running stream: the cancellation
// source, the poller thread and the receiving end of the channel.
// Move-only. Destruction cancels, discards undelivered batches and
// joins the thread.
template<typename P>
class StreamHandle {
public:
    using Channel = DeliveryChannel<Batch<P>>;

    StreamHandle(CancellationSource cancel,
                 std::shared_ptr<Channel> channel,
                 std::thread thread,
                 std::unique_ptr<PollerExit> exit)
        : cancel_(std::move(cancel)),
          channel_(std::move(channel)),
          thread_(std::move(thread)),
          exit_(std::move(exit)) {}

    StreamHandle(StreamHandle&&) noexcept = default;

    StreamHandle& operator=(StreamHandle&& other) noexcept {
        if (this != &other) {
            shutdown();
            cancel_ = std::move(other.cancel_);
            channel_ = std::move(other.channel_);
            thread_ = std::move(other.thread_);
            exit_ = std::move(other.exit_);
        }
        return *this;
    }

    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    ~StreamHandle() { shutdown(); }

    // Every batch available right now, in delivery order. Never blocks.
    std::vector<Batch<P>> poll_batches() {
        if (!channel_) return {};
        return channel_->drain();
    }

    // Idempotent. Batches already queued stay receivable.
    void cancel() {
        if (cancel_.cancel() && channel_) channel_->wake();
    }

    bool is_cancelled() const { return cancel_.is_cancelled(); }

    // The poller has closed its end and everything it sent was taken.
    bool finished() const { return !channel_ || channel_->finished(); }

    size_t queued() const { return channel_ ? channel_->size() : 0; }

    // Blocks until the poller thread exits. Not for the UI thread.
    PollerExit join() {
        if (thread_.joinable()) thread_.join();
        return exit_ ? *exit_ : PollerExit::Running;
    }

private:
    void shutdown() noexcept {
        if (!thread_.joinable()) return;
        cancel();
        channel_->close_receiver();
        thread_.join();
    }

    CancellationSource cancel_;
    std::shared_ptr<Channel> channel_;
    std::thread thread_;
    std::unique_ptr<PollerExit> exit_;
};

// Start polling `decoder` on a dedicated thread.
// Throws std::invalid_argument for bad options and ResourceExhausted
// when the thread cannot be created.
template<typename P>
StreamHandle<P> begin_stream(std::unique_ptr<RecordDecoder<P>> decoder,
                             const StreamOptions& options = {}) {
    if (!decoder) throw std::invalid_argument("begin_stream: decoder is null");
    validate(options);

    CancellationSource cancel;
    auto channel = std::make_shared<DeliveryChannel<Batch<P>>>(options.channel_capacity);
    auto exit = std::make_unique<PollerExit>(PollerExit::Running);
    PollerExit* exit_out = exit.get();

    Poller<P> poller(std::move(decoder), cancel.token(), channel, options);
    std::thread thread;
    try {
        thread = std::thread([p = std::move(poller), exit_out]() mutable {
            *exit_out = p.run();
        });
    } catch (const std::system_error& e) {
        throw ResourceExhausted(std::string("cannot start poller thread: ") + e.what());
    }
    return StreamHandle<P>(std::move(cancel), std::move(channel),
                           std::move(thread), std::move(exit));
}

} // namespace tokflow
