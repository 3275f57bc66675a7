#pragma once
#include <atomic>
#include <memory>

namespace tokflow {

// Read-only view of a CancellationSource. Cheap to copy; a default
// constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const {
        return state_ && state_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<const std::atomic<bool>> state_;
};

// Single writer of a cancellation flag. The flag goes from active to
// cancelled once and never back.
class CancellationSource {
public:
    CancellationSource()
        : state_(std::make_shared<std::atomic<bool>>(false)) {}

    // Returns true only for the call that performed the transition.
    bool cancel() {
        if (!state_) return false;
        return !state_->exchange(true, std::memory_order_acq_rel);
    }

    bool is_cancelled() const {
        return state_ && state_->load(std::memory_order_acquire);
    }

    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace tokflow
