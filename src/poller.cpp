#include "poller.hpp"

#include <iostream>

namespace tokflow {

const char* poller_exit_to_string(PollerExit exit) {
    switch (exit) {
        case PollerExit::Running: return "running";
        case PollerExit::Completed: return "completed";
        case PollerExit::Failed: return "failed";
        case PollerExit::Cancelled: return "cancelled";
        case PollerExit::ConsumerGone: return "consumer-gone";
        case PollerExit::Stalled: return "stalled";
    }
    return "unknown";
}

void log_poller_exit(PollerExit exit, size_t batches_sent) {
    // Completed, failed and cancelled streams are visible to the consumer.
    if (exit != PollerExit::Stalled) return;
    std::cerr << "[poller] Consumer stopped draining; abandoned stream after "
              << batches_sent << " batches\n";
}

void log_decoder_exception(const char* what) {
    std::cerr << "[poller] Decoder threw: " << what << "\n";
}

} // namespace tokflow
