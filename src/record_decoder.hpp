#pragma once
#include "stream_types.hpp"
#include <chrono>
#include <optional>
#include <utility>

namespace tokflow {

template<typename P>
struct DecodeStep {
    enum class Kind { Record, Pending, End };

    Kind kind = Kind::Pending;
    std::optional<StreamOutcome<P>> outcome; // set only for Record

    static DecodeStep record(StreamOutcome<P> o) {
        DecodeStep step;
        step.kind = Kind::Record;
        step.outcome.emplace(std::move(o));
        return step;
    }
    static DecodeStep pending() { return DecodeStep{}; }
    static DecodeStep end() {
        DecodeStep step;
        step.kind = Kind::End;
        return step;
    }
};

// Pull-side contract the poller drives from its own thread.
//
// next() waits at most `timeout` for one record. Pending means nothing
// arrived in time; End means the sequence is exhausted and next() will
// not be called again. An error record is terminal.
template<typename P>
class RecordDecoder {
public:
    virtual ~RecordDecoder() = default;
    virtual DecodeStep<P> next(std::chrono::milliseconds timeout) = 0;
};

} // namespace tokflow
