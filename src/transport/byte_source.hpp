#pragma once
#include <chrono>
#include <string>

namespace tokflow {

enum class ReadStatus { Data, Timeout, Eof, Error };

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::string error; // set when status == Error

    static ReadResult data() { return {ReadStatus::Data, {}}; }
    static ReadResult timeout() { return {ReadStatus::Timeout, {}}; }
    static ReadResult eof() { return {ReadStatus::Eof, {}}; }
    static ReadResult failure(std::string message) {
        return {ReadStatus::Error, std::move(message)};
    }
};

// Opaque byte stream underneath a record decoder.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Append the bytes that arrive within `timeout` to `out`. A zero
    // timeout only collects what is already available. After Eof or
    // Error the source is spent.
    virtual ReadResult read(std::string& out, std::chrono::milliseconds timeout) = 0;
};

} // namespace tokflow
