#pragma once
#include <cstddef>
#include <string>

namespace tokflow {

// Incremental decoder for HTTP/1.1 chunked transfer encoding. Raw bytes
// may be split anywhere; payload bytes are appended to `out` as soon as
// they are seen.
class ChunkedBodyDecoder {
public:
    // Returns false on a malformed framing; error() then says why.
    bool feed(const char* data, size_t len, std::string& out);
    bool feed(const std::string& data, std::string& out) {
        return feed(data.data(), data.size(), out);
    }

    // Zero-size chunk and trailers seen.
    bool complete() const { return state_ == State::Done; }
    const std::string& error() const { return error_; }

private:
    enum class State { Size, Data, DataEnd, Trailer, Done, Failed };

    bool fail(const std::string& why);
    bool parse_size_line();

    State state_ = State::Size;
    std::string line_;
    size_t remaining_ = 0;
    std::string error_;
};

} // namespace tokflow
