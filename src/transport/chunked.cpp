#include "chunked.hpp"

#include <algorithm>
#include <cctype>

namespace tokflow {

static constexpr size_t kMaxFramingLine = 4096;

bool ChunkedBodyDecoder::fail(const std::string& why) {
    state_ = State::Failed;
    error_ = why;
    return false;
}

// Chunk size is hex, may have extensions after ';'
bool ChunkedBodyDecoder::parse_size_line() {
    std::string digits = line_.substr(0, line_.find(';'));
    while (!digits.empty() && std::isspace(static_cast<unsigned char>(digits.back())))
        digits.pop_back();
    if (digits.empty() || digits.size() > 15)
        return fail("bad chunk size line: '" + line_ + "'");

    size_t size = 0;
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return fail("bad chunk size line: '" + line_ + "'");
        size = size * 16 + static_cast<size_t>(
            std::isdigit(static_cast<unsigned char>(c))
                ? c - '0'
                : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
    }
    remaining_ = size;
    state_ = (size == 0) ? State::Trailer : State::Data;
    return true;
}

bool ChunkedBodyDecoder::feed(const char* data, size_t len, std::string& out) {
    size_t pos = 0;
    while (pos < len) {
        switch (state_) {
            case State::Failed:
                return false;

            case State::Done:
                return true; // anything after the last chunk is ignored

            case State::Data: {
                size_t take = std::min(remaining_, len - pos);
                out.append(data + pos, take);
                pos += take;
                remaining_ -= take;
                if (remaining_ == 0) state_ = State::DataEnd;
                break;
            }

            case State::Size:
            case State::DataEnd:
            case State::Trailer: {
                char c = data[pos++];
                if (c != '\n') {
                    line_ += c;
                    if (line_.size() > kMaxFramingLine)
                        return fail("chunk framing line too long");
                    break;
                }
                if (!line_.empty() && line_.back() == '\r') line_.pop_back();

                if (state_ == State::Size) {
                    if (!parse_size_line()) return false;
                } else if (state_ == State::DataEnd) {
                    if (!line_.empty())
                        return fail("missing CRLF after chunk data");
                    state_ = State::Size;
                } else if (line_.empty()) {
                    state_ = State::Done; // blank line ends the trailers
                }
                line_.clear();
                break;
            }
        }
    }
    return state_ != State::Failed;
}

} // namespace tokflow
