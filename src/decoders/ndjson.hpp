#pragma once
#include "../record_decoder.hpp"
#include "../transport/byte_source.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace tokflow {

struct NdjsonOptions {
    std::string done_pointer = "/done";   // boolean that marks the last record
    std::string error_pointer = "/error"; // string the service sends on failure; "" disables
    bool skip_malformed = false;          // drop unparseable lines instead of failing
    size_t max_line_bytes = 1024 * 1024;
};

// Newline-delimited JSON records read from a ByteSource.
//
// Lines are trimmed; blank lines and lines made only of hex digits
// (chunk-size lines left in by a transport that does not dechunk) are
// skipped. A final line without a newline still counts at EOF.
class NdjsonDecoder : public RecordDecoder<nlohmann::json> {
public:
    // Throws std::invalid_argument when a pointer does not parse.
    NdjsonDecoder(std::unique_ptr<ByteSource> source, NdjsonOptions options = {});

    DecodeStep<nlohmann::json> next(std::chrono::milliseconds timeout) override;

    size_t records() const { return records_; }
    size_t skipped() const { return skipped_; }

private:
    // Decode the next complete line in the buffer, if any.
    std::optional<StreamOutcome<nlohmann::json>> take_line(bool at_eof);
    std::optional<StreamOutcome<nlohmann::json>> decode_line(const std::string& line);

    std::unique_ptr<ByteSource> source_;
    NdjsonOptions options_;
    nlohmann::json::json_pointer done_ptr_;
    std::optional<nlohmann::json::json_pointer> error_ptr_;
    std::string buffer_;
    bool eof_ = false;
    size_t line_no_ = 0;
    size_t records_ = 0;
    size_t skipped_ = 0;
};

} // namespace tokflow
