#pragma once
#include "stream_types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace tokflow {

// Text state built from a stream of JSON records. The host applies each
// outcome as the consumer loop hands it over and renders take_new_text()
// once per frame.
class Transcript {
public:
    using Clock = std::chrono::steady_clock;

    // Throws std::invalid_argument when text_pointer does not parse.
    explicit Transcript(const std::string& text_pointer = "/message/content");

    void apply(const StreamOutcome<nlohmann::json>& outcome);

    const std::string& text() const { return text_; }

    // Text appended since the previous call.
    std::string take_new_text();

    const std::optional<StreamError>& error() const { return error_; }
    bool complete() const { return complete_; }
    size_t records() const { return records_; }
    size_t chars() const { return text_.size(); }

    // From construction (or reset) to the first non-empty text.
    std::optional<std::chrono::milliseconds> time_to_first_content() const {
        return first_content_;
    }

    void reset();

private:
    nlohmann::json::json_pointer text_ptr_;
    std::string text_;
    size_t rendered_ = 0;
    std::optional<StreamError> error_;
    bool complete_ = false;
    size_t records_ = 0;
    Clock::time_point started_;
    std::optional<std::chrono::milliseconds> first_content_;
};

} // namespace tokflow
