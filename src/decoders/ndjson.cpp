#include "ndjson.hpp"
#include "../util.hpp"

#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace tokflow {

static json::json_pointer make_pointer(const std::string& text, const char* what) {
    try {
        return json::json_pointer(text);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("invalid ") + what + " '" + text +
                                    "': " + e.what());
    }
}

NdjsonDecoder::NdjsonDecoder(std::unique_ptr<ByteSource> source, NdjsonOptions options)
    : source_(std::move(source)),
      options_(std::move(options)),
      done_ptr_(make_pointer(options_.done_pointer, "done_pointer")) {
    if (!source_) throw std::invalid_argument("NdjsonDecoder: source is null");
    if (!options_.error_pointer.empty())
        error_ptr_ = make_pointer(options_.error_pointer, "error_pointer");
}

DecodeStep<json> NdjsonDecoder::next(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto outcome = take_line(eof_))
            return DecodeStep<json>::record(std::move(*outcome));
        if (eof_) return DecodeStep<json>::end();

        if (buffer_.size() > options_.max_line_bytes) {
            return DecodeStep<json>::record(StreamOutcome<json>::failure(
                {StreamErrorKind::Decode,
                 "record on line " + std::to_string(line_no_ + 1) + " exceeds " +
                     std::to_string(options_.max_line_bytes) + " bytes"}));
        }

        auto left = std::chrono::ceil<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() < 0) left = std::chrono::milliseconds(0);

        ReadResult r = source_->read(buffer_, left);
        switch (r.status) {
            case ReadStatus::Data:
                break;
            case ReadStatus::Timeout:
                return DecodeStep<json>::pending();
            case ReadStatus::Eof:
                eof_ = true;
                break;
            case ReadStatus::Error:
                eof_ = true;
                return DecodeStep<json>::record(StreamOutcome<json>::failure(
                    {StreamErrorKind::Transport, r.error}));
        }
    }
}

std::optional<StreamOutcome<json>> NdjsonDecoder::take_line(bool at_eof) {
    while (true) {
        std::string line;
        size_t nl = buffer_.find('\n');
        if (nl == std::string::npos) {
            if (!at_eof || buffer_.empty()) return std::nullopt;
            line.swap(buffer_);
        } else {
            line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
        }
        ++line_no_;

        line = trim(line);
        if (line.empty() || is_hex_digits(line)) continue;
        if (auto outcome = decode_line(line)) return outcome;
    }
}

std::optional<StreamOutcome<json>> NdjsonDecoder::decode_line(const std::string& line) {
    json record;
    try {
        record = json::parse(line);
    } catch (const json::parse_error& e) {
        if (options_.skip_malformed) {
            ++skipped_;
            std::cerr << "[ndjson] Skipping malformed line " << line_no_ << ": "
                      << e.what() << "\n";
            return std::nullopt;
        }
        return StreamOutcome<json>::failure(
            {StreamErrorKind::Decode,
             "malformed record on line " + std::to_string(line_no_) + ": " + e.what()});
    }
    ++records_;

    if (error_ptr_ && record.contains(*error_ptr_)) {
        const json& err = record.at(*error_ptr_);
        if (err.is_string()) {
            return StreamOutcome<json>::failure(
                {StreamErrorKind::Transport, "service error: " + err.get<std::string>()});
        }
    }

    bool done = false;
    if (record.contains(done_ptr_)) {
        const json& flag = record.at(done_ptr_);
        done = flag.is_boolean() && flag.get<bool>();
    }
    return StreamOutcome<json>::success(Event<json>{std::move(record), done});
}

} // namespace tokflow
