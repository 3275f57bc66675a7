#include "transcript.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace tokflow {

static json::json_pointer parse_text_pointer(const std::string& text) {
    try {
        return json::json_pointer(text);
    } catch (const json::exception& e) {
        throw std::invalid_argument("invalid text_pointer '" + text + "': " + e.what());
    }
}

Transcript::Transcript(const std::string& text_pointer)
    : text_ptr_(parse_text_pointer(text_pointer)),
      started_(Clock::now()) {}

void Transcript::apply(const StreamOutcome<json>& outcome) {
    if (!outcome.ok()) {
        error_ = outcome.error();
        return;
    }

    const auto& ev = outcome.event();
    ++records_;
    if (ev.payload.contains(text_ptr_)) {
        const json& piece = ev.payload.at(text_ptr_);
        if (piece.is_string()) {
            const auto& s = piece.get_ref<const std::string&>();
            if (!s.empty() && !first_content_) {
                first_content_ = std::chrono::duration_cast<std::chrono::milliseconds>(
                    Clock::now() - started_);
            }
            text_ += s;
        }
    }
    if (ev.done) complete_ = true;
}

std::string Transcript::take_new_text() {
    std::string fresh = text_.substr(rendered_);
    rendered_ = text_.size();
    return fresh;
}

void Transcript::reset() {
    text_.clear();
    rendered_ = 0;
    error_.reset();
    complete_ = false;
    records_ = 0;
    started_ = Clock::now();
    first_content_.reset();
}

} // namespace tokflow
