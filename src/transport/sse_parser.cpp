#include "mcpcall/transport/sse_parser.hpp"

#include <charconv>
#include <utility>

namespace mcpcall {

namespace {

// Consumed bytes are dropped from the front of the buffer past this size
constexpr std::size_t kCompactAfter = 4096;

std::string_view without_cr(std::string_view line) {
    if ((line.empty() == false) && (line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

// "name: value", "name:value" or a bare "name"
std::pair<std::string_view, std::string_view> split_field(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return {line, {}};
    }
    std::string_view value = line.substr(colon + 1);
    if ((value.empty() == false) && (value.front() == ' ')) {
        value.remove_prefix(1);
    }
    return {line.substr(0, colon), value};
}

std::optional<std::uint32_t> parse_retry(std::string_view digits) {
    std::uint32_t ms = 0;
    const char* end = digits.data() + digits.size();
    const auto [stop, ec] = std::from_chars(digits.data(), end, ms);
    if ((ec != std::errc{}) || (stop != end)) {
        return std::nullopt;
    }
    return ms;
}

}  // namespace

std::optional<std::string_view> SseParser::next_line() {
    const auto newline = pending_.find('\n', consumed_);
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    const std::string_view line(pending_.data() + consumed_, newline - consumed_);
    consumed_ = newline + 1;
    ++lines_seen_;
    return without_cr(line);
}

std::vector<SseEvent> SseParser::feed(std::string_view chunk) {
    pending_.append(chunk);

    std::vector<SseEvent> completed;
    while (const auto line = next_line()) {
        if (line->empty()) {
            if (auto event = dispatch()) {
                completed.push_back(std::move(*event));
            }
        } else if (line->front() != ':') {
            const auto [name, value] = split_field(*line);
            apply_field(name, value);
        }
    }

    if (consumed_ > kCompactAfter) {
        pending_.erase(0, consumed_);
        consumed_ = 0;
    }

    if (buffer_size() > config_.max_buffer_size) {
        throw SseBufferOverflowError(buffer_size(), config_.max_buffer_size);
    }
    return completed;
}

std::optional<SseEvent> SseParser::finish() {
    if (consumed_ < pending_.size()) {
        const std::string_view tail = without_cr(std::string_view(pending_).substr(consumed_));
        ++lines_seen_;
        if ((tail.empty() == false) && (tail.front() != ':')) {
            const auto [name, value] = split_field(tail);
            apply_field(name, value);
        }
    }
    pending_.clear();
    consumed_ = 0;
    return dispatch();
}

void SseParser::reset() {
    pending_.clear();
    consumed_ = 0;
    lines_seen_ = 0;
    draft_ = Draft{};
}

void SseParser::apply_field(std::string_view name, std::string_view value) {
    if (name == "data") {
        add_data(value);
    } else if (name == "event") {
        draft_.event.event = std::string(value);
    } else if (name == "id") {
        draft_.event.id = std::string(value);
    } else if (name == "retry") {
        if (auto ms = parse_retry(value)) {
            draft_.event.retry = ms;
        }
    }
}

void SseParser::add_data(std::string_view value) {
    SseEvent& event = draft_.event;
    const bool continuation = draft_.has_data;
    draft_.has_data = true;
    event.data_bytes += value.size() + (continuation ? 1 : 0);

    if (event.oversized) {
        return;
    }
    if (event.data_bytes > config_.max_event_size) {
        // The whole event is rejected downstream; keep only what was stored
        event.oversized = true;
        return;
    }
    if (continuation) {
        event.data.push_back('\n');
    }
    event.data.append(value);
}

std::optional<SseEvent> SseParser::dispatch() {
    if (draft_.empty()) {
        draft_ = Draft{};
        return std::nullopt;
    }
    SseEvent event = std::move(draft_.event);
    draft_ = Draft{};
    return event;
}

}  // namespace mcpcall
