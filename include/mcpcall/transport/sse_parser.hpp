#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mcpcall {

// ─────────────────────────────────────────────────────────────────────────────
// Server-Sent Events framing
// ─────────────────────────────────────────────────────────────────────────────
// An event is a run of field lines closed by a blank line:
//
//   event: message
//   id: 12
//   data: {"jsonrpc":"2.0",
//   data:  "id":"mc-1-1","result":{}}
//
// Repeated data lines are joined with '\n'. Lines starting with ':' are
// comments (servers send them as keepalives). Unknown fields are ignored.

struct SseEvent {
    std::optional<std::string> event;
    std::optional<std::string> id;
    std::string data;
    std::optional<std::uint32_t> retry;  // reconnection hint, ms

    // Data passed max_event_size: `data` is truncated, `data_bytes` is the
    // size the event would have had.
    bool oversized{false};
    std::size_t data_bytes{0};

    [[nodiscard]] bool is_named(std::string_view name) const {
        return event.has_value() && (*event == name);
    }
};

class SseBufferOverflowError : public std::runtime_error {
public:
    SseBufferOverflowError(std::size_t size, std::size_t limit)
        : std::runtime_error("SSE line of " + std::to_string(size) +
                             " bytes has no terminator within the " +
                             std::to_string(limit) + " byte limit")
        , buffer_size(size)
        , buffer_limit(limit)
    {}

    std::size_t buffer_size;
    std::size_t buffer_limit;
};

struct SseParserConfig {
    // Bytes of one line still waiting for its '\n'
    std::size_t max_buffer_size{2 * 1024 * 1024};
    // Bytes of one event's joined data
    std::size_t max_event_size{1024 * 1024};
};

class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Events completed by `chunk`, in stream order. Chunks may split lines
    /// anywhere, including between '\r' and '\n'.
    /// Throws SseBufferOverflowError when an unterminated line passes
    /// max_buffer_size.
    [[nodiscard]] std::vector<SseEvent> feed(std::string_view chunk);

    /// End of stream: the last line and event do not need their terminators.
    [[nodiscard]] std::optional<SseEvent> finish();

    void reset();

    /// Complete lines consumed so far, blank lines and comments included.
    /// The SSE engine treats a change as stream activity.
    [[nodiscard]] std::uint64_t lines_seen() const noexcept { return lines_seen_; }

    [[nodiscard]] std::size_t buffer_size() const noexcept { return pending_.size() - consumed_; }

    [[nodiscard]] const SseParserConfig& config() const noexcept { return config_; }

private:
    struct Draft {
        SseEvent event;
        bool has_data{false};

        [[nodiscard]] bool empty() const noexcept {
            return (has_data == false) && (event.event.has_value() == false) && (event.id.has_value() == false);
        }
    };

    SseParserConfig config_;
    std::string pending_;
    std::size_t consumed_{0};
    std::uint64_t lines_seen_{0};
    Draft draft_;

    [[nodiscard]] std::optional<std::string_view> next_line();
    void apply_field(std::string_view name, std::string_view value);
    void add_data(std::string_view value);
    [[nodiscard]] std::optional<SseEvent> dispatch();
};

}  // namespace mcpcall
