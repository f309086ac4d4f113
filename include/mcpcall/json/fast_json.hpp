#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON Parsing
// ─────────────────────────────────────────────────────────────────────────────
//
// Inbound payloads (SSE data, WebSocket frames, child-process stdout, the
// service configuration file) are parsed with simdjson and materialised as
// nlohmann::json, which the rest of the library manipulates and serialises.
//
//   if (looks_like_json(payload)) {
//       auto parsed = mcpcall::fast_parse(payload);
//       if (parsed) { use(*parsed); }
//   }
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcpcall {

struct JsonParseError {
    std::string message;
};

using JsonParseResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    // Nesting limit; deeper documents are rejected instead of recursing
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Parse a complete document. Not thread-safe; one parser per thread.
    [[nodiscard]] JsonParseResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;

    [[nodiscard]] JsonParseResult convert(simdjson::ondemand::value value, std::size_t depth);
};

/// Parse with a thread-local FastJsonParser.
[[nodiscard]] JsonParseResult fast_parse(std::string_view text);

/// Strip ASCII whitespace (space, tab, CR, LF) from both ends.
[[nodiscard]] std::string_view trim_ascii(std::string_view text) noexcept;

/// True when the trimmed text starts with '{' or '['. Payloads that fail
/// this check are never handed to the parser.
[[nodiscard]] bool looks_like_json(std::string_view text) noexcept;

/// Name of the simdjson kernel in use ("haswell", "arm64", "fallback", ...)
[[nodiscard]] std::string fast_json_implementation();

}  // namespace mcpcall
