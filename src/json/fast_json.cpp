#include "mcpcall/json/fast_json.hpp"

#include <cstdint>
#include <utility>

namespace mcpcall {

namespace {

JsonParseResult failure(simdjson::error_code code) {
    return tl::unexpected(JsonParseError{std::string(simdjson::error_message(code))});
}

}  // namespace

JsonParseResult FastJsonParser::parse(std::string_view text) {
    // simdjson reads past the end of its input; the padded copy makes that safe
    const simdjson::padded_string padded(text);

    try {
        simdjson::ondemand::document document;
        if (const auto ec = parser_.iterate(padded).get(document); ec != simdjson::SUCCESS) {
            return failure(ec);
        }

        // Scalar roots are rejected here; every payload we accept is an object or array
        simdjson::ondemand::value root;
        if (const auto ec = document.get_value().get(root); ec != simdjson::SUCCESS) {
            return failure(ec);
        }

        auto converted = convert(root, 0);
        if (!converted) {
            return converted;
        }

        const bool trailing_content = (document.at_end() == false);
        if (trailing_content) {
            return tl::unexpected(JsonParseError{"Trailing content after JSON document"});
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError{e.what()});
    }
}

JsonParseResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError{
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"});
    }

    simdjson::ondemand::json_type type{};
    if (const auto ec = value.type().get(type); ec != simdjson::SUCCESS) {
        return failure(ec);
    }

    switch (type) {
        case simdjson::ondemand::json_type::object: {
            simdjson::ondemand::object object;
            if (const auto ec = value.get_object().get(object); ec != simdjson::SUCCESS) {
                return failure(ec);
            }

            nlohmann::json result = nlohmann::json::object();
            for (auto field : object) {
                std::string_view key;
                if (const auto ec = field.unescaped_key().get(key); ec != simdjson::SUCCESS) {
                    return failure(ec);
                }
                simdjson::ondemand::value member;
                if (const auto ec = field.value().get(member); ec != simdjson::SUCCESS) {
                    return failure(ec);
                }
                // key points into the parser's string buffer; copy before recursing
                std::string owned_key(key);
                auto converted = convert(member, depth + 1);
                if (!converted) {
                    return converted;
                }
                result[std::move(owned_key)] = std::move(*converted);
            }
            return result;
        }

        case simdjson::ondemand::json_type::array: {
            simdjson::ondemand::array array;
            if (const auto ec = value.get_array().get(array); ec != simdjson::SUCCESS) {
                return failure(ec);
            }

            nlohmann::json result = nlohmann::json::array();
            for (auto element : array) {
                simdjson::ondemand::value item;
                if (const auto ec = std::move(element).get(item); ec != simdjson::SUCCESS) {
                    return failure(ec);
                }
                auto converted = convert(item, depth + 1);
                if (!converted) {
                    return converted;
                }
                result.push_back(std::move(*converted));
            }
            return result;
        }

        case simdjson::ondemand::json_type::string: {
            std::string_view text;
            if (const auto ec = value.get_string().get(text); ec != simdjson::SUCCESS) {
                return failure(ec);
            }
            return nlohmann::json(std::string(text));
        }

        case simdjson::ondemand::json_type::number: {
            std::int64_t as_int = 0;
            if (value.get_int64().get(as_int) == simdjson::SUCCESS) {
                return nlohmann::json(as_int);
            }
            std::uint64_t as_uint = 0;
            if (value.get_uint64().get(as_uint) == simdjson::SUCCESS) {
                return nlohmann::json(as_uint);
            }
            double as_double = 0.0;
            if (const auto ec = value.get_double().get(as_double); ec != simdjson::SUCCESS) {
                return failure(ec);
            }
            return nlohmann::json(as_double);
        }

        case simdjson::ondemand::json_type::boolean: {
            bool flag = false;
            if (const auto ec = value.get_bool().get(flag); ec != simdjson::SUCCESS) {
                return failure(ec);
            }
            return nlohmann::json(flag);
        }

        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
    }

    return tl::unexpected(JsonParseError{"Unknown JSON type"});
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Functions
// ─────────────────────────────────────────────────────────────────────────────

JsonParseResult fast_parse(std::string_view text) {
    thread_local FastJsonParser parser;
    return parser.parse(text);
}

std::string_view trim_ascii(std::string_view text) noexcept {
    constexpr std::string_view kWhitespace{" \t\r\n"};
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

bool looks_like_json(std::string_view text) noexcept {
    const auto trimmed = trim_ascii(text);
    if (trimmed.empty()) {
        return false;
    }
    return (trimmed.front() == '{') || (trimmed.front() == '[');
}

std::string fast_json_implementation() {
    const simdjson::implementation* impl = simdjson::get_active_implementation();
    return std::string(impl->name());
}

}  // namespace mcpcall
