#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared aliases used by the registry, the dispatcher and every engine.
//
// For the engines, include the matching header under "mcpcall/transport/".

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace mcpcall {

using Json = nlohmann::json;
using Millis = std::chrono::milliseconds;

// HTTP header names compare case-insensitively (RFC 9110)
struct HeaderNameLess {
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
        return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
            [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
    }
};

// "content-type" and "Content-Type" are one entry; the first spelling stored wins
using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

}  // namespace mcpcall
