#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mirage {

// HTTP header multimap: canonical name -> values in arrival order
using Headers = std::map<std::string, std::vector<std::string>>;

// Raw HTTP body bytes (empty means absent)
using Bytes = std::string;

// Wall clock time for persisted timestamps
using WallTime = std::chrono::system_clock::time_point;

// Monotonic clock for measuring forward durations
using Timestamp = std::chrono::steady_clock::time_point;

// Hex SHA-256 of method, url and body
using Fingerprint = std::string;

using DurationMs = std::int64_t;

/// Canonical MIME header key: "x-tenant" -> "X-Tenant"
/// Names containing characters outside token set are returned unchanged
[[nodiscard]] inline std::string canonical_header_key(std::string_view name) {
    std::string key(name);
    for (char c : key) {
        bool token = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                     (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                     c == '!' || c == '#' || c == '$' || c == '%' || c == '&' ||
                     c == '\'' || c == '*' || c == '+' || c == '^' || c == '`' ||
                     c == '|' || c == '~';
        if (!token) {
            return key;
        }
    }

    bool upper = true;
    for (char& c : key) {
        if (upper && c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        } else if (!upper && c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
        upper = (c == '-');
    }
    return key;
}

/// Case-insensitive ASCII comparison for header names
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        auto ca = static_cast<unsigned char>(a[i]);
        auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) {
            return false;
        }
    }
    return true;
}

}  // namespace mirage
