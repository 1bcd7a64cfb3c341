#pragma once

#include "core/status.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace mirage::network {

/// Absolute http(s) URL split for an outbound connection
struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;    // without brackets for IPv6 literals
    std::string port;    // explicit or scheme default
    std::string target;  // origin-form: path plus optional "?query"

    [[nodiscard]] bool is_secure() const noexcept {
        return scheme == "https";
    }

    /// Value for the Host header (port omitted when it is the scheme default)
    [[nodiscard]] std::string host_header() const;
};

/// Prefix "https://" unless the target already names http or https
[[nodiscard]] std::string build_target_url(std::string_view target);

/// Parse an absolute http(s) URL
[[nodiscard]] Result<Url, std::string> parse_url(std::string_view url);

/// Decode a query component ('+' is a space); nullopt on a bad %-escape
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view text);

/// Escape for use inside a query component (space becomes '+')
[[nodiscard]] std::string query_escape(std::string_view text);

/// Decoded value of the first `key` parameter in a raw query string
/// @return nullopt when absent, Err when its encoding is invalid
[[nodiscard]] Result<std::optional<std::string>, std::string>
find_query_param(std::string_view query, std::string_view key);

/// Encode an origin-form target for the wire
/// The path gets unsafe bytes %-escaped; query pairs are decoded,
/// escaped again and stably sorted by key
[[nodiscard]] Result<std::string, std::string> normalize_target(std::string_view target);

}  // namespace mirage::network
