#include "network/url.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace mirage::network {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_unreserved(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
}

bool has_control(std::string_view text) noexcept {
    return std::any_of(text.begin(), text.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return u < 0x20 || u == 0x7F;
    });
}

// Bytes that may not appear literally in a request-target path
bool needs_path_escape(char c) noexcept {
    auto u = static_cast<unsigned char>(c);
    return u <= 0x20 || u >= 0x7F || c == '"' || c == '<' || c == '>' ||
           c == '`' || c == '{' || c == '}' || c == '|' || c == '\\' || c == '^';
}

constexpr char kUpperHex[] = "0123456789ABCDEF";

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

}  // namespace

std::string Url::host_header() const {
    bool default_port = (scheme == "https" && port == "443") ||
                        (scheme == "http" && port == "80");
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return default_port ? h : h + ":" + port;
}

std::string build_target_url(std::string_view target) {
    if (target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0) {
        return std::string(target);
    }
    return "https://" + std::string(target);
}

Result<Url, std::string> parse_url(std::string_view url) {
    using R = Result<Url, std::string>;

    if (has_control(url)) {
        return R::Err("invalid control character in URL");
    }

    Url result;
    std::string_view rest;
    if (url.rfind("https://", 0) == 0) {
        result.scheme = "https";
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        result.scheme = "http";
        rest = url.substr(7);
    } else {
        return R::Err("unsupported scheme in " + std::string(url));
    }

    // Fragments are never sent upstream
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    auto path_start = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_start);
    std::string_view target = path_start == std::string_view::npos
        ? std::string_view{}
        : rest.substr(path_start);

    if (authority.find('@') != std::string_view::npos) {
        return R::Err("user info is not supported in target URL");
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return R::Err("missing ']' in host");
        }
        host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return R::Err("invalid port after host");
            }
            port = after.substr(1);
        }
    } else {
        if (authority.find(']') != std::string_view::npos) {
            return R::Err("unexpected ']' in host");
        }
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (host.empty()) {
        return R::Err("missing host in " + std::string(url));
    }
    if (host.find(' ') != std::string_view::npos) {
        return R::Err("invalid character \" \" in host name");
    }

    if (!port.empty()) {
        if (port.size() > 5 || !std::all_of(port.begin(), port.end(),
                                           [](char c) { return c >= '0' && c <= '9'; })) {
            return R::Err("invalid port \"" + std::string(port) + "\"");
        }
        if (std::stoi(std::string(port)) > 65535) {
            return R::Err("port out of range: " + std::string(port));
        }
    }

    result.host = std::string(host);
    result.port = port.empty() ? (result.is_secure() ? "443" : "80") : std::string(port);

    if (target.empty()) {
        result.target = "/";
    } else if (target.front() == '?') {
        result.target = "/" + std::string(target);
    } else {
        result.target = std::string(target);
    }

    return R::Ok(std::move(result));
}

std::optional<std::string> percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= text.size()) {
                return std::nullopt;
            }
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string query_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (is_unreserved(c)) {
            out.push_back(c);
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            auto u = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(kUpperHex[u >> 4]);
            out.push_back(kUpperHex[u & 0x0F]);
        }
    }
    return out;
}

Result<std::optional<std::string>, std::string>
find_query_param(std::string_view query, std::string_view key) {
    using R = Result<std::optional<std::string>, std::string>;

    for (auto pair : split(query, '&')) {
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        auto raw_key = pair.substr(0, eq);
        auto decoded_key = percent_decode(raw_key);
        if (!decoded_key || *decoded_key != key) {
            continue;
        }
        auto raw_value = eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
        auto decoded = percent_decode(raw_value);
        if (!decoded) {
            return R::Err("invalid URL escape in " + std::string(key) + " parameter");
        }
        return R::Ok(std::move(decoded));
    }
    return R::Ok(std::nullopt);
}

Result<std::string, std::string> normalize_target(std::string_view target) {
    using R = Result<std::string, std::string>;

    auto qpos = target.find('?');
    std::string out;
    for (char c : target.substr(0, qpos)) {
        if (needs_path_escape(c)) {
            auto u = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(kUpperHex[u >> 4]);
            out.push_back(kUpperHex[u & 0x0F]);
        } else {
            out.push_back(c);
        }
    }
    if (qpos == std::string_view::npos || qpos + 1 == target.size()) {
        return R::Ok(std::move(out));
    }

    std::vector<std::pair<std::string, std::string>> pairs;
    for (auto pair : split(target.substr(qpos + 1), '&')) {
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        auto k = percent_decode(pair.substr(0, eq));
        auto v = percent_decode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
        if (!k || !v) {
            return R::Err("failed to parse query: invalid URL escape");
        }
        pairs.emplace_back(std::move(*k), std::move(*v));
    }

    std::stable_sort(pairs.begin(), pairs.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    char sep = '?';
    for (const auto& [k, v] : pairs) {
        out.push_back(sep);
        out += query_escape(k);
        out.push_back('=');
        out += query_escape(v);
        sep = '&';
    }
    return R::Ok(std::move(out));
}

}  // namespace mirage::network
