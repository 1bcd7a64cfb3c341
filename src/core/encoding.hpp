#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace mirage {

/// Incremental SHA-256 over OpenSSL EVP
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    /// Feed more bytes into the digest
    void update(std::string_view data);

    /// Finish and return lowercase hex (64 chars)
    /// The object must not be updated afterwards
    [[nodiscard]] std::string hex_digest();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

/// Standard base64 (RFC 4648, padded)
[[nodiscard]] std::string base64_encode(std::string_view data);

/// Decode standard padded base64, nullopt on malformed input
[[nodiscard]] std::optional<std::string> base64_decode(std::string_view encoded);

/// RFC 3339 in UTC with nanoseconds, trailing zeros trimmed
/// e.g. "2024-03-01T12:00:05.1234Z"
[[nodiscard]] std::string format_rfc3339(WallTime time);

/// Parse RFC 3339 ("Z" or "+hh:mm"/"-hh:mm" offset, optional fraction)
[[nodiscard]] Result<WallTime, std::string> parse_rfc3339(std::string_view text);

}  // namespace mirage
