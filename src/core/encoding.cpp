#include "core/encoding.hpp"
#include <openssl/evp.h>
#include <array>
#include <ctime>
#include <stdexcept>

namespace mirage {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

bool parse_digits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

}  // namespace

// ============================================================================
// Sha256
// ============================================================================

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new())
{
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(std::string_view data) {
    if (data.empty()) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256::hex_digest() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(kHexDigits[digest[i] >> 4]);
        hex.push_back(kHexDigits[digest[i] & 0x0F]);
    }
    return hex;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size())
    );
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::optional<std::string> base64_decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::string{};
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string out(3 * (encoded.size() / 4), '\0');
    int written = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(encoded.data()),
        static_cast<int>(encoded.size())
    );
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the zero bytes produced by padding
    std::size_t padding = 0;
    if (encoded.back() == '=') {
        ++padding;
        if (encoded[encoded.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

// ============================================================================
// RFC 3339
// ============================================================================

std::string format_rfc3339(WallTime time) {
    auto since_epoch = time.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs).count();

    std::time_t tt = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::array<char, 32> buf{};
    std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf.data());

    if (nanos > 0) {
        std::string frac = std::to_string(nanos);
        frac.insert(0, 9 - frac.size(), '0');
        while (!frac.empty() && frac.back() == '0') {
            frac.pop_back();
        }
        out += '.';
        out += frac;
    }
    out += 'Z';
    return out;
}

Result<WallTime, std::string> parse_rfc3339(std::string_view text) {
    using R = Result<WallTime, std::string>;

    // YYYY-MM-DDTHH:MM:SS
    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (text.size() < 20 ||
        !parse_digits(text, 0, 4, year) || text[4] != '-' ||
        !parse_digits(text, 5, 2, month) || text[7] != '-' ||
        !parse_digits(text, 8, 2, day) || (text[10] != 'T' && text[10] != 't') ||
        !parse_digits(text, 11, 2, hour) || text[13] != ':' ||
        !parse_digits(text, 14, 2, minute) || text[16] != ':' ||
        !parse_digits(text, 17, 2, second)) {
        return R::Err("invalid RFC 3339 timestamp: " + std::string(text));
    }

    std::size_t pos = 19;
    std::int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return R::Err("invalid RFC 3339 fraction: " + std::string(text));
        }
        for (std::size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    int offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        int off_h = 0, off_m = 0;
        if (!parse_digits(text, pos + 1, 2, off_h) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !parse_digits(text, pos + 4, 2, off_m)) {
            return R::Err("invalid RFC 3339 offset: " + std::string(text));
        }
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
        pos += 6;
    } else {
        return R::Err("missing RFC 3339 offset: " + std::string(text));
    }

    if (pos != text.size()) {
        return R::Err("trailing characters in timestamp: " + std::string(text));
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t utc = timegm(&tm);

    auto tp = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(static_cast<std::int64_t>(utc) - offset_seconds) +
            std::chrono::nanoseconds(nanos)
        )
    );
    return R::Ok(tp);
}

}  // namespace mirage
