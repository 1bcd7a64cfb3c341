#pragma once

#include "core/status.hpp"
#include <optional>
#include <shared_mutex>
#include <string_view>

namespace mirage::proxy {

/// Dispatch mode of the proxy
enum class Mode {
    Record,
    Playback
};

[[nodiscard]] const char* to_string(Mode mode) noexcept;

/// Parse exactly "record" or "playback"
[[nodiscard]] std::optional<Mode> parse_mode(std::string_view value) noexcept;

/// Current proxy mode, shared between the proxy handler and admin endpoints
/// Reads and writes are safe from any thread
class ModeController {
public:
    explicit ModeController(Mode initial) noexcept;

    ModeController(const ModeController&) = delete;
    ModeController& operator=(const ModeController&) = delete;

    [[nodiscard]] Mode mode() const;

    /// Switch mode; setting the current mode is a no-op
    void set_mode(Mode mode);

    /// Switch mode from its textual form
    /// @return the new mode, or InvalidMode with state left unchanged
    [[nodiscard]] Result<Mode, Error> set_mode(std::string_view value);

private:
    mutable std::shared_mutex mutex_;
    Mode mode_;
};

}  // namespace mirage::proxy
