#include "proxy/mode_controller.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <string>

namespace mirage::proxy {

const char* to_string(Mode mode) noexcept {
    switch (mode) {
        case Mode::Record: return "record";
        case Mode::Playback: return "playback";
    }
    return "unknown";
}

std::optional<Mode> parse_mode(std::string_view value) noexcept {
    if (value == "record") {
        return Mode::Record;
    }
    if (value == "playback") {
        return Mode::Playback;
    }
    return std::nullopt;
}

ModeController::ModeController(Mode initial) noexcept
    : mode_(initial)
{}

Mode ModeController::mode() const {
    std::shared_lock lock(mutex_);
    return mode_;
}

void ModeController::set_mode(Mode mode) {
    Mode previous;
    {
        std::unique_lock lock(mutex_);
        previous = mode_;
        mode_ = mode;
    }
    if (previous != mode) {
        spdlog::info("Mode switched: {} -> {}", to_string(previous), to_string(mode));
    }
}

Result<Mode, Error> ModeController::set_mode(std::string_view value) {
    auto mode = parse_mode(value);
    if (!mode) {
        return Result<Mode, Error>::Err(Error::invalid_mode(
            "invalid mode: " + std::string(value) + " (must be 'record' or 'playback')"
        ));
    }
    set_mode(*mode);
    return Result<Mode, Error>::Ok(*mode);
}

}  // namespace mirage::proxy
