#pragma once

#include "core/config.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace mirage::output {

/// Console output for proxy activity
class ConsoleLogger {
public:
    /// Log the active configuration and the admin endpoints
    void log_configuration(const Config& config) const;

    /// Log one served request
    /// Server errors go out at warn level, everything else at info
    void log_request(
        std::string_view remote,
        std::string_view method,
        std::string_view uri,
        unsigned status,
        std::chrono::milliseconds elapsed
    );

    /// Log the stored recording count at shutdown
    void log_shutdown(std::size_t total_recordings) const;

    /// Requests logged so far
    [[nodiscard]] std::uint64_t request_count() const noexcept;

private:
    std::atomic<std::uint64_t> request_count_{0};
};

}  // namespace mirage::output
