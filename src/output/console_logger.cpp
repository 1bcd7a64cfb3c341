#include "output/console_logger.hpp"
#include <spdlog/spdlog.h>

namespace mirage::output {

void ConsoleLogger::log_configuration(const Config& config) const {
    spdlog::info("Listening on {} ({} threads)", config.address(), config.server.threads);
    spdlog::info("Mode: {} | Recordings: {} | TLS verify: {}",
                 config.mode.default_mode,
                 config.storage.path,
                 config.tls.skip_verify ? "off" : "on");
    spdlog::info("Proxy: http://{}/proxy?target=<host/path>", config.address());
    spdlog::info("Admin: /admin/status /admin/mode /admin/history /admin/recordings /admin/recording?id=<id>");
}

void ConsoleLogger::log_request(
    std::string_view remote,
    std::string_view method,
    std::string_view uri,
    unsigned status,
    std::chrono::milliseconds elapsed
) {
    auto n = request_count_.fetch_add(1, std::memory_order_relaxed) + 1;

    if (status >= 500) {
        spdlog::warn("#{} {} {} {} -> {} ({}ms)", n, remote, method, uri, status, elapsed.count());
    } else {
        spdlog::info("#{} {} {} {} -> {} ({}ms)", n, remote, method, uri, status, elapsed.count());
    }
}

void ConsoleLogger::log_shutdown(std::size_t total_recordings) const {
    spdlog::info("Shutting down with {} recordings stored", total_recordings);
}

std::uint64_t ConsoleLogger::request_count() const noexcept {
    return request_count_.load(std::memory_order_relaxed);
}

}  // namespace mirage::output
