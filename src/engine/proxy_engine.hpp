#pragma once

#include "admin/management_handler.hpp"
#include "core/config.hpp"
#include "output/console_logger.hpp"
#include "proxy/mode_controller.hpp"
#include "proxy/proxy_handler.hpp"
#include "proxy/session_stats.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
#include "storage/repository.hpp"
#include <atomic>
#include <memory>

namespace mirage {

/// Record/playback proxy
/// Wires storage, upstream client, handlers and the HTTP server together
class ProxyEngine {
public:
    /// Create the proxy engine
    /// @param config Application configuration (validated)
    /// @throws std::runtime_error when the storage root cannot be created
    explicit ProxyEngine(const Config& config);

    ~ProxyEngine();

    // Non-copyable, non-movable
    ProxyEngine(const ProxyEngine&) = delete;
    ProxyEngine& operator=(const ProxyEngine&) = delete;

    /// Start serving (blocks until shutdown)
    void run();

    /// Request graceful shutdown (thread-safe, async-signal-safe)
    void request_shutdown() noexcept;

private:
    void setup_logging();

    const Config& config_;

    // Shared proxy state
    std::shared_ptr<proxy::ModeController> mode_;
    std::shared_ptr<proxy::Statistics> stats_;
    std::shared_ptr<proxy::RequestHistory> history_;
    std::shared_ptr<storage::Repository> repository_;

    // Request handling
    std::unique_ptr<proxy::ProxyHandler> proxy_handler_;
    std::unique_ptr<admin::ManagementHandler> management_handler_;
    std::unique_ptr<server::Router> router_;

    // Output components
    std::shared_ptr<output::ConsoleLogger> console_;
    std::unique_ptr<server::HttpServer> server_;

    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace mirage
