#pragma once

#include "proxy/mode_controller.hpp"
#include "proxy/session_stats.hpp"
#include "server/http_message.hpp"
#include "server/router.hpp"
#include "storage/repository.hpp"
#include <chrono>
#include <memory>

namespace mirage::admin {

/// Administrative endpoints: mode switching, counters, history and recordings
/// Does not take the proxy lock; each shared structure guards itself.
class ManagementHandler {
public:
    ManagementHandler(
        std::shared_ptr<proxy::ModeController> mode,
        std::shared_ptr<proxy::Statistics> stats,
        std::shared_ptr<proxy::RequestHistory> history,
        std::shared_ptr<storage::Repository> repository,
        std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now()
    );

    /// Register /admin/* and /health on the router
    void register_routes(server::Router& router);

    /// GET /admin/status
    [[nodiscard]] server::HttpResponse handle_status(const server::HttpRequest& request) const;

    /// GET /admin/mode[?mode=<m>], POST /admin/mode {"mode": "<m>"}
    [[nodiscard]] server::HttpResponse handle_mode(const server::HttpRequest& request);

    /// GET /admin/history
    [[nodiscard]] server::HttpResponse handle_history(const server::HttpRequest& request) const;

    /// GET lists, DELETE clears /admin/recordings
    [[nodiscard]] server::HttpResponse handle_recordings(const server::HttpRequest& request);

    /// GET /admin/recording?id=<fingerprint or uuid>
    [[nodiscard]] server::HttpResponse handle_recording(const server::HttpRequest& request) const;

    /// GET /health
    [[nodiscard]] server::HttpResponse handle_health(const server::HttpRequest& request) const;

private:
    [[nodiscard]] server::HttpResponse switch_mode(const std::string& value, unsigned version);

    std::shared_ptr<proxy::ModeController> mode_;
    std::shared_ptr<proxy::Statistics> stats_;
    std::shared_ptr<proxy::RequestHistory> history_;
    std::shared_ptr<storage::Repository> repository_;
    std::chrono::steady_clock::time_point started_;
};

}  // namespace mirage::admin
