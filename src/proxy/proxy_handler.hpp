#pragma once

#include "model/interaction.hpp"
#include "proxy/mode_controller.hpp"
#include "proxy/player.hpp"
#include "proxy/recorder.hpp"
#include "proxy/session_stats.hpp"
#include "server/http_message.hpp"
#include <memory>
#include <mutex>

namespace mirage::proxy {

/// Entry point for proxied traffic
/// Resolves the `target` query parameter, then records or replays
/// depending on the current mode. Requests are handled one at a time.
class ProxyHandler {
public:
    ProxyHandler(
        std::shared_ptr<ModeController> mode,
        Recorder recorder,
        Player player,
        std::shared_ptr<Statistics> stats,
        std::shared_ptr<RequestHistory> history
    );

    // Non-copyable (owns the request mutex)
    ProxyHandler(const ProxyHandler&) = delete;
    ProxyHandler& operator=(const ProxyHandler&) = delete;

    /// Handle one inbound request
    /// @return The live or recorded response, or a JSON error:
    ///         400 bad target, 404 playback miss, 500 record/playback failure
    [[nodiscard]] server::HttpResponse handle(const server::HttpRequest& request);

    /// Copy a recorded response onto the wire form
    /// Framing headers are dropped and recomputed by the server for the buffered body,
    /// except Content-Length on a HEAD reply, which describes a body never sent
    [[nodiscard]] static server::HttpResponse to_http_response(
        const model::RecordedResponse& recorded,
        unsigned version,
        bool head_request = false
    );

private:
    /// Inbound headers as a multimap, in arrival order
    [[nodiscard]] static Headers collect_headers(const server::HttpRequest& request);

    std::mutex mutex_;
    std::shared_ptr<ModeController> mode_;
    Recorder recorder_;
    Player player_;
    std::shared_ptr<Statistics> stats_;
    std::shared_ptr<RequestHistory> history_;
};

}  // namespace mirage::proxy
