#pragma once

#include "core/status.hpp"
#include "model/interaction.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

namespace mirage::network {

/// Sends one request to a real upstream and returns its whole response
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// @param request Request whose url is an absolute http(s) URL
    /// @return Response snapshot, or UpstreamFailure naming the failed step
    [[nodiscard]] virtual Result<model::RecordedResponse, Error>
    send(const model::RecordedRequest& request) = 0;
};

/// Blocking HTTP/HTTPS client built on Beast
/// Each call runs its own async exchange to completion on a private io_context,
/// so concurrent callers never share connection state.
class HttpClient : public HttpTransport {
public:
    /// @param ssl_ctx Shared SSL context for https targets
    /// @param timeout Limit for each network step (connect, handshake, write, read)
    /// @param max_body_bytes Largest response body accepted
    HttpClient(
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::chrono::milliseconds timeout,
        std::uint64_t max_body_bytes
    );

    [[nodiscard]] Result<model::RecordedResponse, Error>
    send(const model::RecordedRequest& request) override;

private:
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::chrono::milliseconds timeout_;
    std::uint64_t max_body_bytes_;
};

/// True for headers that describe a single connection and are never forwarded
[[nodiscard]] bool is_hop_by_hop_header(std::string_view name) noexcept;

}  // namespace mirage::network
