#include "proxy/recorder.hpp"
#include "network/url.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace mirage::proxy {

Recorder::Recorder(
    std::shared_ptr<storage::Repository> repository,
    std::shared_ptr<network::HttpTransport> transport
)
    : repository_(std::move(repository))
    , transport_(std::move(transport))
{}

Result<model::Interaction, Error> Recorder::handle(const model::RecordedRequest& request) {
    using R = Result<model::Interaction, Error>;

    auto started_wall = std::chrono::system_clock::now();
    auto started = std::chrono::steady_clock::now();

    // Same method, headers and body, pointed at the real target
    model::RecordedRequest forward = request;
    forward.url = network::build_target_url(request.url);

    auto response = transport_->send(forward);
    if (response.is_err()) {
        return R::Err(Error::upstream("failed to forward request: " + response.error().message));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    model::Interaction interaction{
        .id = model::generate_interaction_id(),
        .timestamp = started_wall,
        .request = request,
        .response = std::move(response).take_value(),
        .metadata = model::InteractionMetadata{
            .target = request.url,
            .duration_ms = elapsed.count()
        }
    };

    if (auto stored = repository_->store(interaction); stored.is_err()) {
        spdlog::error("Failed to store interaction for {} {}: {}",
                      request.method, request.url, stored.error().message);
        return R::Err(Error::storage("failed to store interaction: " + stored.error().message));
    }

    spdlog::debug("Recorded {} {} -> {} in {}ms", request.method, request.url,
                  interaction.response.status_code, interaction.metadata.duration_ms);
    return R::Ok(std::move(interaction));
}

}  // namespace mirage::proxy
