#include "proxy/player.hpp"
#include <spdlog/spdlog.h>

namespace mirage::proxy {

Player::Player(std::shared_ptr<storage::Repository> repository)
    : repository_(std::move(repository))
{}

Result<model::Interaction, Error> Player::handle(const model::RecordedRequest& request) const {
    using R = Result<model::Interaction, Error>;

    auto hash = request.fingerprint();
    auto found = repository_->find(hash);
    if (found.is_ok()) {
        return found;
    }

    if (found.error().kind == ErrorKind::NotFound) {
        spdlog::debug("Playback miss {} {} ({})", request.method, request.url, hash);
        return R::Err(Error::no_recording(
            "no recording found for " + request.method + " " + request.url + " (hash: " + hash + ")"
        ));
    }
    return R::Err(Error::storage("failed to retrieve recording: " + found.error().message));
}

}  // namespace mirage::proxy
