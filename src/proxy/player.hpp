#pragma once

#include "core/status.hpp"
#include "model/interaction.hpp"
#include "storage/repository.hpp"
#include <memory>

namespace mirage::proxy {

/// Playback mode: answer from stored interactions, never touching the network
class Player {
public:
    explicit Player(std::shared_ptr<storage::Repository> repository);

    /// Look up the recording matching the request's fingerprint
    /// @return The stored interaction verbatim, NoRecording on a miss,
    ///         StorageFailure when the lookup itself fails
    [[nodiscard]] Result<model::Interaction, Error> handle(const model::RecordedRequest& request) const;

private:
    std::shared_ptr<storage::Repository> repository_;
};

}  // namespace mirage::proxy
