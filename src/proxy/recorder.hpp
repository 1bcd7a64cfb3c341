#pragma once

#include "core/status.hpp"
#include "model/interaction.hpp"
#include "network/http_client.hpp"
#include "storage/repository.hpp"
#include <memory>

namespace mirage::proxy {

/// Record mode: forward to the real target, then persist the exchange
class Recorder {
public:
    Recorder(
        std::shared_ptr<storage::Repository> repository,
        std::shared_ptr<network::HttpTransport> transport
    );

    /// Forward the request and store the resulting interaction
    /// @param request Canonical request; url holds the target as received
    /// @return The stored interaction. Transport failures store nothing;
    ///         a failed store is reported even though the live response is known.
    [[nodiscard]] Result<model::Interaction, Error> handle(const model::RecordedRequest& request);

private:
    std::shared_ptr<storage::Repository> repository_;
    std::shared_ptr<network::HttpTransport> transport_;
};

}  // namespace mirage::proxy
