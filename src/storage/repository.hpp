#pragma once

#include "core/status.hpp"
#include "model/interaction.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace mirage::storage {

/// Persistence contract for recorded interactions
/// Implementations must allow reads concurrent with a single writer
class Repository {
public:
    virtual ~Repository() = default;

    /// Persist an interaction keyed by its request fingerprint
    /// An existing interaction with the same fingerprint is replaced
    [[nodiscard]] virtual Status store(const model::Interaction& interaction) = 0;

    /// Find by request fingerprint only
    /// @return ErrorKind::NotFound when nothing matches
    [[nodiscard]] virtual Result<model::Interaction, Error> find(const Fingerprint& fingerprint) const = 0;

    /// Find by request fingerprint, falling back to the interaction id
    /// Unreadable recordings are skipped during the id search
    /// @return ErrorKind::NotFound when nothing matches
    [[nodiscard]] virtual Result<model::Interaction, Error> find_by_key(const std::string& key) const = 0;

    /// All stored interactions
    [[nodiscard]] virtual Result<std::vector<model::Interaction>, Error> find_all() const = 0;

    [[nodiscard]] virtual Result<std::size_t, Error> count() const = 0;

    /// Remove every stored interaction; clearing an empty store succeeds
    [[nodiscard]] virtual Status clear() = 0;
};

}  // namespace mirage::storage
