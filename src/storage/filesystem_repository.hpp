#pragma once

#include "storage/repository.hpp"
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace mirage::storage {

/// Repository persisting one JSON file per interaction
///
/// Layout: <base>/<service>/<fingerprint>.json where <service> is the
/// target host with separators replaced by underscores.
class FileSystemRepository : public Repository {
public:
    /// Create the repository, creating the base directory if needed
    /// @throws std::runtime_error if the directory cannot be created
    explicit FileSystemRepository(std::filesystem::path base_path);

    [[nodiscard]] Status store(const model::Interaction& interaction) override;
    [[nodiscard]] Result<model::Interaction, Error> find(const Fingerprint& fingerprint) const override;
    [[nodiscard]] Result<model::Interaction, Error> find_by_key(const std::string& key) const override;
    [[nodiscard]] Result<std::vector<model::Interaction>, Error> find_all() const override;
    [[nodiscard]] Result<std::size_t, Error> count() const override;
    [[nodiscard]] Status clear() override;

    /// Directory name for a target: "https://api.example.com:8443/x" -> "api_example_com_8443"
    [[nodiscard]] static std::string service_name(std::string_view target);

private:
    /// Fingerprint lookup without taking the lock
    [[nodiscard]] Result<model::Interaction, Error> find_unlocked(const Fingerprint& fingerprint) const;
    [[nodiscard]] Result<model::Interaction, Error> load(const std::filesystem::path& file) const;
    [[nodiscard]] Result<std::vector<std::filesystem::path>, Error> list_files() const;

    std::filesystem::path base_path_;
    mutable std::shared_mutex mutex_;
};

}  // namespace mirage::storage
