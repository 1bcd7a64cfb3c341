#include "storage/filesystem_repository.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace mirage::storage {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::string_view kExtension = ".json";

bool is_recording_file(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) {
        return false;
    }
    return entry.path().extension().string() == kExtension;
}

/// Keys become file names; anything path-like never matches
bool is_safe_key(std::string_view key) {
    return !key.empty() && key.find('/') == std::string_view::npos &&
           key.find('\\') == std::string_view::npos && key.find("..") == std::string_view::npos;
}

}  // namespace

FileSystemRepository::FileSystemRepository(fs::path base_path)
    : base_path_(std::move(base_path))
{
    std::error_code ec;
    fs::create_directories(base_path_, ec);
    if (ec) {
        throw std::runtime_error("failed to create recordings directory " +
                                 base_path_.string() + ": " + ec.message());
    }
}

std::string FileSystemRepository::service_name(std::string_view target) {
    if (target.rfind("http://", 0) == 0) {
        target.remove_prefix(7);
    } else if (target.rfind("https://", 0) == 0) {
        target.remove_prefix(8);
    }

    auto slash = target.find('/');
    std::string_view host = target.substr(0, slash);
    if (host.empty()) {
        return "unknown";
    }

    std::string name(host);
    for (char& c : name) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!keep) {
            c = '_';
        }
    }
    return name;
}

Status FileSystemRepository::store(const model::Interaction& interaction) {
    std::unique_lock lock(mutex_);

    auto fingerprint = interaction.request.fingerprint();
    fs::path dir = base_path_ / service_name(interaction.metadata.target);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Status::Err(Error::storage("failed to create service directory: " + ec.message()));
    }

    std::string data;
    try {
        data = json(interaction).dump(2);
    } catch (const json::exception& e) {
        return Status::Err(Error::storage("failed to marshal interaction: " + std::string(e.what())));
    }

    // Write beside the final file and rename so readers never see a partial recording
    fs::path file = dir / (fingerprint + std::string(kExtension));
    fs::path tmp = dir / ("." + fingerprint + ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Status::Err(Error::storage("failed to open " + tmp.string() + " for writing"));
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return Status::Err(Error::storage("failed to write interaction file " + tmp.string()));
        }
    }

    fs::rename(tmp, file, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return Status::Err(Error::storage("failed to write interaction file: " + ec.message()));
    }

    spdlog::debug("Stored interaction {} at {}", interaction.id, file.string());
    return ok_status();
}

Result<model::Interaction, Error> FileSystemRepository::find(const Fingerprint& fingerprint) const {
    std::shared_lock lock(mutex_);
    return find_unlocked(fingerprint);
}

Result<model::Interaction, Error> FileSystemRepository::find_by_key(const std::string& key) const {
    using R = Result<model::Interaction, Error>;
    std::shared_lock lock(mutex_);

    auto by_fingerprint = find_unlocked(key);
    if (by_fingerprint.is_ok() || by_fingerprint.error().kind != ErrorKind::NotFound) {
        return by_fingerprint;
    }
    if (!is_safe_key(key)) {
        return by_fingerprint;
    }

    // Direct lookup by interaction id
    auto files = list_files();
    if (files.is_err()) {
        return R::Err(files.error());
    }
    for (const auto& file : files.value()) {
        auto loaded = load(file);
        if (loaded.is_err()) {
            spdlog::warn("Skipping unreadable recording: {}", loaded.error().message);
            continue;
        }
        if (loaded.value().id == key) {
            return loaded;
        }
    }

    return R::Err(Error::not_found("interaction not found for id: " + key));
}

Result<model::Interaction, Error> FileSystemRepository::find_unlocked(const Fingerprint& fingerprint) const {
    using R = Result<model::Interaction, Error>;
    auto not_found = [&fingerprint]() {
        return R::Err(Error::not_found("interaction not found for hash: " + fingerprint));
    };

    if (!is_safe_key(fingerprint)) {
        return not_found();
    }

    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return not_found();
    }

    fs::directory_iterator it(base_path_, ec);
    if (ec) {
        return R::Err(Error::storage("failed to search for interaction: " + ec.message()));
    }

    // */<fingerprint>.json
    for (auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return R::Err(Error::storage("failed to search for interaction: " + ec.message()));
        }
        if (!it->is_directory(ec)) {
            continue;
        }
        fs::path candidate = it->path() / (fingerprint + std::string(kExtension));
        if (fs::is_regular_file(candidate, ec)) {
            return load(candidate);
        }
    }
    if (ec) {
        return R::Err(Error::storage("failed to search for interaction: " + ec.message()));
    }

    return not_found();
}

Result<std::vector<model::Interaction>, Error> FileSystemRepository::find_all() const {
    using R = Result<std::vector<model::Interaction>, Error>;
    std::shared_lock lock(mutex_);

    auto files = list_files();
    if (files.is_err()) {
        return R::Err(files.error());
    }

    std::vector<model::Interaction> interactions;
    interactions.reserve(files.value().size());
    for (const auto& file : files.value()) {
        auto loaded = load(file);
        if (loaded.is_err()) {
            return R::Err(loaded.error());
        }
        interactions.push_back(std::move(loaded).take_value());
    }

    // Newest first
    std::sort(interactions.begin(), interactions.end(),
              [](const model::Interaction& a, const model::Interaction& b) {
                  return a.timestamp > b.timestamp;
              });

    return R::Ok(std::move(interactions));
}

Result<std::size_t, Error> FileSystemRepository::count() const {
    using R = Result<std::size_t, Error>;
    std::shared_lock lock(mutex_);

    auto files = list_files();
    if (files.is_err()) {
        return R::Err(Error::storage("failed to count interactions: " + files.error().message));
    }
    return R::Ok(files.value().size());
}

Status FileSystemRepository::clear() {
    std::unique_lock lock(mutex_);

    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return ok_status();
    }

    fs::directory_iterator it(base_path_, ec);
    if (ec) {
        return Status::Err(Error::storage("failed to read directory entries: " + ec.message()));
    }

    std::vector<fs::path> entries;
    for (const auto& entry : it) {
        entries.push_back(entry.path());
    }

    for (const auto& path : entries) {
        fs::remove_all(path, ec);
        if (ec) {
            return Status::Err(Error::storage("failed to remove " + path.string() + ": " + ec.message()));
        }
    }

    spdlog::info("Cleared {} recording directories", entries.size());
    return ok_status();
}

Result<model::Interaction, Error> FileSystemRepository::load(const fs::path& file) const {
    using R = Result<model::Interaction, Error>;

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return R::Err(Error::storage("failed to read interaction file " + file.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        auto interaction = json::parse(buffer.str()).get<model::Interaction>();
        return R::Ok(std::move(interaction));
    } catch (const std::exception& e) {
        return R::Err(Error::storage("failed to unmarshal " + file.string() + ": " + e.what()));
    }
}

Result<std::vector<fs::path>, Error> FileSystemRepository::list_files() const {
    using R = Result<std::vector<fs::path>, Error>;

    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return R::Ok(std::move(files));
    }

    fs::recursive_directory_iterator it(base_path_, ec);
    if (ec) {
        return R::Err(Error::storage("failed to walk directory: " + ec.message()));
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return R::Err(Error::storage("failed to walk directory: " + ec.message()));
        }
        if (is_recording_file(*it)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return R::Err(Error::storage("failed to walk directory: " + ec.message()));
    }
    return R::Ok(std::move(files));
}

}  // namespace mirage::storage
