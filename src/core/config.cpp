#include "core/config.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string_view>

namespace mirage {

using json = nlohmann::json;

namespace {

/// Searched in order when no config path is given
constexpr const char* kDefaultConfigFiles[] = {"proxy.json", "config.json"};

/// Level names understood by spdlog
constexpr std::string_view kLogLevels[] = {
    "trace", "debug", "info", "warning", "warn", "error", "err", "critical", "off"
};

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<long long> get_env_int(const char* name,
                                     long long min_val = std::numeric_limits<long long>::min(),
                                     long long max_val = std::numeric_limits<long long>::max()) {
    auto value = get_env(name);
    if (value) {
        try {
            long long result = std::stoll(*value);
            if (result < min_val || result > max_val) {
                std::cerr << "Warning: " << name << " value " << result
                          << " out of range [" << min_val << ", " << max_val
                          << "], ignoring" << std::endl;
                return std::nullopt;
            }
            return result;
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid integer value for " << name
                      << ": " << *value << ", ignoring" << std::endl;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    if (auto v = get_env("PROXY_HOST")) {
        config.server.host = *v;
    }
    // Port range: 1-65535
    if (auto v = get_env_int("PROXY_PORT", 1, 65535)) {
        config.server.port = static_cast<std::uint16_t>(*v);
    }
    if (auto v = get_env_int("PROXY_THREADS", 1, 256)) {
        config.server.threads = static_cast<std::size_t>(*v);
    }
    if (auto v = get_env_int("PROXY_MAX_BODY_BYTES", 1024)) {
        config.server.max_body_bytes = static_cast<std::uint64_t>(*v);
    }
    if (auto v = get_env("PROXY_RECORDINGS_DIR")) {
        config.storage.path = *v;
    }
    if (auto v = get_env("PROXY_MODE")) {
        config.mode.default_mode = *v;
    }
    // Only an explicit "false" turns verification on
    if (auto v = get_env("PROXY_TLS_SKIP_VERIFY")) {
        if (*v == "false") {
            config.tls.skip_verify = false;
        }
    }
    // Upstream timeout: 100ms to 10 minutes
    if (auto v = get_env_int("PROXY_UPSTREAM_TIMEOUT_MS", 100, 600000)) {
        config.upstream.timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("PROXY_HISTORY_CAPACITY", 1, 1000000)) {
        config.history.capacity = static_cast<std::size_t>(*v);
    }
    if (auto v = get_env("PROXY_LOG_LEVEL")) {
        config.logging.level = *v;
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    // Read file contents
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    // Parse JSON
    json j;
    try {
        j = json::parse(content);
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    // Start with defaults
    Config config = Config::defaults();

    try {
        if (j.contains("server")) {
            const auto& srv = j["server"];
            if (srv.contains("host")) {
                config.server.host = srv["host"].get<std::string>();
            }
            if (srv.contains("port")) {
                // Accept "8099" as well as 8099
                if (srv["port"].is_string()) {
                    config.server.port = static_cast<std::uint16_t>(
                        std::stoi(srv["port"].get<std::string>()));
                } else {
                    config.server.port = srv["port"].get<std::uint16_t>();
                }
            }
            if (srv.contains("threads")) {
                config.server.threads = srv["threads"].get<std::size_t>();
            }
            if (srv.contains("max_body_bytes")) {
                config.server.max_body_bytes = srv["max_body_bytes"].get<std::uint64_t>();
            }
        }

        if (j.contains("storage")) {
            const auto& st = j["storage"];
            if (st.contains("type")) {
                config.storage.type = st["type"].get<std::string>();
            }
            if (st.contains("path")) {
                config.storage.path = st["path"].get<std::string>();
            }
        }

        if (j.contains("mode")) {
            const auto& md = j["mode"];
            if (md.contains("default")) {
                config.mode.default_mode = md["default"].get<std::string>();
            }
        }

        if (j.contains("tls")) {
            const auto& tls = j["tls"];
            if (tls.contains("skip_verify")) {
                config.tls.skip_verify = tls["skip_verify"].get<bool>();
            }
        }

        if (j.contains("upstream")) {
            const auto& up = j["upstream"];
            if (up.contains("timeout_ms")) {
                config.upstream.timeout = std::chrono::milliseconds(up["timeout_ms"].get<int>());
            }
        }

        if (j.contains("history")) {
            const auto& hist = j["history"];
            if (hist.contains("capacity")) {
                config.history.capacity = hist["capacity"].get<std::size_t>();
            }
        }

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                config.logging.level = log["level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    } catch (const std::logic_error& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    std::optional<std::string> path = config_path;
    if (!path) {
        for (const char* candidate : kDefaultConfigFiles) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                path = candidate;
                break;
            }
        }
    }

    if (path) {
        auto result = load_from_file(*path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            // Log warning when config file fails to load
            std::cerr << "Warning: Failed to load config from '" << *path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    // Apply environment variable overrides (highest priority)
    apply_env_overrides(config);

    return config;
}

Result<bool, std::string> Config::validate() const {
    using R = Result<bool, std::string>;

    if (mode.default_mode != "record" && mode.default_mode != "playback") {
        return R::Err("invalid mode: " + mode.default_mode + " (must be 'record' or 'playback')");
    }
    if (storage.type != "filesystem") {
        return R::Err("unsupported storage type: " + storage.type);
    }
    if (storage.path.empty()) {
        return R::Err("storage path must not be empty");
    }
    if (server.threads == 0) {
        return R::Err("server.threads must be at least 1");
    }
    if (history.capacity == 0) {
        return R::Err("history.capacity must be at least 1");
    }
    if (upstream.timeout.count() <= 0) {
        return R::Err("upstream.timeout_ms must be positive");
    }
    if (std::find(std::begin(kLogLevels), std::end(kLogLevels), logging.level) == std::end(kLogLevels)) {
        return R::Err("unknown logging level: " + logging.level);
    }
    return R::Ok(true);
}

}  // namespace mirage
