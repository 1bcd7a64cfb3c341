#pragma once

#include "core/status.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mirage {

/// Immutable configuration for mirage
struct Config {
    /// Inbound HTTP listener
    struct Server {
        std::string host = "0.0.0.0";
        std::uint16_t port = 8099;
        std::size_t threads = 4;
        std::uint64_t max_body_bytes = 10 * 1024 * 1024;  // request and response bodies
    };

    /// Recording persistence
    struct Storage {
        std::string type = "filesystem";
        std::string path = "./recordings";
    };

    /// Mode at startup ("record" or "playback")
    struct Mode {
        std::string default_mode = "playback";
    };

    /// Outbound TLS
    struct Tls {
        bool skip_verify = true;  // test targets often use self-signed certificates
    };

    /// Outbound calls in record mode
    struct Upstream {
        std::chrono::milliseconds timeout{30000};
    };

    struct History {
        std::size_t capacity = 1000;
    };

    struct Logging {
        std::string level = "info";
    };

    Server server;
    Storage storage;
    Mode mode;
    Tls tls;
    Upstream upstream;
    History history;
    Logging logging;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// Without a path, proxy.json then config.json in the working directory are tried
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Check values that would make the proxy unusable
    /// @return error message describing the first invalid field
    [[nodiscard]] Result<bool, std::string> validate() const;

    /// "host:port" for the listener
    [[nodiscard]] std::string address() const {
        return server.host + ":" + std::to_string(server.port);
    }
};

}  // namespace mirage
