#include "core/config.hpp"
#include "engine/proxy_engine.hpp"
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::unique_ptr<mirage::ProxyEngine> g_engine;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_engine) {
            g_engine->request_shutdown();
        }
    }
}

void print_banner() {
    std::cout << "\nmirage\n" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>        Load configuration from JSON file\n"
              << "      --host <addr>          Address to listen on\n"
              << "      --port <port>          Port to listen on\n"
              << "      --recordings-dir <dir> Directory for recorded interactions\n"
              << "      --mode <mode>          Startup mode: record or playback\n"
              << "      --skip-verify <bool>   Skip upstream TLS verification (true/false)\n"
              << "  -h, --help                 Show this help message\n"
              << "  -v, --version              Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  PROXY_HOST                 Listen address\n"
              << "  PROXY_PORT                 Listen port\n"
              << "  PROXY_THREADS              Server worker threads\n"
              << "  PROXY_MAX_BODY_BYTES       Largest request/response body\n"
              << "  PROXY_RECORDINGS_DIR       Recordings directory\n"
              << "  PROXY_MODE                 Startup mode\n"
              << "  PROXY_TLS_SKIP_VERIFY      'false' enables upstream certificate checks\n"
              << "  PROXY_UPSTREAM_TIMEOUT_MS  Upstream step timeout\n"
              << "  PROXY_HISTORY_CAPACITY     Request history size\n"
              << "  PROXY_LOG_LEVEL            trace, debug, info, warn, error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "mirage v1.0.0\n"
              << "Record/playback HTTP proxy for integration tests\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<std::string> port;
    std::optional<std::string> recordings_dir;
    std::optional<std::string> mode;
    std::optional<std::string> skip_verify;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            args.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            args.port = argv[++i];
        } else if (arg == "--recordings-dir" && i + 1 < argc) {
            args.recordings_dir = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            args.mode = argv[++i];
        } else if (arg == "--skip-verify" && i + 1 < argc) {
            args.skip_verify = argv[++i];
        } else {
            std::cerr << "Warning: ignoring unknown argument '" << arg << "'" << std::endl;
        }
    }

    return args;
}

/// Apply CLI overrides; returns an error message for malformed values
std::optional<std::string> apply_cli_overrides(const CliArgs& args, mirage::Config& config) {
    if (args.host) {
        config.server.host = *args.host;
    }
    if (args.port) {
        try {
            int port = std::stoi(*args.port);
            if (port < 0 || port > 65535) {
                return "port out of range: " + *args.port;
            }
            config.server.port = static_cast<std::uint16_t>(port);
        } catch (const std::exception&) {
            return "invalid port: " + *args.port;
        }
    }
    if (args.recordings_dir) {
        config.storage.path = *args.recordings_dir;
    }
    if (args.mode) {
        config.mode.default_mode = *args.mode;
    }
    if (args.skip_verify) {
        if (*args.skip_verify == "true") {
            config.tls.skip_verify = true;
        } else if (*args.skip_verify == "false") {
            config.tls.skip_verify = false;
        } else {
            return "--skip-verify expects true or false, got: " + *args.skip_verify;
        }
    }
    return std::nullopt;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    print_banner();

    // Load configuration with priority: CLI > env > file > defaults
    auto config = mirage::Config::load(args.config_path);

    // CLI argument overrides (highest priority)
    if (auto error = apply_cli_overrides(args, config)) {
        std::cerr << "Fatal error: " << *error << std::endl;
        return 1;
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        std::cerr << "Fatal error: invalid configuration: " << valid.error() << std::endl;
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // Create and run engine
        g_engine = std::make_unique<mirage::ProxyEngine>(config);
        g_engine->run();
        g_engine.reset();

        std::cout << "Goodbye!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
