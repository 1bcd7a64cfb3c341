#include "engine/proxy_engine.hpp"
#include "network/http_client.hpp"
#include "network/ssl_context.hpp"
#include "proxy/player.hpp"
#include "proxy/recorder.hpp"
#include "storage/filesystem_repository.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace mirage {

ProxyEngine::ProxyEngine(const Config& config)
    : config_(config)
    , stats_(std::make_shared<proxy::Statistics>())
    , history_(std::make_shared<proxy::RequestHistory>(config.history.capacity))
    , console_(std::make_shared<output::ConsoleLogger>())
{
    setup_logging();

    mode_ = std::make_shared<proxy::ModeController>(
        proxy::parse_mode(config.mode.default_mode).value_or(proxy::Mode::Playback)
    );

    repository_ = std::make_shared<storage::FileSystemRepository>(config.storage.path);

    auto transport = std::make_shared<network::HttpClient>(
        network::create_ssl_context(!config.tls.skip_verify),
        config.upstream.timeout,
        config.server.max_body_bytes
    );

    proxy_handler_ = std::make_unique<proxy::ProxyHandler>(
        mode_,
        proxy::Recorder(repository_, std::move(transport)),
        proxy::Player(repository_),
        stats_,
        history_
    );

    management_handler_ = std::make_unique<admin::ManagementHandler>(
        mode_, stats_, history_, repository_
    );

    router_ = std::make_unique<server::Router>(
        [this](const server::HttpRequest& request) {
            return proxy_handler_->handle(request);
        }
    );
    management_handler_->register_routes(*router_);

    server_ = std::make_unique<server::HttpServer>(
        config.server.host,
        config.server.port,
        config.server.threads,
        config.server.max_body_bytes,
        [this](const server::HttpRequest& request) {
            return router_->route(request);
        },
        console_
    );
}

ProxyEngine::~ProxyEngine() {
    request_shutdown();

    if (server_) {
        server_->stop();
    }
}

void ProxyEngine::setup_logging() {
    // Initialize async logging to avoid blocking request threads
    spdlog::init_thread_pool(8192, 1);

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::async_logger>(
        "mirage",
        stdout_sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config_.logging.level));
}

void ProxyEngine::run() {
    spdlog::info("Starting mirage record/playback proxy");
    console_->log_configuration(config_);

    server_->start();
    spdlog::info("Keeping the last {} requests in history", history_->capacity());

    // Poll for shutdown; the signal handler only flips the flag
    while (!shutdown_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    server_->stop();

    auto total = repository_->count();
    if (total.is_ok()) {
        console_->log_shutdown(total.value());
    } else {
        spdlog::warn("Failed to count recordings: {}", total.error().message);
    }

    spdlog::info("Proxy shutdown complete ({} requests served)", console_->request_count());
}

void ProxyEngine::request_shutdown() noexcept {
    shutdown_requested_.store(true);
}

}  // namespace mirage
