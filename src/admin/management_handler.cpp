#include "admin/management_handler.hpp"
#include "network/url.hpp"
#include "output/json_formatter.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mirage::admin {

using output::JsonFormatter;
using server::HttpRequest;
using server::HttpResponse;
using server::make_error_response;
using server::make_json_response;
namespace http = server::http;

namespace {

HttpResponse method_not_allowed(const HttpRequest& request) {
    return make_error_response(http::status::method_not_allowed, "Method not allowed", request.version());
}

/// Decoded query parameter; empty when absent or badly encoded
std::string query_param(const HttpRequest& request, std::string_view key) {
    auto param = network::find_query_param(server::request_query(request), key);
    if (param.is_err() || !param.value()) {
        return {};
    }
    return *param.value();
}

}  // namespace

ManagementHandler::ManagementHandler(
    std::shared_ptr<proxy::ModeController> mode,
    std::shared_ptr<proxy::Statistics> stats,
    std::shared_ptr<proxy::RequestHistory> history,
    std::shared_ptr<storage::Repository> repository,
    std::chrono::steady_clock::time_point started
)
    : mode_(std::move(mode))
    , stats_(std::move(stats))
    , history_(std::move(history))
    , repository_(std::move(repository))
    , started_(started)
{}

void ManagementHandler::register_routes(server::Router& router) {
    router.add_route("/admin/status", [this](const HttpRequest& req) { return handle_status(req); });
    router.add_route("/admin/mode", [this](const HttpRequest& req) { return handle_mode(req); });
    router.add_route("/admin/history", [this](const HttpRequest& req) { return handle_history(req); });
    router.add_route("/admin/recordings", [this](const HttpRequest& req) { return handle_recordings(req); });
    router.add_route("/admin/recording", [this](const HttpRequest& req) { return handle_recording(req); });
    router.add_route("/health", [this](const HttpRequest& req) { return handle_health(req); });
}

HttpResponse ManagementHandler::handle_status(const HttpRequest& request) const {
    if (request.method() != http::verb::get) {
        return method_not_allowed(request);
    }

    auto total = repository_->count();
    if (total.is_err()) {
        spdlog::warn("Failed to count recordings: {}", total.error().message);
        return make_error_response(http::status::internal_server_error,
                                   "Failed to count recordings: " + total.error().message,
                                   request.version());
    }

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_
    );

    return make_json_response(
        http::status::ok,
        JsonFormatter::format_status(mode_->mode(), stats_->snapshot(), total.value(), uptime),
        request.version()
    );
}

HttpResponse ManagementHandler::handle_mode(const HttpRequest& request) {
    switch (request.method()) {
        case http::verb::get: {
            auto value = query_param(request, "mode");
            if (!value.empty()) {
                return switch_mode(value, request.version());
            }
            return make_json_response(http::status::ok,
                                      JsonFormatter::format_mode(mode_->mode()),
                                      request.version());
        }

        case http::verb::post: {
            std::string value;
            try {
                auto body = nlohmann::json::parse(request.body());
                value = body.at("mode").get<std::string>();
            } catch (const nlohmann::json::exception& e) {
                spdlog::debug("Rejected mode switch body: {}", e.what());
                return make_error_response(http::status::bad_request, "Invalid request body",
                                           request.version());
            }
            return switch_mode(value, request.version());
        }

        default:
            return method_not_allowed(request);
    }
}

HttpResponse ManagementHandler::switch_mode(const std::string& value, unsigned version) {
    auto switched = mode_->set_mode(value);
    if (switched.is_err()) {
        return make_error_response(http::status::bad_request, switched.error().message, version);
    }

    auto mode = switched.value();
    return make_json_response(
        http::status::ok,
        JsonFormatter::format_mode(mode, "Switched to " + std::string(proxy::to_string(mode)) + " mode"),
        version
    );
}

HttpResponse ManagementHandler::handle_history(const HttpRequest& request) const {
    if (request.method() != http::verb::get) {
        return method_not_allowed(request);
    }
    return make_json_response(http::status::ok,
                              JsonFormatter::format_history(history_->snapshot()),
                              request.version());
}

HttpResponse ManagementHandler::handle_recordings(const HttpRequest& request) {
    switch (request.method()) {
        case http::verb::get: {
            auto all = repository_->find_all();
            if (all.is_err()) {
                return make_error_response(http::status::internal_server_error,
                                           "Failed to list recordings: " + all.error().message,
                                           request.version());
            }
            return make_json_response(http::status::ok,
                                      JsonFormatter::format_recordings(all.value()),
                                      request.version());
        }

        case http::verb::delete_: {
            auto cleared = repository_->clear();
            if (cleared.is_err()) {
                return make_error_response(http::status::internal_server_error,
                                           "Failed to clear recordings: " + cleared.error().message,
                                           request.version());
            }
            spdlog::info("All recordings cleared");
            return make_json_response(http::status::ok,
                                      nlohmann::json{{"message", "All recordings cleared successfully"}},
                                      request.version());
        }

        default:
            return method_not_allowed(request);
    }
}

HttpResponse ManagementHandler::handle_recording(const HttpRequest& request) const {
    if (request.method() != http::verb::get) {
        return method_not_allowed(request);
    }

    auto id = query_param(request, "id");
    if (id.empty()) {
        return make_error_response(http::status::bad_request, "Missing recording ID", request.version());
    }

    auto found = repository_->find_by_key(id);
    if (found.is_err()) {
        if (found.error().kind == ErrorKind::NotFound) {
            return make_error_response(http::status::not_found,
                                       "Recording not found: " + found.error().message,
                                       request.version());
        }
        return make_error_response(http::status::internal_server_error,
                                   "Failed to read recording: " + found.error().message,
                                   request.version());
    }

    return make_json_response(http::status::ok, nlohmann::json(found.value()), request.version());
}

HttpResponse ManagementHandler::handle_health(const HttpRequest& request) const {
    if (request.method() != http::verb::get) {
        return method_not_allowed(request);
    }
    return make_json_response(http::status::ok, JsonFormatter::format_health(), request.version());
}

}  // namespace mirage::admin
