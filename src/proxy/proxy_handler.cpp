#include "proxy/proxy_handler.hpp"
#include "network/url.hpp"
#include <boost/beast/http/field.hpp>
#include <spdlog/spdlog.h>

namespace mirage::proxy {

using server::HttpRequest;
using server::HttpResponse;
using server::make_error_response;
using server::to_std;
namespace http = server::http;

namespace {

/// Recomputed by the server for the buffered body
bool is_framing_header(std::string_view name) {
    return iequals(name, "Content-Length") ||
           iequals(name, "Transfer-Encoding") ||
           iequals(name, "Connection");
}

}  // namespace

ProxyHandler::ProxyHandler(
    std::shared_ptr<ModeController> mode,
    Recorder recorder,
    Player player,
    std::shared_ptr<Statistics> stats,
    std::shared_ptr<RequestHistory> history
)
    : mode_(std::move(mode))
    , recorder_(std::move(recorder))
    , player_(std::move(player))
    , stats_(std::move(stats))
    , history_(std::move(history))
{}

HttpResponse ProxyHandler::handle(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto started = std::chrono::steady_clock::now();
    const unsigned version = request.version();

    // Resolve the target
    auto param = network::find_query_param(server::request_query(request), "target");
    if (param.is_err()) {
        return make_error_response(http::status::bad_request,
                                   "Invalid target URL: " + param.error(), version);
    }
    const auto& target = param.value();
    if (!target || target->empty()) {
        return make_error_response(http::status::bad_request,
                                   "Missing 'target' query parameter", version);
    }

    auto parsed = network::parse_url(network::build_target_url(*target));
    if (parsed.is_err()) {
        return make_error_response(http::status::bad_request,
                                   "Invalid target URL: " + parsed.error(), version);
    }

    auto recorded_request = model::RecordedRequest::from_inbound(
        to_std(request.method_string()),
        collect_headers(request),
        request.body(),
        *target
    );

    // Dispatch
    const Mode mode = mode_->mode();
    Result<model::Interaction, Error> outcome = mode == Mode::Record
        ? recorder_.handle(recorded_request)
        : player_.handle(recorded_request);

    if (outcome.is_err()) {
        const auto& error = outcome.error();
        if (mode == Mode::Record) {
            spdlog::error("Record failed for {} {}: {}",
                          recorded_request.method, recorded_request.url, error.message);
            return make_error_response(http::status::internal_server_error,
                                       "Record failed: " + error.message, version);
        }
        if (error.kind == ErrorKind::NoRecording) {
            stats_->increment_miss();
            return make_error_response(http::status::not_found,
                                       "No recording found: " + error.message, version);
        }
        spdlog::error("Playback failed for {} {}: {}",
                      recorded_request.method, recorded_request.url, error.message);
        return make_error_response(http::status::internal_server_error,
                                   "Playback failed: " + error.message, version);
    }

    const auto& interaction = outcome.value();
    if (mode == Mode::Record) {
        stats_->increment_record();
    } else {
        stats_->increment_hit();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    history_->add(HistoryEntry{
        .id = recorded_request.fingerprint(),
        .timestamp = std::chrono::system_clock::now(),
        .method = interaction.request.method,
        .url = interaction.request.url,
        .target = interaction.metadata.target,
        .status = interaction.response.status_code,
        .duration_ms = elapsed.count(),
        .saved = mode == Mode::Record,
    });

    return to_http_response(interaction.response, version, request.method() == http::verb::head);
}

HttpResponse ProxyHandler::to_http_response(
    const model::RecordedResponse& recorded,
    unsigned version,
    bool head_request
) {
    HttpResponse response;
    response.version(version);
    response.result(static_cast<unsigned>(recorded.status_code));

    for (const auto& [name, values] : recorded.headers) {
        if (is_framing_header(name) && !(head_request && iequals(name, "Content-Length"))) {
            continue;
        }
        for (const auto& value : values) {
            response.insert(name, value);
        }
    }

    response.body() = recorded.body;
    return response;
}

Headers ProxyHandler::collect_headers(const HttpRequest& request) {
    Headers headers;
    for (const auto& field : request) {
        headers[std::string(to_std(field.name_string()))].emplace_back(to_std(field.value()));
    }
    return headers;
}

}  // namespace mirage::proxy
