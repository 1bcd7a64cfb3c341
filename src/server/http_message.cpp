#include "server/http_message.hpp"
#include "output/json_formatter.hpp"
#include <boost/beast/http/field.hpp>

namespace mirage::server {

HttpResponse make_json_response(http::status status, const nlohmann::json& body, unsigned version) {
    HttpResponse response{status, version};
    response.set(http::field::content_type, "application/json");
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

HttpResponse make_error_response(http::status status, const std::string& message, unsigned version) {
    return make_json_response(status, output::JsonFormatter::format_error(message), version);
}

std::string_view request_path(const HttpRequest& request) noexcept {
    auto target = to_std(request.target());
    auto pos = target.find('?');
    return pos == std::string_view::npos ? target : target.substr(0, pos);
}

std::string_view request_query(const HttpRequest& request) noexcept {
    auto target = to_std(request.target());
    auto pos = target.find('?');
    return pos == std::string_view::npos ? std::string_view{} : target.substr(pos + 1);
}

}  // namespace mirage::server
