#pragma once

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace mirage::server {

namespace http = boost::beast::http;

/// Inbound request with a fully buffered body
using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/// Turns one request into one response
/// Called concurrently from the server's worker threads
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/// Beast views are boost::string_view on older Boost releases
[[nodiscard]] inline std::string_view to_std(boost::beast::string_view sv) noexcept {
    return {sv.data(), sv.size()};
}

/// Response with a serialized JSON body and Content-Type application/json
[[nodiscard]] HttpResponse make_json_response(
    http::status status,
    const nlohmann::json& body,
    unsigned version = 11
);

/// {"error": message} with the given status
[[nodiscard]] HttpResponse make_error_response(
    http::status status,
    const std::string& message,
    unsigned version = 11
);

/// Path part of the request target (before '?')
[[nodiscard]] std::string_view request_path(const HttpRequest& request) noexcept;

/// Raw query part of the request target (after '?'), empty when absent
[[nodiscard]] std::string_view request_query(const HttpRequest& request) noexcept;

}  // namespace mirage::server
