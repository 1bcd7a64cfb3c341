#include "server/router.hpp"

namespace mirage::server {

Router::Router(RequestHandler fallback)
    : fallback_(std::move(fallback))
{}

void Router::add_route(std::string path, RequestHandler handler) {
    routes_[std::move(path)] = std::move(handler);
}

HttpResponse Router::route(const HttpRequest& request) const {
    auto it = routes_.find(request_path(request));
    if (it != routes_.end()) {
        return it->second(request);
    }
    if (fallback_) {
        return fallback_(request);
    }
    return make_error_response(http::status::not_found, "Not found", request.version());
}

bool Router::has_route(std::string_view path) const {
    return routes_.find(path) != routes_.end();
}

}  // namespace mirage::server
