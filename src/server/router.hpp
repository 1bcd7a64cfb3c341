#pragma once

#include "server/http_message.hpp"
#include <map>
#include <string>

namespace mirage::server {

/// Dispatches on the exact request path
/// Requests without a matching route go to the fallback handler
class Router {
public:
    /// @param fallback Handler for every unrouted path (the proxy itself)
    explicit Router(RequestHandler fallback);

    /// Register a handler for one exact path, replacing any previous one
    void add_route(std::string path, RequestHandler handler);

    [[nodiscard]] HttpResponse route(const HttpRequest& request) const;

    [[nodiscard]] bool has_route(std::string_view path) const;

private:
    RequestHandler fallback_;
    std::map<std::string, RequestHandler, std::less<>> routes_;
};

}  // namespace mirage::server
