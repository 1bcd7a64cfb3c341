#include <gtest/gtest.h>
#include "server/router.hpp"

using namespace mirage::server;

namespace {

HttpRequest make_request(const std::string& target) {
    HttpRequest request{http::verb::get, target, 11};
    request.prepare_payload();
    return request;
}

RequestHandler tagged(const std::string& tag) {
    return [tag](const HttpRequest& request) {
        return make_json_response(http::status::ok, nlohmann::json{{"tag", tag}}, request.version());
    };
}

std::string tag_of(const HttpResponse& response) {
    return nlohmann::json::parse(response.body())["tag"].get<std::string>();
}

}  // namespace

TEST(RouterTest, ExactPathMatch) {
    Router router(tagged("fallback"));
    router.add_route("/admin/status", tagged("status"));

    EXPECT_EQ(tag_of(router.route(make_request("/admin/status"))), "status");
    EXPECT_EQ(tag_of(router.route(make_request("/admin/status?verbose=1"))), "status");
}

TEST(RouterTest, PrefixesAndTrailingSlashesFallThrough) {
    Router router(tagged("fallback"));
    router.add_route("/admin/status", tagged("status"));

    EXPECT_EQ(tag_of(router.route(make_request("/admin/status/"))), "fallback");
    EXPECT_EQ(tag_of(router.route(make_request("/admin"))), "fallback");
    EXPECT_EQ(tag_of(router.route(make_request("/proxy?target=api.example.com"))), "fallback");
}

TEST(RouterTest, LaterRegistrationReplaces) {
    Router router(tagged("fallback"));
    router.add_route("/health", tagged("first"));
    router.add_route("/health", tagged("second"));

    EXPECT_EQ(tag_of(router.route(make_request("/health"))), "second");
}

TEST(RouterTest, NoFallbackIsNotFound) {
    Router router(nullptr);
    router.add_route("/health", tagged("health"));

    auto response = router.route(make_request("/elsewhere"));

    EXPECT_EQ(response.result(), http::status::not_found);
    EXPECT_EQ(nlohmann::json::parse(response.body())["error"], "Not found");
}

TEST(RouterTest, HasRoute) {
    Router router(nullptr);
    router.add_route("/admin/mode", tagged("mode"));

    EXPECT_TRUE(router.has_route("/admin/mode"));
    EXPECT_FALSE(router.has_route("/admin/modes"));
}

TEST(HttpMessageTest, SplitsPathAndQuery) {
    auto request = make_request("/admin/recording?id=abc&x=1");

    EXPECT_EQ(request_path(request), "/admin/recording");
    EXPECT_EQ(request_query(request), "id=abc&x=1");

    auto bare = make_request("/health");
    EXPECT_EQ(request_path(bare), "/health");
    EXPECT_TRUE(request_query(bare).empty());
}

TEST(HttpMessageTest, ErrorResponseIsJson) {
    auto response = make_error_response(http::status::bad_request, "bad things", 10);

    EXPECT_EQ(response.result(), http::status::bad_request);
    EXPECT_EQ(response.version(), 10u);
    EXPECT_EQ(response[http::field::content_type], "application/json");
    EXPECT_EQ(to_std(response[http::field::content_length]), std::to_string(response.body().size()));
    EXPECT_EQ(nlohmann::json::parse(response.body())["error"], "bad things");
}
