#include <gtest/gtest.h>
#include "admin/management_handler.hpp"
#include "fakes.hpp"

using namespace mirage;
using namespace mirage::admin;
using mirage::test_support::InMemoryRepository;
namespace http = mirage::server::http;

namespace {

model::Interaction make_interaction(const std::string& url, WallTime when) {
    model::Interaction interaction;
    interaction.id = model::generate_interaction_id();
    interaction.timestamp = when;
    interaction.request.method = "GET";
    interaction.request.url = url;
    interaction.response.status_code = 200;
    interaction.response.body = "ok";
    interaction.metadata.target = url;
    interaction.metadata.duration_ms = 12;
    return interaction;
}

}  // namespace

class ManagementHandlerTest : public ::testing::Test {
protected:
    std::shared_ptr<proxy::ModeController> mode = std::make_shared<proxy::ModeController>(proxy::Mode::Playback);
    std::shared_ptr<proxy::Statistics> stats = std::make_shared<proxy::Statistics>();
    std::shared_ptr<proxy::RequestHistory> history = std::make_shared<proxy::RequestHistory>();
    std::shared_ptr<InMemoryRepository> repo = std::make_shared<InMemoryRepository>();
    ManagementHandler handler{mode, stats, history, repo,
                              std::chrono::steady_clock::now() - std::chrono::seconds(125)};

    static server::HttpRequest make_request(http::verb method, const std::string& target,
                                            const std::string& body = "") {
        server::HttpRequest request{method, target, 11};
        if (!body.empty()) {
            request.set(http::field::content_type, "application/json");
            request.body() = body;
        }
        request.prepare_payload();
        return request;
    }

    static nlohmann::json body_json(const server::HttpResponse& response) {
        return nlohmann::json::parse(response.body());
    }
};

// Status

TEST_F(ManagementHandlerTest, StatusReportsCountersAndRecordings) {
    stats->increment_record();
    stats->increment_hit();
    stats->increment_hit();
    stats->increment_miss();
    ASSERT_TRUE(repo->store(make_interaction("api.example.com/a", std::chrono::system_clock::now())).is_ok());

    auto response = handler.handle_status(make_request(http::verb::get, "/admin/status"));

    ASSERT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::content_type], "application/json");
    auto j = body_json(response);
    EXPECT_EQ(j["mode"], "playback");
    EXPECT_EQ(j["record_count"], 1);
    EXPECT_EQ(j["playback_hits"], 2);
    EXPECT_EQ(j["playback_misses"], 1);
    EXPECT_EQ(j["total_recordings"], 1);
    EXPECT_EQ(j["uptime"].get<std::string>().rfind("2m", 0), 0u);
}

TEST_F(ManagementHandlerTest, StatusRejectsPost) {
    auto response = handler.handle_status(make_request(http::verb::post, "/admin/status"));

    EXPECT_EQ(response.result(), http::status::method_not_allowed);
    EXPECT_EQ(body_json(response)["error"], "Method not allowed");
}

// Mode

TEST_F(ManagementHandlerTest, GetModeReturnsCurrentMode) {
    auto response = handler.handle_mode(make_request(http::verb::get, "/admin/mode"));

    ASSERT_EQ(response.result(), http::status::ok);
    auto j = body_json(response);
    EXPECT_EQ(j["mode"], "playback");
    EXPECT_FALSE(j.contains("message"));
}

TEST_F(ManagementHandlerTest, GetWithModeParameterSwitches) {
    auto response = handler.handle_mode(make_request(http::verb::get, "/admin/mode?mode=record"));

    ASSERT_EQ(response.result(), http::status::ok);
    auto j = body_json(response);
    EXPECT_EQ(j["mode"], "record");
    EXPECT_EQ(j["message"], "Switched to record mode");
    EXPECT_EQ(mode->mode(), proxy::Mode::Record);
}

TEST_F(ManagementHandlerTest, PostJsonSwitches) {
    mode->set_mode(proxy::Mode::Record);

    auto response = handler.handle_mode(make_request(http::verb::post, "/admin/mode", R"({"mode":"playback"})"));

    ASSERT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(body_json(response)["message"], "Switched to playback mode");
    EXPECT_EQ(mode->mode(), proxy::Mode::Playback);
}

TEST_F(ManagementHandlerTest, SwitchingToCurrentModeSucceeds) {
    auto response = handler.handle_mode(make_request(http::verb::get, "/admin/mode?mode=playback"));

    ASSERT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(body_json(response)["mode"], "playback");
}

TEST_F(ManagementHandlerTest, InvalidModeLeavesStateUnchanged) {
    auto via_get = handler.handle_mode(make_request(http::verb::get, "/admin/mode?mode=RECORD"));
    auto via_post = handler.handle_mode(make_request(http::verb::post, "/admin/mode", R"({"mode":"replay"})"));

    EXPECT_EQ(via_get.result(), http::status::bad_request);
    EXPECT_EQ(via_post.result(), http::status::bad_request);
    EXPECT_NE(body_json(via_post)["error"].get<std::string>().find("invalid mode: replay"), std::string::npos);
    EXPECT_EQ(mode->mode(), proxy::Mode::Playback);
}

TEST_F(ManagementHandlerTest, MalformedBodyIsBadRequest) {
    for (const std::string body : {"not json", R"({"other":"x"})", R"({"mode":5})"}) {
        auto response = handler.handle_mode(make_request(http::verb::post, "/admin/mode", body));

        EXPECT_EQ(response.result(), http::status::bad_request) << body;
        EXPECT_EQ(body_json(response)["error"], "Invalid request body") << body;
    }
    EXPECT_EQ(mode->mode(), proxy::Mode::Playback);
}

TEST_F(ManagementHandlerTest, ModeRejectsOtherMethods) {
    auto response = handler.handle_mode(make_request(http::verb::put, "/admin/mode", R"({"mode":"record"})"));

    EXPECT_EQ(response.result(), http::status::method_not_allowed);
    EXPECT_EQ(mode->mode(), proxy::Mode::Playback);
}

// History

TEST_F(ManagementHandlerTest, HistoryListsEntriesNewestFirst) {
    for (int i = 1; i <= 3; ++i) {
        proxy::HistoryEntry entry;
        entry.id = "fp-" + std::to_string(i);
        entry.timestamp = std::chrono::system_clock::now();
        entry.method = "GET";
        entry.url = "api.example.com/" + std::to_string(i);
        entry.target = entry.url;
        entry.status = 200;
        entry.saved = i == 1;
        history->add(entry);
    }

    auto response = handler.handle_history(make_request(http::verb::get, "/admin/history"));

    ASSERT_EQ(response.result(), http::status::ok);
    auto j = body_json(response);
    EXPECT_EQ(j["count"], 3);
    ASSERT_EQ(j["history"].size(), 3u);
    EXPECT_EQ(j["history"][0]["id"], "fp-3");
    EXPECT_EQ(j["history"][2]["saved"], true);
    for (const auto* key : {"id", "timestamp", "method", "url", "target", "status", "duration", "saved"}) {
        EXPECT_TRUE(j["history"][0].contains(key)) << key;
    }
}

TEST_F(ManagementHandlerTest, EmptyHistoryIsAnEmptyArray) {
    auto j = body_json(handler.handle_history(make_request(http::verb::get, "/admin/history")));

    EXPECT_EQ(j["count"], 0);
    EXPECT_TRUE(j["history"].is_array());
    EXPECT_TRUE(j["history"].empty());
}

// Recordings

TEST_F(ManagementHandlerTest, RecordingsListedNewestFirst) {
    auto now = std::chrono::system_clock::now();
    auto older = make_interaction("api.example.com/old", now - std::chrono::hours(1));
    auto newer = make_interaction("api.example.com/new", now);
    ASSERT_TRUE(repo->store(older).is_ok());
    ASSERT_TRUE(repo->store(newer).is_ok());

    auto response = handler.handle_recordings(make_request(http::verb::get, "/admin/recordings"));

    ASSERT_EQ(response.result(), http::status::ok);
    auto j = body_json(response);
    EXPECT_EQ(j["count"], 2);
    ASSERT_EQ(j["recordings"].size(), 2u);
    EXPECT_EQ(j["recordings"][0]["url"], "api.example.com/new");
    EXPECT_EQ(j["recordings"][0]["id"], newer.request.fingerprint());
    EXPECT_EQ(j["recordings"][0]["uuid"], newer.id);
    EXPECT_EQ(j["recordings"][1]["url"], "api.example.com/old");
}

TEST_F(ManagementHandlerTest, DeleteClearsRecordings) {
    ASSERT_TRUE(repo->store(make_interaction("api.example.com/a", std::chrono::system_clock::now())).is_ok());

    auto response = handler.handle_recordings(make_request(http::verb::delete_, "/admin/recordings"));

    ASSERT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(body_json(response)["message"], "All recordings cleared successfully");
    EXPECT_EQ(repo->count().value(), 0u);

    auto again = handler.handle_recordings(make_request(http::verb::delete_, "/admin/recordings"));
    EXPECT_EQ(again.result(), http::status::ok);
}

TEST_F(ManagementHandlerTest, RecordingsRejectPost) {
    auto response = handler.handle_recordings(make_request(http::verb::post, "/admin/recordings"));

    EXPECT_EQ(response.result(), http::status::method_not_allowed);
}

TEST_F(ManagementHandlerTest, RecordingRequiresId) {
    auto missing = handler.handle_recording(make_request(http::verb::get, "/admin/recording"));
    auto empty = handler.handle_recording(make_request(http::verb::get, "/admin/recording?id="));

    EXPECT_EQ(missing.result(), http::status::bad_request);
    EXPECT_EQ(body_json(missing)["error"], "Missing recording ID");
    EXPECT_EQ(empty.result(), http::status::bad_request);
}

TEST_F(ManagementHandlerTest, UnknownRecordingIs404) {
    auto response = handler.handle_recording(make_request(http::verb::get, "/admin/recording?id=deadbeef"));

    EXPECT_EQ(response.result(), http::status::not_found);
    EXPECT_EQ(body_json(response)["error"].get<std::string>().rfind("Recording not found: ", 0), 0u);
}

TEST_F(ManagementHandlerTest, RecordingFoundByFingerprintOrUuid) {
    auto stored = make_interaction("api.example.com/users/1", std::chrono::system_clock::now());
    ASSERT_TRUE(repo->store(stored).is_ok());

    auto by_fingerprint = handler.handle_recording(
        make_request(http::verb::get, "/admin/recording?id=" + stored.request.fingerprint()));
    auto by_uuid = handler.handle_recording(
        make_request(http::verb::get, "/admin/recording?id=" + stored.id));

    ASSERT_EQ(by_fingerprint.result(), http::status::ok);
    ASSERT_EQ(by_uuid.result(), http::status::ok);

    auto j = body_json(by_fingerprint);
    EXPECT_EQ(j["id"], stored.id);
    EXPECT_EQ(j["request"]["url"], "api.example.com/users/1");
    EXPECT_EQ(j["response"]["status_code"], 200);
    EXPECT_EQ(j["metadata"]["target"], "api.example.com/users/1");
    EXPECT_EQ(body_json(by_uuid)["id"], stored.id);
}

TEST_F(ManagementHandlerTest, RecordingStorageFailureIs500) {
    repo->fail_find = true;

    auto response = handler.handle_recording(make_request(http::verb::get, "/admin/recording?id=abc"));

    EXPECT_EQ(response.result(), http::status::internal_server_error);
    EXPECT_EQ(body_json(response)["error"], "Failed to read recording: permission denied");
}

// Health and routing

TEST_F(ManagementHandlerTest, HealthIsAlwaysHealthy) {
    auto response = handler.handle_health(make_request(http::verb::get, "/health"));

    ASSERT_EQ(response.result(), http::status::ok);
    auto j = body_json(response);
    EXPECT_EQ(j["status"], "healthy");
    EXPECT_TRUE(j["time"].is_string());
}

TEST_F(ManagementHandlerTest, RegistersAdminRoutes) {
    server::Router router(nullptr);
    handler.register_routes(router);

    for (const auto* path : {"/admin/status", "/admin/mode", "/admin/history",
                             "/admin/recordings", "/admin/recording", "/health"}) {
        EXPECT_TRUE(router.has_route(path)) << path;
    }
    EXPECT_FALSE(router.has_route("/proxy"));

    auto response = router.route(make_request(http::verb::get, "/admin/mode?mode=record"));
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(mode->mode(), proxy::Mode::Record);
}
