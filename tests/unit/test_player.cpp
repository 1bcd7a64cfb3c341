#include <gtest/gtest.h>
#include "fakes.hpp"
#include "proxy/player.hpp"

using namespace mirage;
using namespace mirage::proxy;
using mirage::test_support::InMemoryRepository;

namespace {

model::Interaction stored_interaction(const std::string& method, const std::string& url, const std::string& body) {
    model::Interaction interaction;
    interaction.id = model::generate_interaction_id();
    interaction.timestamp = std::chrono::system_clock::now();
    interaction.request.method = method;
    interaction.request.url = url;
    interaction.request.body = body;
    interaction.response.status_code = 200;
    interaction.response.headers["X-Recorded"] = {"yes"};
    interaction.response.body = "recorded body";
    interaction.metadata.target = url;
    return interaction;
}

}  // namespace

TEST(PlayerTest, ReturnsStoredInteractionVerbatim) {
    auto repo = std::make_shared<InMemoryRepository>();
    auto stored = stored_interaction("GET", "api.example.com/users/1", "");
    ASSERT_TRUE(repo->store(stored).is_ok());
    Player player(repo);

    model::RecordedRequest request;
    request.method = "GET";
    request.url = "api.example.com/users/1";
    request.headers["User-Agent"] = {"different-client"};

    auto result = player.handle(request);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().id, stored.id);
    EXPECT_EQ(result.value().response.body, "recorded body");
    EXPECT_EQ(result.value().response.headers.at("X-Recorded").front(), "yes");
}

TEST(PlayerTest, MissIsNoRecording) {
    auto repo = std::make_shared<InMemoryRepository>();
    Player player(repo);

    model::RecordedRequest request;
    request.method = "DELETE";
    request.url = "api.example.com/users/9";

    auto result = player.handle(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::NoRecording);
    EXPECT_NE(result.error().message.find("DELETE api.example.com/users/9"), std::string::npos);
    EXPECT_NE(result.error().message.find(request.fingerprint()), std::string::npos);
}

TEST(PlayerTest, DifferentBodyDoesNotMatch) {
    auto repo = std::make_shared<InMemoryRepository>();
    ASSERT_TRUE(repo->store(stored_interaction("POST", "api.example.com/users", R"({"name":"Alice"})")).is_ok());
    Player player(repo);

    model::RecordedRequest request;
    request.method = "POST";
    request.url = "api.example.com/users";
    request.body = R"({"name":"Bob"})";

    auto result = player.handle(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::NoRecording);
}

TEST(PlayerTest, StorageErrorIsNotAMiss) {
    auto repo = std::make_shared<InMemoryRepository>();
    repo->fail_find = true;
    Player player(repo);

    model::RecordedRequest request;
    request.method = "GET";
    request.url = "api.example.com/users";

    auto result = player.handle(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::StorageFailure);
    EXPECT_EQ(result.error().message, "failed to retrieve recording: permission denied");
}
