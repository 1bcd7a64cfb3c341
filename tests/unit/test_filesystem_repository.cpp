#include <gtest/gtest.h>
#include "core/encoding.hpp"
#include "storage/filesystem_repository.hpp"
#include <fstream>
#include <sstream>

using namespace mirage;
using namespace mirage::storage;
namespace fs = std::filesystem;

class FileSystemRepositoryTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() /
               ("mirage_repo_test_" + model::generate_interaction_id());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    static model::Interaction make_interaction(
        const std::string& method,
        const std::string& target,
        const std::string& body,
        int status,
        WallTime timestamp = std::chrono::system_clock::now()
    ) {
        model::Interaction interaction;
        interaction.id = model::generate_interaction_id();
        interaction.timestamp = std::chrono::floor<std::chrono::microseconds>(timestamp);
        interaction.request.method = method;
        interaction.request.url = target;
        interaction.request.body = body;
        interaction.response.status_code = status;
        interaction.response.body = "{\"ok\":true}";
        interaction.metadata.target = target;
        interaction.metadata.duration_ms = 7;
        return interaction;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST_F(FileSystemRepositoryTest, CreatesBaseDirectory) {
    FileSystemRepository repo(root / "nested" / "recordings");

    EXPECT_TRUE(fs::is_directory(root / "nested" / "recordings"));
}

TEST_F(FileSystemRepositoryTest, ServiceNameFromTarget) {
    EXPECT_EQ(FileSystemRepository::service_name("api.example.com/users"), "api_example_com");
    EXPECT_EQ(FileSystemRepository::service_name("https://api.example.com:8443/x"), "api_example_com_8443");
    EXPECT_EQ(FileSystemRepository::service_name("http://localhost:3000"), "localhost_3000");
    EXPECT_EQ(FileSystemRepository::service_name(""), "unknown");
    EXPECT_EQ(FileSystemRepository::service_name("/just/a/path"), "unknown");
}

TEST_F(FileSystemRepositoryTest, StoresOneFilePerFingerprint) {
    FileSystemRepository repo(root);
    auto interaction = make_interaction("GET", "api.example.com/users/1", "", 200);

    ASSERT_TRUE(repo.store(interaction).is_ok());

    auto file = root / "api_example_com" / (interaction.request.fingerprint() + ".json");
    ASSERT_TRUE(fs::is_regular_file(file));

    auto j = nlohmann::json::parse(read_file(file));
    EXPECT_EQ(j["id"], interaction.id);
    EXPECT_EQ(j["request"]["method"], "GET");
    EXPECT_EQ(j["response"]["status_code"], 200);
    EXPECT_EQ(j["response"]["body"], base64_encode("{\"ok\":true}"));
    EXPECT_EQ(j["metadata"]["target"], "api.example.com/users/1");

    // Pretty-printed, no temp file left behind
    EXPECT_NE(read_file(file).find("\n  \"id\""), std::string::npos);
    EXPECT_FALSE(fs::exists(root / "api_example_com" / ("." + interaction.request.fingerprint() + ".tmp")));
}

TEST_F(FileSystemRepositoryTest, FindByFingerprintRoundTrips) {
    FileSystemRepository repo(root);
    auto interaction = make_interaction("POST", "api.example.com/users", R"({"name":"Alice"})", 201);
    ASSERT_TRUE(repo.store(interaction).is_ok());

    auto found = repo.find(interaction.request.fingerprint());

    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().id, interaction.id);
    EXPECT_EQ(found.value().timestamp, interaction.timestamp);
    EXPECT_EQ(found.value().request.body, R"({"name":"Alice"})");
    EXPECT_EQ(found.value().response.status_code, 201);
}

TEST_F(FileSystemRepositoryTest, FindByInteractionId) {
    FileSystemRepository repo(root);
    auto interaction = make_interaction("GET", "api.example.com/a", "", 200);
    ASSERT_TRUE(repo.store(interaction).is_ok());

    auto found = repo.find_by_key(interaction.id);

    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().request.fingerprint(), interaction.request.fingerprint());

    auto by_fingerprint = repo.find_by_key(interaction.request.fingerprint());
    ASSERT_TRUE(by_fingerprint.is_ok());
    EXPECT_EQ(by_fingerprint.value().id, interaction.id);
}

TEST_F(FileSystemRepositoryTest, FindIgnoresInteractionId) {
    FileSystemRepository repo(root);
    auto interaction = make_interaction("GET", "api.example.com/a", "", 200);
    ASSERT_TRUE(repo.store(interaction).is_ok());

    auto found = repo.find(interaction.id);

    ASSERT_TRUE(found.is_err());
    EXPECT_EQ(found.error().kind, ErrorKind::NotFound);
}

TEST_F(FileSystemRepositoryTest, MissIsNotFound) {
    FileSystemRepository repo(root);

    auto found = repo.find(std::string(64, 'a'));

    ASSERT_TRUE(found.is_err());
    EXPECT_EQ(found.error().kind, ErrorKind::NotFound);
    EXPECT_NE(found.error().message.find("interaction not found"), std::string::npos);
}

TEST_F(FileSystemRepositoryTest, PathLikeKeysNeverEscapeRoot) {
    FileSystemRepository repo(root);

    EXPECT_EQ(repo.find("../etc/passwd").error().kind, ErrorKind::NotFound);
    EXPECT_EQ(repo.find("").error().kind, ErrorKind::NotFound);
    EXPECT_EQ(repo.find_by_key("../etc/passwd").error().kind, ErrorKind::NotFound);
}

TEST_F(FileSystemRepositoryTest, StoreOverwritesSameFingerprint) {
    FileSystemRepository repo(root);
    auto first = make_interaction("GET", "api.example.com/users", "", 200);
    auto second = make_interaction("GET", "api.example.com/users", "", 503);

    ASSERT_TRUE(repo.store(first).is_ok());
    ASSERT_TRUE(repo.store(second).is_ok());

    EXPECT_EQ(repo.count().value(), 1u);
    auto found = repo.find(first.request.fingerprint());
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().id, second.id);
    EXPECT_EQ(found.value().response.status_code, 503);
}

TEST_F(FileSystemRepositoryTest, FindAllNewestFirstAcrossServices) {
    FileSystemRepository repo(root);
    auto now = std::chrono::system_clock::now();
    auto oldest = make_interaction("GET", "a.example.com/1", "", 200, now - std::chrono::seconds(20));
    auto middle = make_interaction("GET", "b.example.com/2", "", 200, now - std::chrono::seconds(10));
    auto newest = make_interaction("GET", "a.example.com/3", "", 200, now);

    ASSERT_TRUE(repo.store(middle).is_ok());
    ASSERT_TRUE(repo.store(oldest).is_ok());
    ASSERT_TRUE(repo.store(newest).is_ok());

    auto all = repo.find_all();

    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].id, newest.id);
    EXPECT_EQ(all.value()[1].id, middle.id);
    EXPECT_EQ(all.value()[2].id, oldest.id);
    EXPECT_EQ(repo.count().value(), 3u);
}

TEST_F(FileSystemRepositoryTest, ClearRemovesEverythingAndIsIdempotent) {
    FileSystemRepository repo(root);
    auto first = make_interaction("GET", "a.example.com/1", "", 200);
    auto second = make_interaction("GET", "b.example.com/1", "", 200);
    ASSERT_TRUE(repo.store(first).is_ok());
    ASSERT_TRUE(repo.store(second).is_ok());

    ASSERT_TRUE(repo.clear().is_ok());
    EXPECT_EQ(repo.count().value(), 0u);
    EXPECT_TRUE(repo.find_all().value().empty());
    for (const auto* interaction : {&first, &second}) {
        auto found = repo.find(interaction->request.fingerprint());
        ASSERT_TRUE(found.is_err());
        EXPECT_EQ(found.error().kind, ErrorKind::NotFound);
        EXPECT_EQ(repo.find_by_key(interaction->id).error().kind, ErrorKind::NotFound);
    }

    ASSERT_TRUE(repo.clear().is_ok());
}

TEST_F(FileSystemRepositoryTest, ClearSucceedsWhenRootIsGone) {
    FileSystemRepository repo(root);
    fs::remove_all(root);

    EXPECT_TRUE(repo.clear().is_ok());
    EXPECT_EQ(repo.count().value(), 0u);
}

TEST_F(FileSystemRepositoryTest, MissIsNotFoundWhenRootIsGone) {
    FileSystemRepository repo(root);
    fs::remove_all(root);

    EXPECT_EQ(repo.find(std::string(64, 'a')).error().kind, ErrorKind::NotFound);
    EXPECT_EQ(repo.find_by_key("some-id").error().kind, ErrorKind::NotFound);
}

TEST_F(FileSystemRepositoryTest, CorruptFileIsStorageFailure) {
    FileSystemRepository repo(root);
    fs::create_directories(root / "broken_example_com");
    std::ofstream(root / "broken_example_com" / "deadbeef.json") << "{ not json";

    auto found = repo.find("deadbeef");

    ASSERT_TRUE(found.is_err());
    EXPECT_EQ(found.error().kind, ErrorKind::StorageFailure);
    EXPECT_TRUE(repo.find_all().is_err());
}

TEST_F(FileSystemRepositoryTest, CorruptFileDoesNotBreakOtherLookups) {
    FileSystemRepository repo(root);
    auto stored = make_interaction("GET", "api.example.com/ok", "", 200);
    ASSERT_TRUE(repo.store(stored).is_ok());
    fs::create_directories(root / "broken_example_com");
    std::ofstream(root / "broken_example_com" / "deadbeef.json") << "{ not json";

    auto miss = repo.find(std::string(64, 'a'));
    ASSERT_TRUE(miss.is_err());
    EXPECT_EQ(miss.error().kind, ErrorKind::NotFound);

    auto unknown_id = repo.find_by_key("not-a-stored-id");
    ASSERT_TRUE(unknown_id.is_err());
    EXPECT_EQ(unknown_id.error().kind, ErrorKind::NotFound);

    auto by_id = repo.find_by_key(stored.id);
    ASSERT_TRUE(by_id.is_ok());
    EXPECT_EQ(by_id.value().response.status_code, 200);
}

TEST_F(FileSystemRepositoryTest, IgnoresNonJsonFiles) {
    FileSystemRepository repo(root);
    std::ofstream(root / "README.txt") << "notes";

    EXPECT_EQ(repo.count().value(), 0u);
}
