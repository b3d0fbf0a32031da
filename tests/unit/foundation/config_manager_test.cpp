#include <gtest/gtest.h>

#include "cgauth/foundation/config_manager.hpp"
#include "cgauth/foundation/error_code.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace cgauth::foundation;

// ===========================================================================
// Loading
// ===========================================================================

TEST(ConfigManagerTest, LoadFromStringFlattensNestedKeys) {
    ConfigManager config;
    auto result = config.loadFromString(R"(
auth:
  signing_key: "k"
  access_token_expiry_seconds: 900
wallet:
  app_name: CGraph
)");
    ASSERT_TRUE(result.hasValue());

    EXPECT_TRUE(config.hasKey("auth.signing_key"));
    EXPECT_EQ(config.get<int>("auth.access_token_expiry_seconds").value(), 900);
    EXPECT_EQ(config.get<std::string>("wallet.app_name").value(), "CGraph");
    EXPECT_FALSE(config.hasKey("auth"));
}

TEST(ConfigManagerTest, NonMapRootIsRejected) {
    ConfigManager config;
    auto result = config.loadFromString("- a\n- b\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, ParseErrorIsReported) {
    ConfigManager config;
    auto result = config.loadFromString("auth: [unclosed");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, MissingFileIsReported) {
    ConfigManager config;
    auto result = config.load("/nonexistent/cgauth/config.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "cgauth_config_manager_test.yaml";
    {
        std::ofstream out(path);
        out << "session:\n  ttl_seconds: 60\n";
    }
    ConfigManager config;
    auto result = config.load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(config.get<int>("session.ttl_seconds").value(), 60);
}

// ===========================================================================
// Typed access
// ===========================================================================

TEST(ConfigManagerTest, MissingKey) {
    ConfigManager config;
    auto result = config.get<int>("nope");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: hello").hasValue());
    auto result = config.get<int>("a");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerTest, GetOrFallsBackOnlyWhenMissing) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: hello").hasValue());
    EXPECT_EQ(config.getOr<int>("b", 5).value(), 5);
    EXPECT_TRUE(config.getOr<int>("a", 5).hasError());
}

// ===========================================================================
// set() and watchers
// ===========================================================================

TEST(ConfigManagerTest, SetNotifiesWatchers) {
    ConfigManager config;
    std::string seen;
    int calls = 0;
    config.watch("breach_check.policy", [&](std::string_view key) {
        seen = std::string(key);
        ++calls;
        // Reading back from a watcher must not deadlock.
        EXPECT_EQ(config.get<std::string>("breach_check.policy").value(), "reject");
    });

    config.set<std::string>("breach_check.policy", "reject");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen, "breach_check.policy");

    config.set<int>("other.key", 1);
    EXPECT_EQ(calls, 1);
}
