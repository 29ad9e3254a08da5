#include <gtest/gtest.h>
#include "common/config.hpp"

#include <filesystem>
#include <fstream>

using namespace riglink;

TEST(ClientConfigTest, EmptyObjectKeepsDefaults) {
    auto config = ClientConfig::parse("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->app_name, "RigLink");
    EXPECT_EQ(config->effective_station_name(), ClientConfig::DEFAULT_STATION_NAME);
    EXPECT_EQ(config->auth.request_timeout, std::chrono::seconds(10));
    EXPECT_TRUE(config->auth.ssl_verify);
    EXPECT_EQ(config->auth.scope, "openid offline_access email picture");
}

TEST(ClientConfigTest, ParseSections) {
    auto config = ClientConfig::parse(R"({
        "client": {
            "app_name": "Bench",
            "platform": "Linux",
            "station_name": "Shack PC",
            "state_dir": "/var/lib/riglink"
        },
        "auth": {
            "domain": "https://id.example.com/",
            "client_id": "abc",
            "authenticate_url": "https://id.example.com/oauth/ro",
            "delegation_url": "https://id.example.com/delegation",
            "timeout_seconds": 3,
            "ssl_verify": false
        },
        "log": {
            "level": "debug",
            "file": "/tmp/riglink.log",
            "modules": { "client.auth": "trace" }
        }
    })");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->app_name, "Bench");
    EXPECT_EQ(config->effective_station_name(), "Shack PC");
    EXPECT_EQ(config->state_dir, "/var/lib/riglink");
    EXPECT_EQ(config->auth.domain, "https://id.example.com/");
    EXPECT_EQ(config->auth.client_id, "abc");
    EXPECT_EQ(config->auth.request_timeout, std::chrono::seconds(3));
    EXPECT_FALSE(config->auth.ssl_verify);

    auto log_config = config->to_log_config();
    EXPECT_EQ(log_config.global_level, LogLevel::DEBUG);
    EXPECT_EQ(log_config.file_path, "/tmp/riglink.log");
    EXPECT_EQ(log_config.module_levels.at("client.auth"), LogLevel::TRACE);
}

TEST(ClientConfigTest, NonPositiveTimeoutRejected) {
    auto config = ClientConfig::parse(R"({"auth": {"timeout_seconds": 0}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::INVALID_VALUE);
}

TEST(ClientConfigTest, EmptyClientIdRejected) {
    auto config = ClientConfig::parse(R"({"auth": {"client_id": ""}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::MISSING_REQUIRED);
}

TEST(ClientConfigTest, MalformedJson) {
    auto config = ClientConfig::parse("{\"client\": ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::PARSE_ERROR);
}

TEST(ClientConfigTest, MissingFile) {
    auto config = ClientConfig::load("/nonexistent/riglink.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), ConfigError::FILE_NOT_FOUND);
}

TEST(ClientConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "riglink_config_test.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"client": {"station_name": "Field"}})";
    }
    auto config = ClientConfig::load(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->station_name, "Field");
}
