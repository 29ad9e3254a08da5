#include <gtest/gtest.h>
#include "common/config.hpp"
#include "common/logger.hpp"

using namespace riglink;

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(log_level_from_string("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(log_level_from_string("warning"), LogLevel::WARN);
    EXPECT_EQ(log_level_from_string("critical"), LogLevel::ERROR);
    EXPECT_EQ(log_level_from_string("bogus"), LogLevel::INFO);
    EXPECT_EQ(log_level_name(LogLevel::OFF), "off");
}

TEST(LoggerTest, ModuleLevelsInheritFromParent) {
    auto config = ClientConfig::parse(R"({
        "log": { "level": "warn", "modules": { "client": "debug", "client.http": "error" } }
    })");
    ASSERT_TRUE(config.has_value());

    auto& manager = LogManager::instance();
    auto& orchestrator = Logger::get("client.orchestrator");
    manager.configure(config->to_log_config());

    EXPECT_EQ(manager.level_for("client.orchestrator"), LogLevel::DEBUG);
    EXPECT_EQ(manager.level_for("client.http"), LogLevel::ERROR);
    EXPECT_EQ(manager.level_for("common.events"), LogLevel::WARN);

    // A logger created before configure() follows the new levels
    EXPECT_TRUE(orchestrator.enabled(LogLevel::DEBUG));
    EXPECT_FALSE(orchestrator.enabled(LogLevel::TRACE));
    EXPECT_FALSE(Logger::get("client.http").enabled(LogLevel::WARN));

    manager.set_module_level("client.orchestrator", LogLevel::TRACE);
    EXPECT_TRUE(orchestrator.enabled(LogLevel::TRACE));
    EXPECT_EQ(orchestrator.module(), "client.orchestrator");

    manager.configure(LogConfig{});
}
