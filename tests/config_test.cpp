#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace sfuctl;
using json = nlohmann::json;

TEST(ConfigTest, emptyObjectKeepsDefaults)
{
    auto config = ParseConfig(json::object());

    EXPECT_EQ(8000, config.port);
    EXPECT_FALSE(config.enableTls);
    EXPECT_EQ(std::chrono::milliseconds(5000), config.adaptationInterval);
    EXPECT_EQ("info", config.logLevel);
    EXPECT_TRUE(config.preferredVideoCodec.empty());
    EXPECT_TRUE(config.iceServers.empty());
}

TEST(ConfigTest, parsesEveryField)
{
    auto config = ParseConfig(json::parse(R"({
        "port": 9000,
        "enable_tls": true,
        "adaptation_interval_ms": 2500,
        "log_level": "debug",
        "preferred_video_codec": "VP9",
        "ice_servers": ["stun:stun.example.org:3478"]
    })"));

    EXPECT_EQ(9000, config.port);
    EXPECT_TRUE(config.enableTls);
    EXPECT_EQ(std::chrono::milliseconds(2500), config.adaptationInterval);
    EXPECT_EQ("debug", config.logLevel);
    EXPECT_EQ("VP9", config.preferredVideoCodec);
    ASSERT_EQ(1u, config.iceServers.size());
    EXPECT_EQ("stun:stun.example.org:3478", config.iceServers[0]);
}

TEST(ConfigTest, rejectsWrongTypes)
{
    EXPECT_THROW(ParseConfig(json::parse(R"({"port": "8000"})")), ConfigError);
    EXPECT_THROW(ParseConfig(json::parse(R"({"enable_tls": 1})")), ConfigError);
    EXPECT_THROW(ParseConfig(json::parse(R"({"ice_servers": [1]})")), ConfigError);
    EXPECT_THROW(ParseConfig(json::array()), ConfigError);
}

TEST(ConfigTest, rejectsOutOfRangeValues)
{
    EXPECT_THROW(ParseConfig(json::parse(R"({"port": 70000})")), ConfigError);
    EXPECT_THROW(ParseConfig(json::parse(R"({"port": 0})")), ConfigError);
    EXPECT_THROW(ParseConfig(json::parse(R"({"adaptation_interval_ms": 0})")), ConfigError);
    EXPECT_THROW(ParseConfig(json::parse(R"({"adaptation_interval_ms": -5})")), ConfigError);
}

TEST(ConfigTest, loadsFromFile)
{
    const std::string path = ::testing::TempDir() + "sfuctl_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"port": 8443, "enable_tls": true})";
    }

    auto config = LoadConfig(path);
    EXPECT_EQ(8443, config.port);
    EXPECT_TRUE(config.enableTls);

    std::remove(path.c_str());
}

TEST(ConfigTest, loadReportsMissingAndBrokenFiles)
{
    EXPECT_THROW(LoadConfig("/nonexistent/sfuctl.json"), ConfigError);

    const std::string path = ::testing::TempDir() + "sfuctl_broken_config.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_THROW(LoadConfig(path), ConfigError);
    std::remove(path.c_str());
}
