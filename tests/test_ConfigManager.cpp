#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>

#include "core/ConfigManager.h"
#include "core/ServerConfigStore.h"

namespace fs = std::filesystem;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / fs::path("tether_config_test_" + std::to_string(now));
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    std::string writeConfig(const std::string& content) {
        auto path = (testDir / "tether.json").string();
        std::ofstream f(path);
        f << content;
        return path;
    }

    fs::path testDir;
};

TEST_F(ConfigManagerTest, LoadsServersAndTimeouts) {
    auto path = writeConfig(R"({
        "log": {"file": "", "level": "debug"},
        "timeouts": {"startup_delay_ms": 10, "discovery_ms": 2500},
        "mcp_servers": [
            {"id": "fs", "type": "stdio", "command": "mcp-fs", "args": ["--root", "."], "env": {"LOG": "1"}},
            {"name": "legacy", "command": "legacy-server"}
        ]
    })");

    Config cfg = Config::load(path);
    EXPECT_EQ(cfg.log.file, "");
    EXPECT_EQ(cfg.log.level, "debug");
    EXPECT_EQ(cfg.timeouts.startupDelayMs, 10);
    EXPECT_EQ(cfg.timeouts.discoveryMs, 2500);
    EXPECT_EQ(cfg.timeouts.callMs, 10000);

    ASSERT_EQ(cfg.mcpServers.size(), 2u);
    const auto& fsServer = cfg.mcpServers[0];
    EXPECT_EQ(fsServer.id, "fs");
    EXPECT_EQ(fsServer.command, "mcp-fs");
    EXPECT_EQ(fsServer.args, (std::vector<std::string>{"--root", "."}));
    EXPECT_EQ(fsServer.env.at("LOG"), "1");

    EXPECT_EQ(cfg.mcpServers[1].id, "legacy");
    EXPECT_EQ(cfg.mcpServers[1].type, "stdio");
}

TEST_F(ConfigManagerTest, MissingFileThrows) {
    EXPECT_THROW(Config::load((testDir / "nope.json").string()), std::runtime_error);
}

TEST_F(ConfigManagerTest, MalformedJsonThrows) {
    auto path = writeConfig("{ not json");
    EXPECT_THROW(Config::load(path), std::runtime_error);
}

TEST_F(ConfigManagerTest, WrongFieldTypeThrows) {
    auto path = writeConfig(R"({"mcp_servers": [{"id": "x", "command": 12}]})");
    EXPECT_THROW(Config::load(path), std::runtime_error);
}

TEST(ServerConfigStore, UpsertFindErase) {
    ServerConfigStore store;
    ServerConfig cfg;
    cfg.id = "a";
    cfg.command = "one";
    store.upsert(cfg);
    cfg.command = "two";
    store.upsert(cfg);

    EXPECT_EQ(store.size(), 1u);
    ASSERT_TRUE(store.find("a").has_value());
    EXPECT_EQ(store.find("a")->command, "two");
    EXPECT_FALSE(store.find("b").has_value());

    EXPECT_TRUE(store.erase("a"));
    EXPECT_FALSE(store.erase("a"));
    EXPECT_FALSE(store.contains("a"));
}
