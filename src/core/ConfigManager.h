#pragma once
#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct Log {
        std::string file = "tether.log";
        std::string level = "info";
    } log;

    /** 各类超时与等待时间 (毫秒) */
    struct Timeouts {
        int startupDelayMs = 500;
        int pingMs = 1000;
        int discoveryMs = 10000;
        int callMs = 10000;
        int terminateMs = 1000;
        int stopGraceMs = 100;
        int restartDelayMs = 200;
    } timeouts;

    struct MCPServerConfig {
        std::string id;
        std::string type = "stdio";  // 目前只实现 stdio
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;

        static MCPServerConfig fromJson(const nlohmann::json& item) {
            MCPServerConfig server;
            // 兼容旧配置里的 name 字段
            server.id = item.value("id", item.value("name", ""));
            server.type = item.value("type", "stdio");
            server.command = item.value("command", "");
            server.args = item.value("args", std::vector<std::string>{});
            server.env = item.value("env", std::map<std::string, std::string>{});
            return server;
        }
    };
    std::vector<MCPServerConfig> mcpServers;

    static Config parse(const nlohmann::json& j) {
        Config cfg;
        if (j.contains("log")) {
            const auto& l = j["log"];
            cfg.log.file = l.value("file", cfg.log.file);
            cfg.log.level = l.value("level", cfg.log.level);
        }
        if (j.contains("timeouts")) {
            const auto& t = j["timeouts"];
            cfg.timeouts.startupDelayMs = t.value("startup_delay_ms", cfg.timeouts.startupDelayMs);
            cfg.timeouts.pingMs = t.value("ping_ms", cfg.timeouts.pingMs);
            cfg.timeouts.discoveryMs = t.value("discovery_ms", cfg.timeouts.discoveryMs);
            cfg.timeouts.callMs = t.value("call_ms", cfg.timeouts.callMs);
            cfg.timeouts.terminateMs = t.value("terminate_ms", cfg.timeouts.terminateMs);
            cfg.timeouts.stopGraceMs = t.value("stop_grace_ms", cfg.timeouts.stopGraceMs);
            cfg.timeouts.restartDelayMs = t.value("restart_delay_ms", cfg.timeouts.restartDelayMs);
        }
        if (j.contains("mcp_servers")) {
            for (const auto& item : j["mcp_servers"]) {
                auto server = MCPServerConfig::fromJson(item);
                if (!server.id.empty()) {
                    cfg.mcpServers.push_back(std::move(server));
                }
            }
        }
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return parse(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config in " + path.string() + ": " + e.what());
        }
    }
};

using ServerConfig = Config::MCPServerConfig;
