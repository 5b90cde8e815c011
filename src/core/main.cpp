#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/ServerConfigStore.h"
#include "mcp/MCPManager.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string YELLOW = "\033[38;5;226m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

namespace {
void printHelp() {
    std::cout << BOLD << "Commands:" << RESET << "\n"
              << "  servers                          list configured servers\n"
              << "  start <id> | stop <id> | restart <id>\n"
              << "  status <id>                      state and tool catalog\n"
              << "  tools <id>                       tools/list\n"
              << "  call <id> <tool> [json-args]     tools/call\n"
              << "  resources <id>                   resources/list\n"
              << "  read <id> <uri>                  resources/read\n"
              << "  prompts <id>                     prompts/list\n"
              << "  prompt <id> <name> [json-args]   prompts/get\n"
              << "  ping <id>                        ping a running server\n"
              << "  stats                            totals across running servers\n"
              << "  help | quit" << std::endl;
}

void printError(const McpError& e) {
    std::cout << RED << "✖ " << e.describe() << RESET << std::endl;
    if (e.kind == ErrorKind::Application && !e.data.is_null()) {
        std::cout << GRAY << e.data.dump(2) << RESET << std::endl;
    }
}

void printStatus(const ServerStatus& s) {
    std::string color = s.state == ServerState::Running ? GREEN : (s.state == ServerState::Error ? YELLOW : GRAY);
    std::cout << BOLD << s.serverId << RESET << " " << color << toString(s.state) << RESET;
    if (s.alreadyRunning) std::cout << GRAY << " (already running)" << RESET;
    std::cout << std::endl;
    if (s.error) std::cout << YELLOW << "  ⚠ " << *s.error << RESET << std::endl;
    for (const auto& t : s.tools) {
        std::cout << "  " << CYAN << t.name << RESET << "  " << GRAY << t.description << RESET << std::endl;
    }
}

std::optional<nlohmann::json> parseArgs(const std::string& text) {
    if (text.empty()) return nlohmann::json::object();
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        std::cout << RED << "✖ Invalid JSON arguments: " << e.what() << RESET << std::endl;
        return std::nullopt;
    }
}

std::string restOfLine(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    size_t start = rest.find_first_not_of(" \t");
    return start == std::string::npos ? "" : rest.substr(start);
}
} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = argc > 1 ? argv[1] : "tether.json";

    Config cfg;
    if (fs::exists(fs::u8path(configPath))) {
        try {
            cfg = Config::load(configPath);
        } catch (const std::exception& e) {
            std::cerr << RED << "✖ " << e.what() << RESET << std::endl;
            return 1;
        }
    } else {
        std::cerr << YELLOW << "⚠ Config file not found: " << configPath << " (no servers configured)" << RESET
                  << std::endl;
    }

    auto& log = Logger::getInstance();
    log.setLogFile(cfg.log.file);
    log.setConsoleLevel(Logger::parseLevel(cfg.log.level));

    ServerConfigStore store(cfg.mcpServers);
    MCPManager manager(store, cfg.timeouts);

    std::cout << BOLD << CYAN << "Tether" << RESET << GRAY << "  MCP process supervisor, " << store.size()
              << " server(s) configured. Type 'help'." << RESET << std::endl;

    std::string line;
    while (true) {
        std::cout << BOLD << "tether> " << RESET << std::flush;
        if (!std::getline(std::cin, line)) break;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;
        if (cmd.empty()) continue;
        if (cmd == "quit" || cmd == "exit") break;

        std::string id;
        iss >> id;

        if (cmd == "help") {
            printHelp();
        } else if (cmd == "servers") {
            for (const auto& s : store.list()) {
                std::cout << BOLD << s.id << RESET << " " << toString(manager.state(s.id)) << GRAY << "  " << s.command;
                for (const auto& a : s.args) std::cout << " " << a;
                std::cout << RESET << std::endl;
            }
        } else if (cmd == "stats") {
            std::cout << manager.getStats().toJson().dump(2) << std::endl;
        } else if (id.empty()) {
            std::cout << YELLOW << "⚠ Missing server id. Type 'help'." << RESET << std::endl;
        } else if (cmd == "start" || cmd == "restart" || cmd == "status") {
            auto res = cmd == "start" ? manager.startAsync(id).get()
                     : cmd == "restart" ? manager.restartAsync(id).get()
                     : manager.getStatus(id);
            if (res) printStatus(res.value()); else printError(res.error());
        } else if (cmd == "stop") {
            auto res = manager.stop(id);
            std::cout << (res.value() ? GREEN + "✔ stopped" : GRAY + "already stopped") << RESET << std::endl;
        } else if (cmd == "tools") {
            auto res = manager.discoverTools(id);
            if (!res) { printError(res.error()); continue; }
            for (const auto& t : res.value()) {
                std::cout << CYAN << t.name << RESET << "  " << t.description << std::endl;
                std::cout << GRAY << "  " << t.inputSchema.dump() << RESET << std::endl;
            }
        } else if (cmd == "call") {
            std::string tool;
            iss >> tool;
            auto args = parseArgs(restOfLine(iss));
            if (tool.empty() || !args) continue;
            auto res = manager.callTool(id, tool, *args);
            if (!res) { printError(res.error()); continue; }
            std::cout << (res.value().isError ? YELLOW : RESET) << res.value().content.dump(2) << RESET << std::endl;
        } else if (cmd == "resources") {
            auto res = manager.listResources(id);
            if (!res) { printError(res.error()); continue; }
            for (const auto& r : res.value()) {
                std::cout << CYAN << r.uri << RESET << "  " << r.name << GRAY << "  " << r.description << RESET
                          << std::endl;
            }
        } else if (cmd == "read") {
            std::string uri;
            iss >> uri;
            auto res = manager.readResource(id, uri);
            if (res) std::cout << res.value().dump(2) << std::endl; else printError(res.error());
        } else if (cmd == "prompts") {
            auto res = manager.listPrompts(id);
            if (!res) { printError(res.error()); continue; }
            for (const auto& p : res.value()) {
                std::cout << CYAN << p.name << RESET << "  " << p.description << std::endl;
            }
        } else if (cmd == "prompt") {
            std::string name;
            iss >> name;
            std::string rest = restOfLine(iss);
            std::optional<nlohmann::json> args;
            if (!rest.empty()) {
                args = parseArgs(rest);
                if (!args) continue;
            }
            auto res = manager.getPrompt(id, name, args);
            if (res) std::cout << res.value().dump(2) << std::endl; else printError(res.error());
        } else if (cmd == "ping") {
            auto res = manager.testConnection(id);
            if (!res) { printError(res.error()); continue; }
            if (!manager.isRunning(id)) {
                std::cout << GRAY << "not running" << RESET << std::endl;
                continue;
            }
            auto pong = manager.ping(id);
            if (pong) std::cout << GREEN << "✔ pong" << RESET << std::endl; else printError(pong.error());
        } else {
            std::cout << YELLOW << "⚠ Unknown command: " << cmd << RESET << std::endl;
        }
    }

    manager.stopAll();
    return 0;
}
