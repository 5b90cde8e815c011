#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <future>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/ServerConfigStore.h"
#include "mcp/McpTypes.h"
#include "mcp/ServerRegistry.h"
#include "mcp/RpcExchange.h"

/**
 * @brief MCP 服务器生命周期管理
 *
 * 每个服务器 id 的状态: Stopped -> Starting -> Running -> Stopping -> Stopped，
 * 启动后发现工具失败时进入 Error (仅提示，服务器仍然注册、可以调用)。
 *
 * 所有公开操作都返回 Result，子进程的任何异常行为都不会让宿主进程崩溃。
 * start/stop 对已运行/已停止的服务器是幂等的。
 */
class MCPManager {
public:
    explicit MCPManager(ServerConfigStore& store, Config::Timeouts timeouts = Config::Timeouts{});
    ~MCPManager();

    MCPManager(const MCPManager&) = delete;
    MCPManager& operator=(const MCPManager&) = delete;

    // 生命周期
    Result<ServerStatus> start(const std::string& serverId);
    Result<bool> stop(const std::string& serverId);
    Result<ServerStatus> restart(const std::string& serverId);

    std::future<Result<ServerStatus>> startAsync(const std::string& serverId);
    std::future<Result<bool>> stopAsync(const std::string& serverId);
    std::future<Result<ServerStatus>> restartAsync(const std::string& serverId);

    /** Starts every configured server in parallel, returns how many are running afterwards. */
    int startAll();
    void stopAll();

    /** Stops the server if running, then erases its configuration. */
    Result<bool> removeServer(const std::string& serverId);

    // 能力发现与调用
    Result<std::vector<ToolDefinition>> discoverTools(const std::string& serverId);
    Result<ToolResult> callTool(const std::string& serverId, const std::string& toolName,
                                const nlohmann::json& arguments);
    Result<std::vector<ResourceDescriptor>> listResources(const std::string& serverId);
    Result<nlohmann::json> readResource(const std::string& serverId, const std::string& uri);
    Result<std::vector<PromptDescriptor>> listPrompts(const std::string& serverId);
    Result<nlohmann::json> getPrompt(const std::string& serverId, const std::string& name,
                                     const std::optional<nlohmann::json>& arguments = std::nullopt);

    // 状态
    Result<ServerStatus> getStatus(const std::string& serverId);
    Result<bool> testConnection(const std::string& serverId);
    /** Sends ping to a running server. Transport error "server not running" when it is not registered. */
    Result<bool> ping(const std::string& serverId);
    McpStats getStats();

    ServerState state(const std::string& serverId) const;
    bool isRunning(const std::string& serverId) const { return servers.contains(serverId); }
    std::optional<pid_t> pidOf(const std::string& serverId) const;

    ServerRegistry& registry() { return servers; }
    RpcExchange& exchange() { return rpc; }
    const Config::Timeouts& timeouts() const { return limits; }

private:
    ServerConfigStore& store;
    Config::Timeouts limits;
    ServerRegistry servers;
    RpcExchange rpc;

    mutable std::mutex stateMtx;
    std::unordered_map<std::string, ServerState> states;

    void setState(const std::string& serverId, ServerState s);
    Result<ServerConfig> resolveConfig(const std::string& serverId) const;
    Result<nlohmann::json> request(const std::string& serverId, const std::string& method,
                                   const nlohmann::json& params, int timeoutMs);
    static McpError toError(const RpcOutcome& outcome);
};
