#include "mcp/MCPManager.h"
#include "utils/Logger.h"
#include <thread>
#include <chrono>

namespace {
std::chrono::milliseconds ms(int value) {
    return std::chrono::milliseconds(value < 0 ? 0 : value);
}

template <typename T>
std::vector<T> decodeList(const nlohmann::json& result, const char* key) {
    std::vector<T> out;
    if (!result.is_object()) return out;
    auto it = result.find(key);
    if (it == result.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        out.push_back(T::fromJson(item));
    }
    return out;
}
} // namespace

MCPManager::MCPManager(ServerConfigStore& store, Config::Timeouts timeouts)
    : store(store), limits(timeouts), rpc(servers) {}

MCPManager::~MCPManager() {
    stopAll();
}

void MCPManager::setState(const std::string& serverId, ServerState s) {
    std::lock_guard<std::mutex> lock(stateMtx);
    states[serverId] = s;
}

ServerState MCPManager::state(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(stateMtx);
    auto it = states.find(serverId);
    if (it == states.end()) return ServerState::Stopped;
    return it->second;
}

std::optional<pid_t> MCPManager::pidOf(const std::string& serverId) const {
    auto handle = servers.get(serverId);
    if (!handle) return std::nullopt;
    return handle->pid();
}

Result<ServerConfig> MCPManager::resolveConfig(const std::string& serverId) const {
    auto config = store.find(serverId);
    if (!config) {
        return Result<ServerConfig>::fail(ErrorKind::Config, "MCP server '" + serverId + "' not found");
    }
    if (config->command.empty()) {
        return Result<ServerConfig>::fail(ErrorKind::Config, "MCP server '" + serverId + "' has an empty command");
    }
    if (config->type != "stdio") {
        return Result<ServerConfig>::fail(ErrorKind::Config,
                                          "MCP server '" + serverId + "' uses unsupported transport '" +
                                              config->type + "'");
    }
    return Result<ServerConfig>::ok(*config);
}

McpError MCPManager::toError(const RpcOutcome& outcome) {
    McpError e;
    if (outcome.kind == RpcOutcome::Kind::ApplicationError) {
        e.kind = ErrorKind::Application;
        e.code = outcome.code;
        e.data = outcome.data;
    } else {
        e.kind = ErrorKind::Transport;
    }
    e.message = outcome.message;
    return e;
}

Result<nlohmann::json> MCPManager::request(const std::string& serverId, const std::string& method,
                                           const nlohmann::json& params, int timeoutMs) {
    RpcOutcome outcome = rpc.call(serverId, method, params, ms(timeoutMs));
    if (!outcome.ok()) {
        return Result<nlohmann::json>::fail(toError(outcome));
    }
    return Result<nlohmann::json>::ok(outcome.payload);
}

Result<ServerStatus> MCPManager::start(const std::string& serverId) {
    auto& log = Logger::getInstance();
    auto config = resolveConfig(serverId);
    if (!config) {
        log.error(config.error().describe());
        return Result<ServerStatus>::fail(config.error());
    }

    if (servers.contains(serverId)) {
        ServerStatus status;
        status.serverId = serverId;
        status.state = state(serverId);
        status.running = true;
        status.alreadyRunning = true;
        return Result<ServerStatus>::ok(status);
    }

    std::shared_ptr<ProcessHandle> handle;
    try {
        handle = ProcessHandle::spawn(config.value());
    } catch (const SpawnError& e) {
        if (!servers.contains(serverId)) setState(serverId, ServerState::Stopped);
        log.error("Failed to start MCP server '" + serverId + "': " + e.what());
        return Result<ServerStatus>::fail(ErrorKind::Spawn, e.what());
    }

    if (!servers.insert(serverId, handle)) {
        // 并发 start 中输掉注册的一方，收回自己刚启动的进程
        handle->shutdown(ms(0));
        ServerStatus status;
        status.serverId = serverId;
        status.state = state(serverId);
        status.running = true;
        status.alreadyRunning = true;
        return Result<ServerStatus>::ok(status);
    }
    // 只有注册成功的一方推进状态
    setState(serverId, ServerState::Starting);
    log.info("MCP server '" + serverId + "' spawned (pid " + std::to_string(handle->pid()) + ")");

    std::this_thread::sleep_for(ms(limits.startupDelayMs));

    // 不是所有服务器都实现 ping，失败忽略
    RpcOutcome ping = rpc.call(serverId, "ping", nlohmann::json::object(), ms(limits.pingMs));
    if (!ping.ok()) {
        log.debug("MCP server '" + serverId + "' ping: " + ping.describe());
    }

    ServerStatus status;
    status.serverId = serverId;
    status.running = true;

    auto tools = discoverTools(serverId);
    if (tools) {
        status.tools = tools.value();
        status.state = ServerState::Running;
        log.success("MCP server '" + serverId + "' started with " + std::to_string(status.tools.size()) + " tools");
    } else {
        status.state = ServerState::Error;
        status.error = tools.error().describe();
        log.warn("MCP server '" + serverId + "' started but tool discovery failed: " + *status.error);
    }
    // stop 可能在发现期间已经执行
    if (servers.contains(serverId)) {
        setState(serverId, status.state);
    }
    return Result<ServerStatus>::ok(status);
}

Result<bool> MCPManager::stop(const std::string& serverId) {
    // 先从注册表移除，之后不会再有新调用分派到这个进程
    auto handle = servers.remove(serverId);
    if (!handle) {
        return Result<bool>::ok(false);
    }
    setState(serverId, ServerState::Stopping);

    RpcOutcome bye = rpc.call(handle, "terminate", nlohmann::json::object(), ms(limits.terminateMs));
    if (!bye.ok()) {
        Logger::getInstance().debug("MCP server '" + serverId + "' terminate: " + bye.describe());
    }
    handle->shutdown(ms(limits.stopGraceMs));

    if (!servers.contains(serverId)) setState(serverId, ServerState::Stopped);
    Logger::getInstance().info("MCP server '" + serverId + "' stopped");
    return Result<bool>::ok(true);
}

Result<ServerStatus> MCPManager::restart(const std::string& serverId) {
    stop(serverId);  // 未运行时返回 false，不是错误
    std::this_thread::sleep_for(ms(limits.restartDelayMs));
    return start(serverId);
}

std::future<Result<ServerStatus>> MCPManager::startAsync(const std::string& serverId) {
    return std::async(std::launch::async, [this, serverId]() { return start(serverId); });
}

std::future<Result<bool>> MCPManager::stopAsync(const std::string& serverId) {
    return std::async(std::launch::async, [this, serverId]() { return stop(serverId); });
}

std::future<Result<ServerStatus>> MCPManager::restartAsync(const std::string& serverId) {
    return std::async(std::launch::async, [this, serverId]() { return restart(serverId); });
}

int MCPManager::startAll() {
    std::vector<std::future<Result<ServerStatus>>> futures;
    for (const auto& cfg : store.list()) {
        futures.push_back(startAsync(cfg.id));
    }

    int count = 0;
    for (auto& f : futures) {
        if (f.get()) count++;
    }
    return count;
}

void MCPManager::stopAll() {
    std::vector<std::future<Result<bool>>> futures;
    for (const auto& id : servers.ids()) {
        futures.push_back(stopAsync(id));
    }
    for (auto& f : futures) f.wait();
}

Result<bool> MCPManager::removeServer(const std::string& serverId) {
    // 删除配置前必须确保没有运行中的实例
    stop(serverId);
    bool removed = store.erase(serverId);
    {
        std::lock_guard<std::mutex> lock(stateMtx);
        states.erase(serverId);
    }
    if (!removed) {
        return Result<bool>::fail(ErrorKind::Config, "MCP server '" + serverId + "' not found");
    }
    return Result<bool>::ok(true);
}

Result<std::vector<ToolDefinition>> MCPManager::discoverTools(const std::string& serverId) {
    auto res = request(serverId, "tools/list", nlohmann::json::object(), limits.discoveryMs);
    if (!res) return Result<std::vector<ToolDefinition>>::fail(res.error());
    return Result<std::vector<ToolDefinition>>::ok(decodeList<ToolDefinition>(res.value(), "tools"));
}

Result<ToolResult> MCPManager::callTool(const std::string& serverId, const std::string& toolName,
                                        const nlohmann::json& arguments) {
    nlohmann::json params = {
        {"name", toolName},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
    auto res = request(serverId, "tools/call", params, limits.callMs);
    if (!res) return Result<ToolResult>::fail(res.error());

    ToolResult out;
    out.content = res.value();
    if (out.content.is_object()) {
        auto flag = out.content.find("isError");
        out.isError = flag != out.content.end() && flag->is_boolean() && flag->get<bool>();
    }
    return Result<ToolResult>::ok(out);
}

Result<std::vector<ResourceDescriptor>> MCPManager::listResources(const std::string& serverId) {
    auto res = request(serverId, "resources/list", nlohmann::json::object(), limits.callMs);
    if (!res) return Result<std::vector<ResourceDescriptor>>::fail(res.error());
    return Result<std::vector<ResourceDescriptor>>::ok(decodeList<ResourceDescriptor>(res.value(), "resources"));
}

Result<nlohmann::json> MCPManager::readResource(const std::string& serverId, const std::string& uri) {
    return request(serverId, "resources/read", {{"uri", uri}}, limits.callMs);
}

Result<std::vector<PromptDescriptor>> MCPManager::listPrompts(const std::string& serverId) {
    auto res = request(serverId, "prompts/list", nlohmann::json::object(), limits.callMs);
    if (!res) return Result<std::vector<PromptDescriptor>>::fail(res.error());
    return Result<std::vector<PromptDescriptor>>::ok(decodeList<PromptDescriptor>(res.value(), "prompts"));
}

Result<nlohmann::json> MCPManager::getPrompt(const std::string& serverId, const std::string& name,
                                             const std::optional<nlohmann::json>& arguments) {
    nlohmann::json params = {{"name", name}};
    if (arguments) params["arguments"] = *arguments;
    return request(serverId, "prompts/get", params, limits.callMs);
}

Result<ServerStatus> MCPManager::getStatus(const std::string& serverId) {
    if (!store.contains(serverId)) {
        return Result<ServerStatus>::fail(ErrorKind::Config, "MCP server '" + serverId + "' not found");
    }

    ServerStatus status;
    status.serverId = serverId;
    if (!servers.contains(serverId)) {
        status.state = ServerState::Stopped;
        return Result<ServerStatus>::ok(status);
    }

    status.running = true;
    auto tools = discoverTools(serverId);
    if (tools) {
        status.state = ServerState::Running;
        status.tools = tools.value();
    } else {
        status.state = ServerState::Error;
        status.error = tools.error().describe();
    }
    if (servers.contains(serverId)) setState(serverId, status.state);
    return Result<ServerStatus>::ok(status);
}

Result<bool> MCPManager::testConnection(const std::string& serverId) {
    auto config = resolveConfig(serverId);
    if (!config) return Result<bool>::fail(config.error());

    if (servers.contains(serverId)) {
        auto pong = ping(serverId);
        if (!pong) {
            Logger::getInstance().debug("MCP server '" + serverId + "' ping: " + pong.error().describe());
        }
    }
    return Result<bool>::ok(true);
}

Result<bool> MCPManager::ping(const std::string& serverId) {
    auto res = request(serverId, "ping", nlohmann::json::object(), limits.pingMs);
    if (!res) return Result<bool>::fail(res.error());
    return Result<bool>::ok(true);
}

McpStats MCPManager::getStats() {
    McpStats stats;
    stats.totalServers = store.size();

    auto ids = servers.ids();
    stats.runningServers = ids.size();
    for (const auto& id : ids) {
        auto tools = discoverTools(id);
        if (tools) stats.totalTools += tools.value().size();
        auto resources = listResources(id);
        if (resources) stats.totalResources += resources.value().size();
        auto prompts = listPrompts(id);
        if (prompts) stats.totalPrompts += prompts.value().size();
    }
    return stats;
}
