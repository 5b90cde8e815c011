#pragma once
#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json inputSchema = nlohmann::json::object();

    nlohmann::json toJson() const;
    static ToolDefinition fromJson(const nlohmann::json& j);
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType;

    nlohmann::json toJson() const;
    static ResourceDescriptor fromJson(const nlohmann::json& j);
};

struct PromptDescriptor {
    std::string name;
    std::string description;
    nlohmann::json arguments = nlohmann::json::array();

    nlohmann::json toJson() const;
    static PromptDescriptor fromJson(const nlohmann::json& j);
};

/** tools/call 的返回内容，isError 对应 MCP 结果中的 isError 标志 */
struct ToolResult {
    nlohmann::json content = nlohmann::json::object();
    bool isError = false;
};

enum class ServerState {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error
};

const char* toString(ServerState state);

struct ServerStatus {
    std::string serverId;
    ServerState state = ServerState::Stopped;
    bool running = false;
    bool alreadyRunning = false;
    std::vector<ToolDefinition> tools;
    std::optional<std::string> error;

    nlohmann::json toJson() const;
};

struct McpStats {
    size_t totalServers = 0;
    size_t runningServers = 0;
    size_t totalTools = 0;
    size_t totalResources = 0;
    size_t totalPrompts = 0;

    nlohmann::json toJson() const;
};

enum class ErrorKind {
    Config,
    Spawn,
    Transport,
    Application
};

struct McpError {
    ErrorKind kind = ErrorKind::Transport;
    std::string message;
    int code = 0;  // JSON-RPC error code, Application only
    nlohmann::json data;

    /** "<Kind> error: <message>" */
    std::string describe() const;
};

/**
 * @brief 操作结果: 成功值或 McpError 二选一
 */
template <typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.val = std::move(value);
        return r;
    }

    static Result fail(McpError error) {
        Result r;
        r.err = std::move(error);
        return r;
    }

    static Result fail(ErrorKind kind, std::string message) {
        McpError e;
        e.kind = kind;
        e.message = std::move(message);
        return fail(std::move(e));
    }

    bool isOk() const { return val.has_value(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const { return *val; }
    T& value() { return *val; }
    const McpError& error() const { return *err; }

private:
    Result() = default;
    std::optional<T> val;
    std::optional<McpError> err;
};
