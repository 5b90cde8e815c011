#include "mcp/McpTypes.h"

namespace {
std::string stringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}
} // namespace

nlohmann::json ToolDefinition::toJson() const {
    return {{"name", name}, {"description", description}, {"inputSchema", inputSchema}};
}

ToolDefinition ToolDefinition::fromJson(const nlohmann::json& j) {
    ToolDefinition t;
    if (!j.is_object()) return t;
    t.name = stringField(j, "name");
    t.description = stringField(j, "description");
    if (j.contains("inputSchema")) t.inputSchema = j["inputSchema"];
    return t;
}

nlohmann::json ResourceDescriptor::toJson() const {
    nlohmann::json j = {{"uri", uri}, {"name", name}, {"description", description}};
    if (!mimeType.empty()) j["mimeType"] = mimeType;
    return j;
}

ResourceDescriptor ResourceDescriptor::fromJson(const nlohmann::json& j) {
    ResourceDescriptor r;
    if (!j.is_object()) return r;
    r.uri = stringField(j, "uri");
    r.name = stringField(j, "name");
    r.description = stringField(j, "description");
    r.mimeType = stringField(j, "mimeType");
    return r;
}

nlohmann::json PromptDescriptor::toJson() const {
    return {{"name", name}, {"description", description}, {"arguments", arguments}};
}

PromptDescriptor PromptDescriptor::fromJson(const nlohmann::json& j) {
    PromptDescriptor p;
    if (!j.is_object()) return p;
    p.name = stringField(j, "name");
    p.description = stringField(j, "description");
    if (j.contains("arguments") && j["arguments"].is_array()) p.arguments = j["arguments"];
    return p;
}

const char* toString(ServerState state) {
    switch (state) {
        case ServerState::Stopped: return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Running: return "running";
        case ServerState::Stopping: return "stopping";
        case ServerState::Error: return "error";
    }
    return "unknown";
}

nlohmann::json ServerStatus::toJson() const {
    nlohmann::json toolList = nlohmann::json::array();
    for (const auto& t : tools) toolList.push_back(t.toJson());
    nlohmann::json j = {
        {"server_id", serverId},
        {"state", toString(state)},
        {"running", running},
        {"tools", toolList}
    };
    if (error) j["error"] = *error;
    return j;
}

nlohmann::json McpStats::toJson() const {
    return {
        {"total_servers", totalServers},
        {"running_servers", runningServers},
        {"total_tools", totalTools},
        {"total_resources", totalResources},
        {"total_prompts", totalPrompts}
    };
}

std::string McpError::describe() const {
    std::string prefix;
    switch (kind) {
        case ErrorKind::Config: prefix = "Config"; break;
        case ErrorKind::Spawn: prefix = "Spawn"; break;
        case ErrorKind::Transport: prefix = "Transport"; break;
        case ErrorKind::Application:
            prefix = "Application";
            return prefix + " error " + std::to_string(code) + ": " + message;
    }
    return prefix + " error: " + message;
}
