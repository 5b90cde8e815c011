#pragma once
#include <string>
#include <chrono>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include "mcp/RpcOutcome.h"
#include "mcp/RequestCorrelator.h"
#include "mcp/ServerRegistry.h"

/**
 * @brief 一次完整的 JSON-RPC 调用
 *
 * 查找进程 -> 分配 id -> 编码 -> 写入 -> 在截止时间内读取对应 id 的响应 -> 分类。
 *
 * 每次读取都按期望的 id 校验: 带 method 的帧 (通知、服务端请求) 和 id 小于期望值的帧
 * (之前超时调用的迟到响应) 被丢弃。没有 id 或 id 为 null 的 result/error 帧
 * 视为本次请求的响应，其它 id 视为 TransportError。
 */
class RpcExchange {
public:
    explicit RpcExchange(ServerRegistry& registry) : registry(registry) {}

    RpcOutcome call(const std::string& serverId, const std::string& method, const nlohmann::json& params,
                    std::chrono::milliseconds timeout);

    /** Same exchange against a handle that may already be out of the registry (used by stop). */
    RpcOutcome call(const std::shared_ptr<ProcessHandle>& handle, const std::string& method,
                    const nlohmann::json& params, std::chrono::milliseconds timeout);

    /** Runs call() on a worker thread. */
    std::future<RpcOutcome> callAsync(const std::string& serverId, const std::string& method,
                                      const nlohmann::json& params, std::chrono::milliseconds timeout);

    RequestCorrelator& correlator() { return ids; }

    static nlohmann::json makeRequest(uint64_t id, const std::string& method, const nlohmann::json& params);

    /** Classifies a decoded response envelope into Success / ApplicationError. */
    static RpcOutcome classify(const nlohmann::json& response);

private:
    ServerRegistry& registry;
    RequestCorrelator ids;
};
