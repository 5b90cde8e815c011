#include "mcp/RpcExchange.h"
#include "mcp/FrameCodec.h"
#include "utils/Logger.h"
#include <system_error>

namespace {
bool isIdlessReply(const nlohmann::json& msg) {
    if (!msg.is_object()) return false;
    auto id = msg.find("id");
    if (id != msg.end() && !id->is_null()) return false;
    return msg.contains("result") || msg.contains("error");
}
} // namespace

nlohmann::json RpcExchange::makeRequest(uint64_t id, const std::string& method, const nlohmann::json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::object() : params}
    };
}

RpcOutcome RpcExchange::classify(const nlohmann::json& response) {
    if (!response.is_object()) {
        return RpcOutcome::transportError("response is not a JSON object");
    }

    auto err = response.find("error");
    if (err != response.end() && !err->is_null()) {
        int code = 0;
        std::string message = "Unknown error";
        nlohmann::json data;
        if (err->is_object()) {
            if (err->contains("code") && (*err)["code"].is_number_integer()) code = (*err)["code"].get<int>();
            if (err->contains("message") && (*err)["message"].is_string()) {
                message = (*err)["message"].get<std::string>();
            }
            if (err->contains("data")) data = (*err)["data"];
        } else if (err->is_string()) {
            message = err->get<std::string>();
        }
        return RpcOutcome::applicationError(code, message, data);
    }

    auto result = response.find("result");
    if (result == response.end() || result->is_null()) {
        return RpcOutcome::success(nlohmann::json::object());
    }
    return RpcOutcome::success(*result);
}

RpcOutcome RpcExchange::call(const std::string& serverId, const std::string& method, const nlohmann::json& params,
                             std::chrono::milliseconds timeout) {
    auto handle = registry.get(serverId);
    if (!handle) {
        return RpcOutcome::transportError("server not running");
    }
    return call(handle, method, params, timeout);
}

RpcOutcome RpcExchange::call(const std::shared_ptr<ProcessHandle>& handle, const std::string& method,
                             const nlohmann::json& params, std::chrono::milliseconds timeout) {
    if (!handle) return RpcOutcome::transportError("server not running");

    auto& log = Logger::getInstance();
    const auto deadline = ProcessHandle::Clock::now() + timeout;

    try {
        nlohmann::json response;
        {
            auto inputLock = handle->lockInput(deadline);
            // id 在输入锁内分配，同一管道上的 id 按写入顺序递增
            const uint64_t id = ids.nextId();
            handle->writeAll(FrameCodec::encode(makeRequest(id, method, params)), deadline);
            // 先拿到输出锁再放开输入锁，保证响应按写入顺序读取
            auto outputLock = handle->lockOutput(deadline);
            inputLock.unlock();

            while (true) {
                nlohmann::json msg = handle->reader().readFrame(deadline);
                // 服务端发来的通知/请求带 method 字段，不是响应
                if (msg.is_object() && msg.contains("method")) {
                    log.debug("[" + handle->serverId() + "] skipped server message: " + msg["method"].dump());
                    continue;
                }
                uint64_t got = RequestCorrelator::idOf(msg);
                if (got == id) {
                    response = std::move(msg);
                    break;
                }
                if (got == 0) {
                    // 无法解析请求的服务器按 JSON-RPC 规定回 "id": null，有的直接省略 id。
                    // 输出锁保证管道上只有本次请求在等响应，归到当前调用。
                    if (isIdlessReply(msg)) {
                        log.debug("[" + handle->serverId() + "] reply without id taken as response to request " +
                                  std::to_string(id));
                        response = std::move(msg);
                        break;
                    }
                    log.debug("[" + handle->serverId() + "] skipped frame without id");
                    continue;
                }
                if (got < id) {
                    log.warn("[" + handle->serverId() + "] discarded late response for request " +
                             std::to_string(got));
                    continue;
                }
                return RpcOutcome::transportError("response id mismatch: expected " + std::to_string(id) +
                                                  ", got " + std::to_string(got));
            }
        }
        return classify(response);
    } catch (const FrameTimeout&) {
        log.warn("[" + handle->serverId() + "] " + method + " timed out after " +
                 std::to_string(timeout.count()) + "ms");
        return RpcOutcome::transportError("timeout");
    } catch (const FrameError& e) {
        log.warn("[" + handle->serverId() + "] " + method + " failed: " + e.what());
        return RpcOutcome::transportError(e.what());
    } catch (const nlohmann::json::exception& e) {
        return RpcOutcome::transportError(std::string("encode failed: ") + e.what());
    } catch (const std::system_error& e) {
        // 锁异常只影响本次调用
        return RpcOutcome::transportError(std::string("lock failed: ") + e.what());
    }
}

std::future<RpcOutcome> RpcExchange::callAsync(const std::string& serverId, const std::string& method,
                                               const nlohmann::json& params, std::chrono::milliseconds timeout) {
    return std::async(std::launch::async, [this, serverId, method, params, timeout]() {
        return call(serverId, method, params, timeout);
    });
}
