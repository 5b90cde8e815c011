#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 一次 RPC 调用的结果
 *
 * 三种情况之一，始终完整填充:
 * - Success: payload 为 result 字段 (缺省为空对象)
 * - ApplicationError: 子进程返回的 JSON-RPC error 对象 (code/message/data)
 * - TransportError: I/O 失败、帧格式错误或超时，message 为原因
 */
struct RpcOutcome {
    enum class Kind {
        Success,
        ApplicationError,
        TransportError
    };

    Kind kind = Kind::TransportError;
    nlohmann::json payload = nlohmann::json::object();
    int code = 0;
    std::string message;
    nlohmann::json data;

    static RpcOutcome success(nlohmann::json result) {
        RpcOutcome o;
        o.kind = Kind::Success;
        o.payload = std::move(result);
        return o;
    }

    static RpcOutcome applicationError(int code, std::string message, nlohmann::json data = nullptr) {
        RpcOutcome o;
        o.kind = Kind::ApplicationError;
        o.code = code;
        o.message = std::move(message);
        o.data = std::move(data);
        return o;
    }

    static RpcOutcome transportError(std::string reason) {
        RpcOutcome o;
        o.kind = Kind::TransportError;
        o.message = std::move(reason);
        return o;
    }

    bool ok() const { return kind == Kind::Success; }
    bool isTimeout() const { return kind == Kind::TransportError && message == "timeout"; }

    std::string describe() const {
        switch (kind) {
            case Kind::Success: return "ok";
            case Kind::ApplicationError:
                return "JSON-RPC error " + std::to_string(code) + ": " + message;
            case Kind::TransportError: return "transport error: " + message;
        }
        return message;
    }
};
