#pragma once
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

/**
 * @brief JSON-RPC 请求 ID 生成器
 *
 * 单个原子计数器，从 1 开始，跨所有服务器共享，ID 在对象生命周期内不会重复。
 * 由 RpcExchange 持有，不是全局单例，测试可以 reset()。
 */
class RequestCorrelator {
public:
    explicit RequestCorrelator(uint64_t seed = 1) : counter(seed) {}

    uint64_t nextId() { return counter.fetch_add(1, std::memory_order_seq_cst); }

    /** The id the next call to nextId() will return. */
    uint64_t peek() const { return counter.load(std::memory_order_seq_cst); }

    void reset(uint64_t seed = 1) { counter.store(seed, std::memory_order_seq_cst); }

    /** True when the response envelope carries exactly this numeric id. */
    static bool matches(const nlohmann::json& response, uint64_t id);

    /** Numeric id of the envelope, or 0 when it has none (notifications). */
    static uint64_t idOf(const nlohmann::json& response);

private:
    std::atomic<uint64_t> counter;
};
