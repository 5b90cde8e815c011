#pragma once
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include "core/ConfigManager.h"

/**
 * @brief 服务器配置存储 (内存)
 *
 * MCPManager 从这里按 id 取 ServerConfig，本身不做持久化。
 */
class ServerConfigStore {
public:
    ServerConfigStore() = default;
    explicit ServerConfigStore(const std::vector<ServerConfig>& configs);

    std::optional<ServerConfig> find(const std::string& id) const;
    std::vector<ServerConfig> list() const;
    bool contains(const std::string& id) const;
    size_t size() const;

    /** Inserts or replaces the record with the same id. */
    void upsert(const ServerConfig& config);

    /** Returns false when no record had this id. */
    bool erase(const std::string& id);

private:
    mutable std::mutex mtx;
    std::vector<ServerConfig> configs;
};
