#pragma once
#include <string>
#include <vector>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include "mcp/ProcessHandle.h"

/**
 * @brief 服务器 id -> 运行中进程 的并发映射
 *
 * 每个 id 同时最多只有一个 ProcessHandle。读写锁只保护 map 本身，
 * 返回 shared_ptr 后立即释放，任何管道 I/O 都不在锁内进行。
 */
class ServerRegistry {
public:
    using HandlePtr = std::shared_ptr<ProcessHandle>;

    /** Returns false ("already running") when id is present; the existing entry is kept. */
    bool insert(const std::string& id, HandlePtr handle);

    /** Removes and returns the handle, or nullptr ("not running"). */
    HandlePtr remove(const std::string& id);

    HandlePtr get(const std::string& id) const;
    bool contains(const std::string& id) const;
    size_t size() const;
    std::vector<std::string> ids() const;

private:
    mutable std::shared_mutex mtx;
    std::unordered_map<std::string, HandlePtr> servers;
};
