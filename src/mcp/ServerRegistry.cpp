#include "mcp/ServerRegistry.h"
#include <mutex>

bool ServerRegistry::insert(const std::string& id, HandlePtr handle) {
    if (!handle) return false;
    std::unique_lock<std::shared_mutex> lock(mtx);
    return servers.emplace(id, std::move(handle)).second;
}

ServerRegistry::HandlePtr ServerRegistry::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mtx);
    auto it = servers.find(id);
    if (it == servers.end()) return nullptr;
    HandlePtr handle = std::move(it->second);
    servers.erase(it);
    return handle;
}

ServerRegistry::HandlePtr ServerRegistry::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    auto it = servers.find(id);
    if (it == servers.end()) return nullptr;
    return it->second;
}

bool ServerRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return servers.count(id) > 0;
}

size_t ServerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    return servers.size();
}

std::vector<std::string> ServerRegistry::ids() const {
    std::shared_lock<std::shared_mutex> lock(mtx);
    std::vector<std::string> out;
    out.reserve(servers.size());
    for (const auto& [id, handle] : servers) out.push_back(id);
    return out;
}
