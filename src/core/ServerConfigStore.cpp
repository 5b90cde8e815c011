#include "core/ServerConfigStore.h"
#include <algorithm>

ServerConfigStore::ServerConfigStore(const std::vector<ServerConfig>& configs) {
    for (const auto& c : configs) upsert(c);
}

std::optional<ServerConfig> ServerConfigStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = std::find_if(configs.begin(), configs.end(), [&](const ServerConfig& c) { return c.id == id; });
    if (it == configs.end()) return std::nullopt;
    return *it;
}

std::vector<ServerConfig> ServerConfigStore::list() const {
    std::lock_guard<std::mutex> lock(mtx);
    return configs;
}

bool ServerConfigStore::contains(const std::string& id) const {
    return find(id).has_value();
}

size_t ServerConfigStore::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return configs.size();
}

void ServerConfigStore::upsert(const ServerConfig& config) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = std::find_if(configs.begin(), configs.end(), [&](const ServerConfig& c) { return c.id == config.id; });
    if (it != configs.end()) {
        *it = config;
    } else {
        configs.push_back(config);
    }
}

bool ServerConfigStore::erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx);
    auto before = configs.size();
    configs.erase(std::remove_if(configs.begin(), configs.end(), [&](const ServerConfig& c) { return c.id == id; }),
                  configs.end());
    return configs.size() < before;
}
