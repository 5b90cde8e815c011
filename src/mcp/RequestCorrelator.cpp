#include "mcp/RequestCorrelator.h"

uint64_t RequestCorrelator::idOf(const nlohmann::json& response) {
    if (!response.is_object()) return 0;
    auto it = response.find("id");
    if (it == response.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    return 0;
}

bool RequestCorrelator::matches(const nlohmann::json& response, uint64_t id) {
    return id != 0 && idOf(response) == id;
}
