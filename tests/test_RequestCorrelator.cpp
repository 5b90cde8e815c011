#include <gtest/gtest.h>
#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "mcp/RequestCorrelator.h"

TEST(RequestCorrelator, StartsAtOneAndIncreases) {
    RequestCorrelator ids;
    EXPECT_EQ(ids.nextId(), 1u);
    EXPECT_EQ(ids.nextId(), 2u);
    EXPECT_EQ(ids.peek(), 3u);
}

TEST(RequestCorrelator, ConcurrentCallersGetDistinctIds) {
    RequestCorrelator ids;
    const int threads = 8;
    const int perThread = 2000;

    std::mutex mtx;
    std::set<uint64_t> seen;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            std::vector<uint64_t> local;
            local.reserve(perThread);
            for (int i = 0; i < perThread; ++i) local.push_back(ids.nextId());
            std::lock_guard<std::mutex> lock(mtx);
            seen.insert(local.begin(), local.end());
        });
    }
    for (auto& w : workers) w.join();

    const uint64_t n = static_cast<uint64_t>(threads) * perThread;
    EXPECT_EQ(seen.size(), n);
    EXPECT_EQ(*seen.rbegin(), n);
    EXPECT_EQ(*seen.begin(), 1u);
}

TEST(RequestCorrelator, ResetIsDeterministic) {
    RequestCorrelator ids;
    ids.nextId();
    ids.nextId();
    ids.reset();
    EXPECT_EQ(ids.nextId(), 1u);
    ids.reset(100);
    EXPECT_EQ(ids.nextId(), 100u);
}

TEST(RequestCorrelator, MatchesResponseById) {
    nlohmann::json response = {{"jsonrpc", "2.0"}, {"id", 5}, {"result", nlohmann::json::object()}};
    EXPECT_TRUE(RequestCorrelator::matches(response, 5));
    EXPECT_FALSE(RequestCorrelator::matches(response, 6));

    nlohmann::json notification = {{"jsonrpc", "2.0"}, {"method", "notifications/progress"}};
    EXPECT_EQ(RequestCorrelator::idOf(notification), 0u);
    EXPECT_FALSE(RequestCorrelator::matches(notification, 0));

    nlohmann::json stringId = {{"id", "5"}};
    EXPECT_FALSE(RequestCorrelator::matches(stringId, 5));
}
