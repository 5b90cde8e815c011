#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "mcp/RpcExchange.h"
#include "TestHelpers.h"

using namespace std::chrono_literals;

class RpcExchangeTest : public ::testing::Test {
protected:
    void SetUp() override { testutil::quietLogger(); }

    void TearDown() override {
        for (const auto& id : registry.ids()) {
            registry.remove(id)->shutdown(0ms);
        }
    }

    void launch(const std::string& id, const std::string& mode, std::vector<std::string> extra = {}) {
        ASSERT_TRUE(registry.insert(id, ProcessHandle::spawn(testutil::stubConfig(id, mode, extra))));
    }

    static std::string echoText(const RpcOutcome& o) {
        return o.payload["content"][0]["text"].get<std::string>();
    }

    ServerRegistry registry;
    RpcExchange rpc{registry};
};

TEST(RpcEnvelope, BuildsJsonRpcRequest) {
    auto req = RpcExchange::makeRequest(9, "tools/list", nullptr);
    EXPECT_EQ(req["jsonrpc"], "2.0");
    EXPECT_EQ(req["id"], 9);
    EXPECT_EQ(req["method"], "tools/list");
    EXPECT_TRUE(req["params"].is_object());
}

TEST(RpcEnvelope, ClassifiesResponses) {
    auto ok = RpcExchange::classify({{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"x", 1}}}});
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.payload["x"], 1);

    auto empty = RpcExchange::classify({{"jsonrpc", "2.0"}, {"id", 1}});
    EXPECT_TRUE(empty.ok());
    EXPECT_EQ(empty.payload, nlohmann::json::object());

    auto err = RpcExchange::classify(
        {{"id", 1}, {"error", {{"code", -32602}, {"message", "Invalid params"}, {"data", {{"field", "uri"}}}}}});
    EXPECT_EQ(err.kind, RpcOutcome::Kind::ApplicationError);
    EXPECT_EQ(err.code, -32602);
    EXPECT_EQ(err.message, "Invalid params");
    EXPECT_EQ(err.data["field"], "uri");
}

TEST_F(RpcExchangeTest, UnknownServerIsNotSpawned) {
    auto outcome = rpc.call("ghost", "ping", {}, 500ms);
    EXPECT_EQ(outcome.kind, RpcOutcome::Kind::TransportError);
    EXPECT_EQ(outcome.message, "server not running");
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(RpcExchangeTest, SuccessfulCall) {
    launch("s", "normal");
    auto outcome = rpc.call("s", "tools/list", nlohmann::json::object(), 2s);
    ASSERT_TRUE(outcome.ok()) << outcome.describe();
    ASSERT_EQ(outcome.payload["tools"].size(), 1u);
    EXPECT_EQ(outcome.payload["tools"][0]["name"], "echo");
}

TEST_F(RpcExchangeTest, ApplicationErrorPassesThrough) {
    launch("e", "error");
    auto outcome = rpc.call("e", "tools/call", {{"name", "echo"}, {"arguments", nlohmann::json::object()}}, 2s);
    EXPECT_EQ(outcome.kind, RpcOutcome::Kind::ApplicationError);
    EXPECT_EQ(outcome.code, -32601);
    EXPECT_EQ(outcome.message, "Method not found");
}

TEST_F(RpcExchangeTest, SilentServerTimesOutPromptly) {
    launch("quiet", "silent");
    auto start = std::chrono::steady_clock::now();
    auto outcome = rpc.call("quiet", "ping", nlohmann::json::object(), 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(outcome.isTimeout()) << outcome.describe();
    EXPECT_EQ(outcome.message, "timeout");
    EXPECT_LT(elapsed, 500ms);
    // 超时不会拆掉服务器
    EXPECT_TRUE(registry.contains("quiet"));
}

TEST_F(RpcExchangeTest, LateResponseIsDiscardedOnNextCall) {
    launch("slow", "slow-first", {"--delay-ms", "400"});

    auto first = rpc.call("slow", "tools/call", {{"name", "echo"}, {"arguments", {{"text", "first"}}}}, 100ms);
    EXPECT_TRUE(first.isTimeout()) << first.describe();

    auto second = rpc.call("slow", "tools/call", {{"name", "echo"}, {"arguments", {{"text", "second"}}}}, 3s);
    ASSERT_TRUE(second.ok()) << second.describe();
    EXPECT_EQ(echoText(second), "second");
}

TEST_F(RpcExchangeTest, NotificationsAreSkipped) {
    launch("chatty", "notify");
    auto outcome = rpc.call("chatty", "tools/call", {{"name", "echo"}, {"arguments", {{"text", "hi"}}}}, 2s);
    ASSERT_TRUE(outcome.ok()) << outcome.describe();
    EXPECT_EQ(echoText(outcome), "hi");
}

TEST_F(RpcExchangeTest, MalformedBodyIsTransportError) {
    launch("junk", "garbage");
    auto outcome = rpc.call("junk", "ping", nlohmann::json::object(), 2s);
    EXPECT_EQ(outcome.kind, RpcOutcome::Kind::TransportError);
    EXPECT_NE(outcome.message.find("invalid JSON"), std::string::npos) << outcome.message;
}

TEST_F(RpcExchangeTest, NullIdErrorReplyIsApplicationError) {
    launch("parse", "null-id-error");
    auto start = std::chrono::steady_clock::now();
    auto outcome = rpc.call("parse", "ping", nlohmann::json::object(), 2s);

    EXPECT_EQ(outcome.kind, RpcOutcome::Kind::ApplicationError) << outcome.describe();
    EXPECT_EQ(outcome.code, -32700);
    EXPECT_EQ(outcome.message, "Parse error");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST_F(RpcExchangeTest, ErrorReplyWithoutIdIsApplicationError) {
    launch("bare", "no-id-error");
    auto start = std::chrono::steady_clock::now();
    auto outcome = rpc.call("bare", "tools/call", {{"name", "echo"}, {"arguments", nlohmann::json::object()}}, 2s);

    EXPECT_EQ(outcome.kind, RpcOutcome::Kind::ApplicationError) << outcome.describe();
    EXPECT_EQ(outcome.code, -32601);
    EXPECT_EQ(outcome.message, "Method not found");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    // 下一次调用同样拿到自己的响应
    auto again = rpc.call("bare", "ping", nlohmann::json::object(), 2s);
    EXPECT_EQ(again.kind, RpcOutcome::Kind::ApplicationError) << again.describe();
}

TEST_F(RpcExchangeTest, InterruptedWriteIsCompletedBeforeNextRequest) {
    // 子进程一秒后才开始读 stdin，大请求只能写进管道缓冲区的一部分
    ServerConfig cfg;
    cfg.id = "late";
    cfg.command = "/bin/sh";
    cfg.args = {"-c", std::string("sleep 1; exec '") + TETHER_STUB_SERVER + "' --mode normal"};
    ASSERT_TRUE(registry.insert("late", ProcessHandle::spawn(cfg)));
    auto handle = registry.get("late");

    std::string big(300 * 1024, 'x');
    auto first = rpc.call("late", "tools/call", {{"name", "echo"}, {"arguments", {{"text", big}}}}, 200ms);
    EXPECT_TRUE(first.isTimeout()) << first.describe();
    {
        auto lock = handle->lockInput(ProcessHandle::Clock::now() + 1s);
        EXPECT_GT(handle->pendingInput(), 0u);
        EXPECT_LT(handle->pendingInput(), big.size());
    }

    auto ping = rpc.call("late", "ping", nlohmann::json::object(), 5s);
    EXPECT_TRUE(ping.ok()) << ping.describe();

    auto echo = rpc.call("late", "tools/call", {{"name", "echo"}, {"arguments", {{"text", "after"}}}}, 3s);
    ASSERT_TRUE(echo.ok()) << echo.describe();
    EXPECT_EQ(echoText(echo), "after");

    auto lock = handle->lockInput(ProcessHandle::Clock::now() + 1s);
    EXPECT_EQ(handle->pendingInput(), 0u);
}

TEST_F(RpcExchangeTest, ExitedServerFailsFastWithoutTimeout) {
    launch("once", "exit-after-first");
    ASSERT_TRUE(rpc.call("once", "ping", nlohmann::json::object(), 2s).ok());

    auto handle = registry.get("once");
    ASSERT_TRUE(handle->waitForExit(2s));

    auto start = std::chrono::steady_clock::now();
    auto outcome = rpc.call("once", "ping", nlohmann::json::object(), 5s);
    EXPECT_EQ(outcome.kind, RpcOutcome::Kind::TransportError);
    EXPECT_FALSE(outcome.isTimeout()) << outcome.message;
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(RpcExchangeTest, ConcurrentCallsOnOneServerGetTheirOwnResponses) {
    launch("shared", "normal");
    std::vector<std::future<RpcOutcome>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(rpc.callAsync("shared", "tools/call",
                                        {{"name", "echo"}, {"arguments", {{"text", "msg-" + std::to_string(i)}}}}, 5s));
    }
    for (int i = 0; i < 8; ++i) {
        auto outcome = futures[i].get();
        ASSERT_TRUE(outcome.ok()) << outcome.describe();
        EXPECT_EQ(echoText(outcome), "msg-" + std::to_string(i));
    }
}

TEST_F(RpcExchangeTest, SlowServerDoesNotBlockOtherServers) {
    launch("stuck", "silent");
    launch("fast", "normal");

    auto pending = rpc.callAsync("stuck", "ping", nlohmann::json::object(), 1500ms);
    std::this_thread::sleep_for(50ms);

    auto start = std::chrono::steady_clock::now();
    auto outcome = rpc.call("fast", "ping", nlohmann::json::object(), 2s);
    EXPECT_TRUE(outcome.ok()) << outcome.describe();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);

    EXPECT_TRUE(pending.get().isTimeout());
}

TEST_F(RpcExchangeTest, SecondCallerWaitsForTheFirstAndRespectsItsDeadline) {
    launch("busy", "silent");
    auto first = rpc.callAsync("busy", "ping", nlohmann::json::object(), 600ms);
    std::this_thread::sleep_for(50ms);

    auto start = std::chrono::steady_clock::now();
    auto second = rpc.call("busy", "ping", nlohmann::json::object(), 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(second.isTimeout());
    EXPECT_LT(elapsed, 500ms);
    EXPECT_TRUE(first.get().isTimeout());
}
