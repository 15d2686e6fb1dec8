#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include "cost_tracker.hpp"
#include "mcp_registry.hpp"
#include "tokens.hpp"
#include "tool_dispatcher.hpp"
#include "test_support.hpp"

using namespace strata;
using strata::testing::simple_tool;

namespace {

std::atomic<int> g_shell_calls{0};

std::string big_output(const nlohmann::json&) {
    std::string out;
    out.reserve(200000);
    for (int i = 0; out.size() < 200000; i++) {
        out += "row " + std::to_string(i) + " ";
        out.append(40, '.');
        out += "\n";
    }
    out.resize(200000);
    return out;
}

struct DispatchFixture {
    Config cfg = strata::testing::test_config();
    CostTracker costs;
    std::unique_ptr<ToolServerRegistry> registry;
    std::unique_ptr<ToolDispatcher> dispatcher;

    DispatchFixture() {
        cfg.mcp_response_warning_threshold = 10000;
        cfg.mcp_response_truncation_threshold = 20000;
        registry = std::make_unique<ToolServerRegistry>(cfg);

        auto local = std::make_shared<ToolRegistry>();
        local->register_tool(simple_tool("file_read", [](const nlohmann::json& args) {
            return "contents of " + args.value("path", std::string("?"));
        }));
        local->register_tool(simple_tool("shell_exec", [](const nlohmann::json&) {
            g_shell_calls++;
            return std::string("ran");
        }));
        local->register_tool(simple_tool("file_big", big_output));
        local->register_tool(simple_tool("file_medium", [](const nlohmann::json&) {
            return std::string(60000, 'm');
        }));
        local->register_tool(simple_tool("file_slow", [](const nlohmann::json&) {
            std::this_thread::sleep_for(std::chrono::seconds(3));
            return std::string("late");
        }));
        local->register_tool(simple_tool("file_fail", [](const nlohmann::json&) -> std::string {
            throw std::runtime_error("disk on fire");
        }));
        registry->register_builtin("local", local);

        auto napper = std::make_shared<ToolRegistry>();
        napper->register_tool(simple_tool("nap", [](const nlohmann::json&) {
            std::this_thread::sleep_for(std::chrono::seconds(2));
            return std::string("rested");
        }));
        registry->register_builtin("napper", napper);

        ToolServerConfig l;
        l.name = "local";
        l.timeout_seconds = 1;
        registry->register_server(l);
        ToolServerConfig n;
        n.name = "napper";
        n.timeout_seconds = 10;
        registry->register_server(n);

        dispatcher = std::make_unique<ToolDispatcher>(cfg, *registry, costs);
    }

    DispatchContext ctx(std::vector<std::string> allowed = {}) const {
        DispatchContext c;
        c.session = "s1";
        c.scope.server_refs = {"local", "napper"};
        c.scope.allowed_tools = std::move(allowed);
        return c;
    }
};

ToolCall call(const std::string& id, const std::string& name, const std::string& args = "{}") {
    return ToolCall{id, name, args};
}

TEST(ToolDispatcherTest, PatternRejectsWithoutContactingServer) {
    DispatchFixture f;
    CancellationToken token;
    int before = g_shell_calls;

    auto c = f.ctx({"file_*"});
    EXPECT_FALSE(f.dispatcher->is_allowed("shell_exec", c));
    EXPECT_THROW(f.dispatcher->execute(call("1", "shell_exec"), c, token), ToolNotAllowed);
    EXPECT_EQ(g_shell_calls.load(), before);
    EXPECT_EQ(f.registry->health("local"), ServerHealth::dead);

    auto r = f.dispatcher->execute(call("2", "file_read", R"({"path":"a.txt"})"), c, token);
    EXPECT_EQ(r.content, "contents of a.txt");
    EXPECT_EQ(f.costs.tool_total("s1", "file_read").calls, 1);
}

TEST(ToolDispatcherTest, ScopeWithoutServersAllowsNothing) {
    DispatchFixture f;
    DispatchContext none;
    none.layer = "query_processor";
    EXPECT_TRUE(f.dispatcher->tools_for(none).empty());
    EXPECT_FALSE(f.dispatcher->is_allowed("file_read", none));

    DispatchContext only_napper = f.ctx();
    only_napper.scope.server_refs = {"napper"};
    auto tools = f.dispatcher->tools_for(only_napper);
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "nap");
}

TEST(ToolDispatcherTest, DeniedToolsWin) {
    DispatchFixture f;
    f.cfg.denied_tools = {"local:shell_*"};
    EXPECT_FALSE(f.dispatcher->is_allowed("shell_exec", f.ctx()));
    EXPECT_TRUE(f.dispatcher->is_allowed("file_read", f.ctx()));
}

TEST(ToolDispatcherTest, UnknownToolNotFound) {
    DispatchFixture f;
    CancellationToken token;
    EXPECT_THROW(f.dispatcher->execute(call("1", "nope"), f.ctx(), token), ToolNotFound);
}

TEST(ToolDispatcherTest, OversizedResponseTruncatedWithMarker) {
    DispatchFixture f;
    f.cfg.enable_auto_truncation = true;
    CancellationToken token;

    auto r = f.dispatcher->execute(call("1", "file_big"), f.ctx(), token);
    EXPECT_TRUE(r.truncated);
    EXPECT_LE(r.tokens, 20000);
    EXPECT_LE(estimate_tokens(r.content), 20000);
    EXPECT_NE(r.content.find("[truncated "), std::string::npos);
    EXPECT_FALSE(r.warning.empty());
}

TEST(ToolDispatcherTest, OversizedResponseWithoutAutoTruncationThrows) {
    DispatchFixture f;
    CancellationToken token;
    try {
        f.dispatcher->execute(call("1", "file_big"), f.ctx(), token);
        FAIL() << "expected ResponseTooLarge";
    } catch (const ResponseTooLarge& e) {
        EXPECT_EQ(e.tool(), "file_big");
        EXPECT_EQ(e.tokens(), 50000);
        EXPECT_EQ(e.content().size(), 200000u);
    }
}

TEST(ToolDispatcherTest, WarningBelowTruncation) {
    DispatchFixture f;
    CancellationToken token;
    auto r = f.dispatcher->execute(call("1", "file_medium"), f.ctx(), token);
    EXPECT_FALSE(r.truncated);
    EXPECT_EQ(r.tokens, 15000);
    EXPECT_FALSE(r.warning.empty());
}

TEST(ToolDispatcherTest, ToolFailureBecomesErrorResult) {
    DispatchFixture f;
    CancellationToken token;
    auto r = f.dispatcher->execute(call("1", "file_fail"), f.ctx(), token);
    EXPECT_TRUE(r.is_error);
    EXPECT_EQ(r.content, "[error] disk on fire");
    EXPECT_EQ(f.costs.tool_total("s1", "file_fail").errors, 1);

    auto bad = f.dispatcher->execute(call("2", "file_read", "{not json"), f.ctx(), token);
    EXPECT_TRUE(bad.is_error);
}

TEST(ToolDispatcherTest, SlowToolTimesOut) {
    DispatchFixture f;
    CancellationToken token;
    f.registry->acquire("local");

    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(f.dispatcher->execute(call("1", "file_slow"), f.ctx(), token), ToolTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(2500));
    EXPECT_EQ(f.registry->health("local"), ServerHealth::degraded);
    EXPECT_EQ(f.costs.tool_total("s1", "file_slow").errors, 1);
}

TEST(ToolDispatcherTest, BatchKeepsRequestOrder) {
    DispatchFixture f;
    CancellationToken token;
    std::vector<ToolCall> calls = {
        call("a", "file_read", R"({"path":"one"})"),
        call("b", "shell_exec"),
        call("c", "file_read", R"({"path":"two"})"),
    };
    auto outcomes = f.dispatcher->execute_batch(calls, f.ctx({"file_*"}), token);
    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].call.id, "a");
    EXPECT_EQ(outcomes[0].result.content, "contents of one");
    EXPECT_TRUE(outcomes[1].error != nullptr);
    EXPECT_THROW(std::rethrow_exception(outcomes[1].error), ToolNotAllowed);
    EXPECT_EQ(outcomes[2].result.content, "contents of two");
}

TEST(ToolDispatcherTest, CancelledBatchReturnsNothing) {
    DispatchFixture f;
    CancellationToken token;
    std::vector<ToolCall> calls = {call("a", "nap"), call("b", "nap"), call("c", "nap")};

    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        token.cancel();
    });
    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(f.dispatcher->execute_batch(calls, f.ctx(), token), CancelledError);
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1500));

    CancellationToken cancelled;
    cancelled.cancel();
    EXPECT_THROW(f.dispatcher->execute_batch(calls, f.ctx(), cancelled), CancelledError);
}

TEST(ToolDispatcherTest, AbandonedCallsAreCancelledAndDrained) {
    DispatchFixture f;
    auto saw_cancel = std::make_shared<std::atomic<int>>(0);
    auto watcher = std::make_shared<ToolRegistry>();
    watcher->register_tool(simple_tool("watch", [saw_cancel](const nlohmann::json&,
                                                             const CancellationToken& token) {
        try {
            sleep_cancellable(std::chrono::seconds(5), token);
        } catch (const CancelledError&) {
            saw_cancel->fetch_add(1);
            throw;
        }
        return std::string("watched");
    }));
    f.registry->register_builtin("watcher", watcher);
    ToolServerConfig w;
    w.name = "watcher";
    w.timeout_seconds = 10;
    f.registry->register_server(w);

    DispatchContext c = f.ctx();
    c.scope.server_refs.push_back("watcher");
    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        token.cancel();
    });
    EXPECT_THROW(f.dispatcher->execute_batch({call("a", "watch"), call("b", "watch")}, c, token),
                 CancelledError);
    canceller.join();

    EXPECT_TRUE(f.dispatcher->wait_idle(std::chrono::seconds(2)));
    EXPECT_EQ(f.dispatcher->in_flight(), 0);
    EXPECT_EQ(saw_cancel->load(), 2);
}

TEST(ToolDispatcherTest, TimedOutCallIsCancelled) {
    DispatchFixture f;
    auto saw_cancel = std::make_shared<std::atomic<bool>>(false);
    auto watcher = std::make_shared<ToolRegistry>();
    watcher->register_tool(simple_tool("watch", [saw_cancel](const nlohmann::json&,
                                                             const CancellationToken& token) {
        while (!token.cancelled()) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        saw_cancel->store(true);
        return std::string("gave up");
    }));
    f.registry->register_builtin("watcher", watcher);
    ToolServerConfig w;
    w.name = "watcher";
    w.timeout_seconds = 1;
    f.registry->register_server(w);

    DispatchContext c = f.ctx();
    c.scope.server_refs = {"watcher"};
    CancellationToken token;
    EXPECT_THROW(f.dispatcher->execute(call("a", "watch"), c, token), ToolTimeout);
    EXPECT_TRUE(f.dispatcher->wait_idle(std::chrono::seconds(2)));
    EXPECT_TRUE(saw_cancel->load());
}

} // namespace
