#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "provider_router.hpp"
#include "test_support.hpp"

using namespace strata;
using strata::testing::ScriptedProvider;
using strata::testing::text_reply;

namespace {

ProviderRequest request_for(const std::string& model) {
    ProviderRequest req;
    req.model = model;
    req.messages.push_back(make_message("user", "hi"));
    return req;
}

ScriptedProvider::Step fail_with(ProviderErrorKind kind, const std::string& what) {
    return [kind, what](const ProviderRequest&) -> ProviderResponse {
        throw ProviderError(kind, "fake", what);
    };
}

TEST(ProviderRouterTest, SplitModel) {
    EXPECT_EQ(split_model("openrouter:anthropic/claude-sonnet-4").first, "openrouter");
    EXPECT_EQ(split_model("openrouter:anthropic/claude-sonnet-4").second, "anthropic/claude-sonnet-4");
    EXPECT_EQ(split_model("local:qwen:7b").second, "qwen:7b");
    EXPECT_EQ(split_model("bare").first, "");
    EXPECT_EQ(split_model("bare").second, "bare");
}

TEST(ProviderRouterTest, RoutesByPrefixAndStripsIt) {
    Config cfg = strata::testing::test_config();
    ProviderRouter router(cfg);
    auto fake = std::make_shared<ScriptedProvider>();
    fake->push(text_reply("hello"));
    router.register_provider("fake", fake);

    CancellationToken token;
    auto resp = router.send(request_for("fake:some-model"), token);
    EXPECT_EQ(resp.content, "hello");
    ASSERT_EQ(fake->calls(), 1u);
    EXPECT_EQ(fake->requests()[0].model, "some-model");
}

TEST(ProviderRouterTest, RetriesTransientErrors) {
    Config cfg = strata::testing::test_config();
    cfg.max_retries = 3;
    ProviderRouter router(cfg);
    auto fake = std::make_shared<ScriptedProvider>();
    fake->push_step(fail_with(ProviderErrorKind::rate_limit, "429"));
    fake->push_step(fail_with(ProviderErrorKind::overloaded, "503"));
    fake->push(text_reply("finally"));
    router.register_provider("fake", fake);

    CancellationToken token;
    auto resp = router.send(request_for("fake:m"), token);
    EXPECT_EQ(resp.content, "finally");
    EXPECT_EQ(fake->calls(), 3u);
}

TEST(ProviderRouterTest, GivesUpAfterMaxRetries) {
    Config cfg = strata::testing::test_config();
    cfg.max_retries = 2;
    ProviderRouter router(cfg);
    auto fake = std::make_shared<ScriptedProvider>();
    for (int i = 0; i < 5; i++) fake->push_step(fail_with(ProviderErrorKind::network, "connection reset"));
    router.register_provider("fake", fake);

    CancellationToken token;
    EXPECT_THROW(router.send(request_for("fake:m"), token), ProviderError);
    EXPECT_EQ(fake->calls(), 3u);
}

TEST(ProviderRouterTest, AuthErrorsAreNotRetried) {
    Config cfg = strata::testing::test_config();
    ProviderRouter router(cfg);
    auto fake = std::make_shared<ScriptedProvider>();
    fake->push_step(fail_with(ProviderErrorKind::auth, "401"));
    fake->push(text_reply("never"));
    router.register_provider("fake", fake);

    CancellationToken token;
    try {
        router.send(request_for("fake:m"), token);
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_EQ(e.kind(), ProviderErrorKind::auth);
    }
    EXPECT_EQ(fake->calls(), 1u);
}

TEST(ProviderRouterTest, UnknownProvider) {
    Config cfg = strata::testing::test_config();
    ProviderRouter router(cfg);
    CancellationToken token;
    EXPECT_THROW(router.send(request_for("nowhere:m"), token), ProviderError);
    EXPECT_THROW(router.send(request_for("no-prefix"), token), ProviderError);
}

TEST(ProviderRouterTest, CancelAbandonsSlowCall) {
    Config cfg = strata::testing::test_config();
    ProviderRouter router(cfg);
    auto fake = std::make_shared<ScriptedProvider>();
    fake->push_step([](const ProviderRequest&) {
        std::this_thread::sleep_for(std::chrono::seconds(2));
        return text_reply("too late");
    });
    router.register_provider("fake", fake);

    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(router.send(request_for("fake:m"), token), CancelledError);
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1500));
}

TEST(ProviderRouterTest, ConcurrentSendsWithRetries) {
    Config cfg = strata::testing::test_config();
    // Enough retries for one thread to meet every failure
    cfg.max_retries = 8;
    cfg.retry_backoff_ms = 1;
    ProviderRouter router(cfg);
    auto fake = std::make_shared<ScriptedProvider>();
    for (int i = 0; i < 8; i++) {
        fake->push_step(fail_with(ProviderErrorKind::overloaded, "503"));
        fake->push(text_reply("ok"));
    }
    router.register_provider("fake", fake);

    std::atomic<int> answered{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&router, &answered]() {
            CancellationToken token;
            if (router.send(request_for("fake:m"), token).content == "ok") answered++;
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(fake->calls(), 16u);
    EXPECT_EQ(answered.load(), 8);
}

} // namespace
