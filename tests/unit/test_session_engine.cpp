#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include "runtime_fixture.hpp"
#include "session_engine.hpp"
#include "session_store.hpp"

using namespace strata;
using strata::testing::RuntimeFixture;
using strata::testing::TempWorkspace;
using strata::testing::text_reply;
using strata::testing::tool_reply;
using strata::testing::write_file;

namespace {

struct EngineFixture : RuntimeFixture {
    std::ostringstream out;
    std::unique_ptr<SessionEngine> engine;
    int confirms = 0;
    bool answer = false;

    SessionEngine& make() {
        engine = std::make_unique<SessionEngine>(cfg, *router, *dispatcher, *orchestrator, costs, out);
        engine->set_confirm([this](const std::string&) {
            confirms++;
            return answer;
        });
        return *engine;
    }

    RoleConfig& tester() {
        for (auto& r : cfg.roles) {
            if (r.name == "tester") return r;
        }
        throw Error("no tester role");
    }
};

TEST(SessionEngineTest, StartRendersSystemAndWelcome) {
    EngineFixture f;
    f.tester().welcome = "Hello from %{ROLE} in %{CWD}";
    auto& engine = f.make();
    engine.start("tester", "/work");

    ASSERT_TRUE(engine.context().system().has_value());
    EXPECT_EQ(engine.context().system()->content, "Test system for tester");
    ASSERT_EQ(engine.context().size(), 1u);
    EXPECT_EQ(engine.context().messages()[0].content, "Hello from tester in /work");
    EXPECT_NE(f.out.str().find("Hello from tester"), std::string::npos);
    EXPECT_TRUE(engine.context().tools_cached());
    EXPECT_EQ(engine.model(), "fake:test-model");
    EXPECT_FALSE(engine.session_id().empty());
    EXPECT_EQ(engine.state(), SessionState::idle);

    EXPECT_THROW(engine.start("nobody", "/work"), ConfigError);
}

TEST(SessionEngineTest, CustomInstructionsAreLoaded) {
    TempWorkspace ws;
    write_file(ws.root() / "INSTRUCTIONS.md", "Always use tabs.");
    EngineFixture f;
    f.cfg.custom_instructions_file_name = "INSTRUCTIONS.md";
    auto& engine = f.make();
    engine.start("tester", ws.root().string());

    ASSERT_EQ(engine.context().size(), 1u);
    EXPECT_EQ(engine.context().messages()[0].name, "instructions");
    EXPECT_EQ(engine.context().messages()[0].content, "Always use tabs.");
}

TEST(SessionEngineTest, TurnWithToolRound) {
    EngineFixture f;
    f.provider->push(tool_reply({{"echo", R"({"text":"hi"})"}, {"fail", "{}"}}));
    f.provider->push(text_reply("all done", 0.01));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    auto outcome = engine.run_turn("please echo", token);
    EXPECT_EQ(outcome.status, TurnOutcome::Status::completed);
    EXPECT_EQ(outcome.reply, "all done");
    EXPECT_EQ(outcome.tool_rounds, 1);

    auto& msgs = engine.context().messages();
    ASSERT_EQ(msgs.size(), 5u);
    EXPECT_EQ(msgs[0].role, "user");
    EXPECT_EQ(msgs[1].tool_calls.size(), 2u);
    EXPECT_EQ(msgs[2].content, "echo: hi");
    EXPECT_EQ(msgs[2].tool_call_id, msgs[1].tool_calls[0].id);
    EXPECT_EQ(msgs[3].content, "[error] tool broke");
    EXPECT_EQ(msgs[4].content, "all done");

    auto reqs = f.provider->requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0].messages[0].role, "system");
    EXPECT_EQ(reqs[0].tools.size(), 5u);
    EXPECT_DOUBLE_EQ(reqs[0].temperature, 0.1);
    EXPECT_TRUE(reqs[0].cache_tools);
    EXPECT_EQ(f.costs.layer_total(engine.session_id(), "").calls, 2);
    EXPECT_EQ(f.costs.tool_total(engine.session_id(), "echo").calls, 1);
}

TEST(SessionEngineTest, UnknownToolBecomesErrorResult) {
    EngineFixture f;
    f.provider->push(tool_reply({{"nonexistent", "{}"}}));
    f.provider->push(text_reply("sorry"));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    auto outcome = engine.run_turn("go", token);
    EXPECT_EQ(outcome.status, TurnOutcome::Status::completed);
    auto& msgs = engine.context().messages();
    ASSERT_EQ(msgs.size(), 4u);
    EXPECT_EQ(msgs[2].role, "tool");
    EXPECT_EQ(msgs[2].content.rfind("[error] ", 0), 0u);
    EXPECT_NE(msgs[2].content.find("nonexistent"), std::string::npos);
}

TEST(SessionEngineTest, CancelDuringToolsRestoresTranscript) {
    EngineFixture f;
    f.provider->push(text_reply("first answer"));
    f.provider->push(tool_reply({{"nap", "{}"}, {"nap", "{}"}, {"nap", "{}"}}));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken first;
    engine.run_turn("warm up", first);
    ASSERT_EQ(engine.context().size(), 2u);

    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    auto begin = std::chrono::steady_clock::now();
    auto outcome = engine.run_turn("take three naps", token);
    canceller.join();

    EXPECT_EQ(outcome.status, TurnOutcome::Status::cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1500));
    ASSERT_EQ(engine.context().size(), 2u);
    EXPECT_EQ(engine.context().messages()[1].content, "first answer");
    for (auto& m : engine.context().messages()) {
        EXPECT_NE(m.role, "tool");
        EXPECT_TRUE(m.tool_calls.empty());
    }
    EXPECT_EQ(engine.state(), SessionState::idle);
}

TEST(SessionEngineTest, ProviderFailureKeepsTranscript) {
    EngineFixture f;
    f.provider->push_step([](const ProviderRequest&) -> ProviderResponse {
        throw ProviderError(ProviderErrorKind::auth, "fake", "401 invalid api key");
    });
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    auto outcome = engine.run_turn("hello", token);
    EXPECT_EQ(outcome.status, TurnOutcome::Status::failed);
    EXPECT_NE(outcome.error.find("401"), std::string::npos);
    EXPECT_TRUE(engine.context().empty());
    EXPECT_NE(f.out.str().find("[error] provider fake (auth)"), std::string::npos);
}

TEST(SessionEngineTest, LargeToolOutputDeclined) {
    EngineFixture f;
    f.provider->push(tool_reply({{"big", "{}"}}));
    f.provider->push(text_reply("understood"));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    auto outcome = engine.run_turn("read the big thing", token);
    EXPECT_EQ(outcome.status, TurnOutcome::Status::completed);
    EXPECT_EQ(f.confirms, 1);
    auto& msgs = engine.context().messages();
    ASSERT_EQ(msgs.size(), 4u);
    EXPECT_EQ(msgs[2].content, "User declined to process large output from tool 'big' (~50000 tokens).");
}

TEST(SessionEngineTest, LargeToolOutputAccepted) {
    EngineFixture f;
    f.cfg.max_request_tokens_threshold = 0;
    f.answer = true;
    f.provider->push(tool_reply({{"big", "{}"}}));
    f.provider->push(text_reply("read it all"));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    engine.run_turn("read the big thing", token);
    auto& msgs = engine.context().messages();
    ASSERT_EQ(msgs.size(), 4u);
    EXPECT_EQ(msgs[2].content.size(), 200000u);
}

TEST(SessionEngineTest, SpendingThresholdAsksOncePerCrossing) {
    EngineFixture f;
    f.cfg.max_session_spending_threshold = 0.05;
    for (int i = 0; i < 4; i++) f.provider->push(text_reply("reply " + std::to_string(i), 0.06));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    EXPECT_EQ(engine.run_turn("one", token).status, TurnOutcome::Status::completed);
    EXPECT_EQ(f.confirms, 0);

    auto declined = engine.run_turn("two", token);
    EXPECT_EQ(declined.status, TurnOutcome::Status::declined);
    EXPECT_EQ(f.confirms, 1);
    EXPECT_EQ(engine.context().size(), 2u);
    EXPECT_EQ(f.provider->calls(), 1u);

    f.answer = true;
    EXPECT_EQ(engine.run_turn("three", token).status, TurnOutcome::Status::completed);
    EXPECT_EQ(f.confirms, 2);
    EXPECT_EQ(engine.run_turn("four", token).status, TurnOutcome::Status::completed);
    EXPECT_EQ(f.confirms, 3);
}

TEST(SessionEngineTest, ToolRoundLimit) {
    EngineFixture f;
    f.cfg.max_tool_rounds = 2;
    for (int i = 0; i < 5; i++) f.provider->push(tool_reply({{"echo", "{}"}}));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    auto outcome = engine.run_turn("loop forever", token);
    EXPECT_EQ(outcome.status, TurnOutcome::Status::completed);
    EXPECT_EQ(outcome.tool_rounds, 2);
    EXPECT_EQ(f.provider->calls(), 3u);
    EXPECT_NE(f.out.str().find("Tool round limit"), std::string::npos);
    // The final message carries no dangling calls
    EXPECT_TRUE(engine.context().messages().back().tool_calls.empty());
}

TEST(SessionEngineTest, LayersRunOncePerTaskUntilRearmed) {
    EngineFixture f;
    LayerConfig qp;
    qp.name = "qp";
    qp.output_mode = OutputMode::none;
    LayerConfig cg;
    cg.name = "cg";
    cg.output_mode = OutputMode::append;
    f.cfg.layers = {qp, cg};
    f.tester().enable_layers = true;
    f.tester().layer_refs = {"qp", "cg"};

    f.provider->push(text_reply("refined"));
    f.provider->push(text_reply("context"));
    f.provider->push(text_reply("answer 1"));
    f.provider->push(text_reply("answer 2"));
    f.provider->push(text_reply("refined again"));
    f.provider->push(text_reply("context again"));
    f.provider->push(text_reply("answer 3"));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    EXPECT_EQ(engine.run_turn("task", token).reply, "answer 1");
    EXPECT_EQ(f.provider->calls(), 3u);
    // layer output, then the request, then the reply
    ASSERT_EQ(engine.context().size(), 3u);
    EXPECT_EQ(engine.context().messages()[0].name, "cg");
    EXPECT_FALSE(engine.layers_armed());

    EXPECT_EQ(engine.run_turn("follow-up", token).reply, "answer 2");
    EXPECT_EQ(f.provider->calls(), 4u);

    engine.rearm_layers();
    EXPECT_EQ(engine.run_turn("next task", token).reply, "answer 3");
    EXPECT_EQ(f.provider->calls(), 7u);
}

TEST(SessionEngineTest, FailedLayerDegradesTurn) {
    EngineFixture f;
    LayerConfig cg;
    cg.name = "cg";
    cg.output_mode = OutputMode::append;
    f.cfg.layers = {cg};
    f.tester().enable_layers = true;
    f.tester().layer_refs = {"cg"};

    f.provider->push_step([](const ProviderRequest&) -> ProviderResponse {
        throw ProviderError(ProviderErrorKind::billing, "fake", "402 payment required");
    });
    f.provider->push(text_reply("answered anyway"));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    auto outcome = engine.run_turn("do it", token);
    EXPECT_EQ(outcome.status, TurnOutcome::Status::completed);
    EXPECT_TRUE(outcome.degraded);
    EXPECT_EQ(outcome.reply, "answered anyway");
    ASSERT_EQ(engine.context().size(), 2u);
    EXPECT_EQ(engine.context().messages()[0].content, "do it");
    EXPECT_NE(f.out.str().find("[layers] layer 'cg'"), std::string::npos);
}

TEST(SessionEngineTest, ReduceLeavesOneSummary) {
    EngineFixture f;
    f.provider->push(text_reply("answer"));
    f.provider->push(text_reply("the summary"));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    engine.run_turn("question", token);
    engine.reduce(token);
    ASSERT_EQ(engine.context().size(), 1u);
    EXPECT_EQ(engine.context().messages()[0].content, "the summary");
    EXPECT_EQ(engine.context().messages()[0].name, "summary");
    EXPECT_EQ(f.costs.layer_total(engine.session_id(), "reduce").calls, 1);

    auto req = f.provider->requests().back();
    EXPECT_NE(req.messages[1].content.find("question"), std::string::npos);
}

TEST(SessionEngineTest, CustomCommands) {
    EngineFixture f;
    CommandConfig explain;
    explain.layer.name = "explain";
    explain.layer.output_mode = OutputMode::append;
    explain.style = CommandStyle::command;
    CommandConfig note;
    note.layer.name = "note";
    note.layer.output_mode = OutputMode::append;
    note.style = CommandStyle::layer;
    f.cfg.commands.push_back(explain);
    f.cfg.commands.push_back(note);

    f.provider->push(text_reply("answer"));
    f.provider->push(text_reply("an explanation"));
    f.provider->push(text_reply("a note"));
    auto& engine = f.make();
    engine.start("tester", "/work");

    CancellationToken token;
    engine.run_turn("what is this", token);
    ASSERT_EQ(engine.context().size(), 2u);

    EXPECT_EQ(engine.run_command("explain", "", token), "an explanation");
    EXPECT_EQ(engine.context().size(), 2u);
    // Empty arguments fall back to the last user message
    EXPECT_EQ(f.provider->requests().back().messages[1].content, "what is this");

    EXPECT_EQ(engine.run_command("note", "remember this", token), "a note");
    ASSERT_EQ(engine.context().size(), 3u);
    EXPECT_EQ(engine.context().messages()[2].name, "note");
    EXPECT_EQ(engine.context().messages()[2].role, "assistant");

    EXPECT_THROW(engine.run_command("missing", "", token), Error);
}

TEST(SessionEngineTest, SaveAndResume) {
    TempWorkspace ws;
    SessionStore store(ws.root().string());
    std::string id;
    {
        EngineFixture f;
        f.provider->push(text_reply("persisted answer", 0.02));
        auto& engine = f.make();
        engine.start("tester", "/work");
        CancellationToken token;
        engine.run_turn("remember me", token);
        engine.save(store);
        id = engine.session_id();
    }

    EngineFixture g;
    g.provider->push(text_reply("welcome back"));
    auto& engine = g.make();
    engine.resume(store.load(id), "/work");
    EXPECT_EQ(engine.session_id(), id);
    EXPECT_EQ(engine.role().name, "tester");
    ASSERT_EQ(engine.context().size(), 2u);
    EXPECT_FALSE(engine.layers_armed());
    EXPECT_NEAR(g.costs.session_total(id).cost, 0.02, 1e-12);

    CancellationToken token;
    engine.run_turn("still there?", token);
    auto req = g.provider->requests().at(0);
    ASSERT_EQ(req.messages.size(), 4u);
    EXPECT_EQ(req.messages[1].content, "remember me");
}

} // namespace
