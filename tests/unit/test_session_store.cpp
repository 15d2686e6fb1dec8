#include <gtest/gtest.h>
#include <fstream>
#include "cost_tracker.hpp"
#include "session_store.hpp"
#include "test_support.hpp"

using namespace strata;
using strata::testing::TempWorkspace;
using strata::testing::write_file;

namespace {

ContextManager sample_context() {
    ContextManager cm;
    cm.set_system("system prompt");
    cm.append(make_message("user", "list the files"));
    Message call = make_message("assistant", "");
    call.tool_calls.push_back(ToolCall{"call_1", "list_files", R"({"directory":"."})"});
    cm.append(call);
    Message result = make_message("tool", "2 entries:\na.txt\nb.txt");
    result.tool_call_id = "call_1";
    result.name = "list_files";
    cm.append(result);
    Message layer = make_message("user", "context report");
    layer.name = "context_generator";
    cm.append(layer);
    cm.mark_cache_boundary();
    return cm;
}

SessionInfo sample_info(const std::string& id) {
    SessionInfo info;
    info.id = id;
    info.role = "developer";
    info.model = "openrouter:anthropic/claude-sonnet-4";
    info.created = 1700000000;
    return info;
}

TEST(SessionStoreTest, SaveLoadRoundTrip) {
    TempWorkspace ws;
    SessionStore store((ws.root() / "sessions").string());

    CostTracker costs;
    Usage u;
    u.input_tokens = 100;
    u.output_tokens = 20;
    costs.record_provider("20250101-120000-1", "", u, 0.25, 30);

    ContextManager cm = sample_context();
    store.save(sample_info("20250101-120000-1"), cm, costs.to_json("20250101-120000-1"));
    EXPECT_TRUE(store.exists("20250101-120000-1"));
    EXPECT_FALSE(fs::exists(store.path_for("20250101-120000-1") + ".tmp"));

    auto loaded = store.load("20250101-120000-1");
    EXPECT_EQ(loaded.info.role, "developer");
    EXPECT_EQ(loaded.info.model, "openrouter:anthropic/claude-sonnet-4");
    EXPECT_EQ(loaded.info.created, 1700000000);
    EXPECT_GT(loaded.info.updated, 0);

    ASSERT_EQ(loaded.context.size(), cm.size());
    ASSERT_TRUE(loaded.context.system().has_value());
    EXPECT_EQ(loaded.context.system()->content, "system prompt");
    EXPECT_EQ(loaded.context.messages()[1].tool_calls[0].name, "list_files");
    EXPECT_EQ(loaded.context.messages()[2].tool_call_id, "call_1");
    EXPECT_EQ(loaded.context.messages()[3].name, "context_generator");
    EXPECT_TRUE(loaded.context.tools_cached());
    EXPECT_EQ(loaded.context.cache_info().markers, cm.cache_info().markers);

    CostTracker restored;
    restored.restore(loaded.info.id, loaded.costs);
    EXPECT_DOUBLE_EQ(restored.session_total(loaded.info.id).cost, 0.25);
}

TEST(SessionStoreTest, SaveOverwritesWholeFile) {
    TempWorkspace ws;
    SessionStore store(ws.root().string());
    ContextManager cm = sample_context();
    store.save(sample_info("s1"), cm, nlohmann::json());

    cm.reduce([](const std::vector<Message>&) { return std::string("summary"); });
    store.save(sample_info("s1"), cm, nlohmann::json());

    auto loaded = store.load("s1");
    ASSERT_EQ(loaded.context.size(), 1u);
    EXPECT_EQ(loaded.context.messages()[0].name, "summary");
    EXPECT_TRUE(loaded.costs.is_null());
}

TEST(SessionStoreTest, MissingSessionOrHeader) {
    TempWorkspace ws;
    SessionStore store(ws.root().string());
    EXPECT_THROW(store.load("absent"), Error);

    write_file(ws.root() / "headless.jsonl",
               R"({"type":"message","message":{"role":"user","content":"hi"}})" "\n");
    EXPECT_THROW(store.load("headless"), Error);
}

TEST(SessionStoreTest, BadLinesAreSkipped) {
    TempWorkspace ws;
    SessionStore store(ws.root().string());
    write_file(ws.root() / "damaged.jsonl",
               R"({"type":"session","id":"damaged","role":"assistant","model":"local:m"})" "\n"
               "{truncated line\n"
               R"({"type":"message","message":{"role":"user","content":"still here"}})" "\n");
    auto loaded = store.load("damaged");
    ASSERT_EQ(loaded.context.size(), 1u);
    EXPECT_EQ(loaded.context.messages()[0].content, "still here");
    EXPECT_FALSE(loaded.context.system().has_value());
}

TEST(SessionStoreTest, WellFormedJsonOfTheWrongShapeIsSkipped) {
    TempWorkspace ws;
    SessionStore store(ws.root().string());
    write_file(ws.root() / "odd.jsonl",
               R"({"type":"session","id":"odd","role":"assistant","model":"local:m"})" "\n"
               "42\n"
               "[1, 2]\n"
               "\"text\"\n"
               R"({"type":"message"})" "\n"
               R"({"type":"message","message":7})" "\n"
               R"({"type":7})" "\n"
               R"({"type":"message","message":{"role":"assistant","tool_calls":[{"id":"c1","function":{"name":"shell"}}]}})" "\n"
               R"({"type":"message","message":{"role":"user","content":"kept"}})" "\n");

    StoredSession loaded;
    ASSERT_NO_THROW(loaded = store.load("odd"));
    ASSERT_EQ(loaded.context.size(), 2u);
    EXPECT_EQ(loaded.context.messages()[0].tool_calls[0].name, "shell");
    EXPECT_EQ(loaded.context.messages()[0].tool_calls[0].arguments, "");
    EXPECT_EQ(loaded.context.messages()[1].content, "kept");
}

TEST(SessionStoreTest, ListNewestFirst) {
    TempWorkspace ws;
    SessionStore store(ws.root().string());
    EXPECT_TRUE(SessionStore((ws.root() / "nothing").string()).list().empty());

    ContextManager cm = sample_context();
    store.save(sample_info("older"), cm, nlohmann::json());
    store.save(sample_info("newer"), cm, nlohmann::json());
    write_file(ws.root() / "notes.txt", "not a session");

    auto now = fs::file_time_type::clock::now();
    fs::last_write_time(store.path_for("older"), now - std::chrono::hours(2));
    fs::last_write_time(store.path_for("newer"), now - std::chrono::hours(1));

    auto ids = store.list();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "newer");
    EXPECT_EQ(ids[1], "older");
}

} // namespace
