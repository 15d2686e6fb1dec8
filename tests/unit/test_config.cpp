#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace strata;
using strata::testing::TempWorkspace;
using strata::testing::write_file;

namespace {

TEST(ConfigTest, DefaultsAreValid) {
    Config c = Config::make_default();
    EXPECT_NO_THROW(c.validate());
    EXPECT_EQ(c.default_role, "developer");
    EXPECT_EQ(c.mcp_response_warning_threshold, 10000);
    EXPECT_EQ(c.mcp_response_truncation_threshold, 20000);
    EXPECT_FALSE(c.enable_auto_truncation);

    const RoleConfig& dev = c.role("developer");
    EXPECT_TRUE(dev.enable_layers);
    ASSERT_EQ(dev.layer_refs.size(), 2u);
    EXPECT_EQ(dev.layer_refs[0], "query_processor");

    auto layers = c.role_layers(dev);
    ASSERT_EQ(layers.size(), 2u);
    EXPECT_EQ(layers[1].output_mode, OutputMode::append);

    bool has_web = false;
    for (auto& s : c.servers) has_web = has_web || (s.name == "web" && s.kind == TransportKind::builtin);
    EXPECT_TRUE(has_web);

    const CommandConfig* reduce = c.find_command("reduce");
    ASSERT_NE(reduce, nullptr);
    EXPECT_EQ(reduce->style, CommandStyle::layer);
    EXPECT_EQ(reduce->layer.output_mode, OutputMode::replace);
}

TEST(ConfigTest, UnknownRoleThrows) {
    Config c = Config::make_default();
    EXPECT_THROW(c.role("nobody"), ConfigError);
    EXPECT_EQ(c.find_layer("nobody"), nullptr);
    EXPECT_EQ(c.find_server("nobody"), nullptr);
}

TEST(ConfigTest, FromJsonMergesOverDefaults) {
    auto j = nlohmann::json::parse(R"JSON({
        "model": "openai:gpt-4o",
        "max_tool_rounds": 5,
        "default_role": "reviewer",
        "roles": [
            {"name": "reviewer", "system": "Review code."}
        ],
        "mcp": {"denied_tools": ["shell"]}
    })JSON");
    Config c = Config::from_json(j);
    EXPECT_EQ(c.model, "openai:gpt-4o");
    EXPECT_EQ(c.max_tool_rounds, 5);
    EXPECT_EQ(c.max_retries, 3);
    ASSERT_EQ(c.denied_tools.size(), 1u);

    // Unset role fields come from the assistant role
    const RoleConfig& r = c.role("reviewer");
    EXPECT_EQ(r.system, "Review code.");
    ASSERT_EQ(r.mcp.server_refs.size(), 1u);
    EXPECT_EQ(r.mcp.server_refs[0], "filesystem");
    EXPECT_NO_THROW(c.role("assistant"));
}

TEST(ConfigTest, RejectsBadValues) {
    EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"model": "no-prefix"})")), ConfigError);
    EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"max_tool_rounds": 0})")), ConfigError);
    EXPECT_THROW(Config::from_json(nlohmann::json::parse(R"({"max_tokens": "many"})")), ConfigError);
    EXPECT_THROW(Config::from_json(nlohmann::json::parse(
                     R"({"layers": [{"name": "x", "output_mode": "sideways"}]})")),
                 ConfigError);
    EXPECT_THROW(Config::from_json(nlohmann::json::parse(
                     R"({"roles": [{"name": "r", "layer_refs": ["missing"]}]})")),
                 ConfigError);
}

TEST(ConfigTest, ServerValidation) {
    ToolServerConfig s;
    s.name = "remote";
    s.kind = TransportKind::http;
    EXPECT_THROW(s.validate(), ConfigError);
    s.url = "ftp://example.com";
    EXPECT_THROW(s.validate(), ConfigError);
    s.url = "http://127.0.0.1:9000/mcp";
    EXPECT_NO_THROW(s.validate());

    ToolServerConfig p;
    p.name = "proc";
    p.kind = TransportKind::stdio;
    EXPECT_THROW(p.validate(), ConfigError);
    p.command = "/usr/bin/true";
    p.timeout_seconds = 0;
    EXPECT_THROW(p.validate(), ConfigError);
}

TEST(ConfigTest, DuplicateServerRejected) {
    auto j = nlohmann::json::parse(R"JSON({
        "mcp": {"servers": [
            {"name": "developer", "type": "builtin"},
            {"name": "developer", "type": "builtin"},
            {"name": "filesystem", "type": "builtin"},
            {"name": "agent", "type": "builtin"}
        ]}
    })JSON");
    EXPECT_THROW(Config::from_json(j), ConfigError);
}

TEST(ConfigTest, SaveAndLoadRoundTrip) {
    TempWorkspace ws;
    std::string path = (ws.root() / "nested" / "config.json").string();

    Config c = Config::make_default();
    c.max_session_spending_threshold = 2.5;
    c.agents.push_back(AgentConfig{"context_generator", "Collects context"});
    c.save(path);

    Config loaded = Config::load(path);
    EXPECT_DOUBLE_EQ(loaded.max_session_spending_threshold, 2.5);
    ASSERT_EQ(loaded.agents.size(), 1u);
    EXPECT_EQ(loaded.agents[0].name, "context_generator");
    EXPECT_EQ(loaded.roles.size(), c.roles.size());
    EXPECT_EQ(loaded.servers.size(), c.servers.size());
}

TEST(ConfigTest, MissingFileGivesDefaults) {
    TempWorkspace ws;
    Config c = Config::load((ws.root() / "absent.json").string());
    EXPECT_EQ(c.default_role, "developer");
}

TEST(ConfigTest, MalformedFileThrows) {
    TempWorkspace ws;
    auto path = ws.root() / "config.json";
    write_file(path, "{ not json");
    EXPECT_THROW(Config::load(path.string()), ConfigError);
}

} // namespace
