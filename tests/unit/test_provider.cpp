#include <gtest/gtest.h>
#include "errors.hpp"
#include "provider.hpp"

using namespace strata;

namespace {

ProviderConfig priced() {
    ProviderConfig pc;
    pc.api_base = "https://api.example.com/v1";
    pc.input_price = 3.0;
    pc.output_price = 15.0;
    pc.cached_price = 0.3;
    return pc;
}

ProviderRequest cached_request(const std::string& model) {
    ProviderRequest req;
    req.model = model;
    Message sys = make_message("system", "You are helpful.");
    sys.cached = true;
    req.messages.push_back(sys);
    req.messages.push_back(make_message("user", "hello"));
    req.tools.push_back(ToolSchema{"list_files", "List files", {{"type", "object"}}, "filesystem"});
    req.cache_tools = true;
    return req;
}

TEST(ProviderTest, CacheControlForClaudeModels) {
    OpenAICompatProvider p("openrouter", priced());
    auto body = p.build_body(cached_request("anthropic/claude-sonnet-4"));

    auto& sys = body["messages"][0];
    ASSERT_TRUE(sys["content"].is_array());
    EXPECT_EQ(sys["content"][0]["text"], "You are helpful.");
    EXPECT_EQ(sys["content"][0]["cache_control"]["type"], "ephemeral");
    EXPECT_TRUE(body["messages"][1]["content"].is_string());
    EXPECT_EQ(body["tools"][0]["cache_control"]["type"], "ephemeral");
    EXPECT_EQ(body["usage"]["include"], true);
}

TEST(ProviderTest, NoCacheControlForOtherModels) {
    OpenAICompatProvider p("openai", priced());
    auto body = p.build_body(cached_request("gpt-4o"));
    EXPECT_TRUE(body["messages"][0]["content"].is_string());
    EXPECT_FALSE(body["tools"][0].contains("cache_control"));
    EXPECT_FALSE(body.contains("usage"));
    EXPECT_EQ(body["model"], "gpt-4o");
}

TEST(ProviderTest, ParsesToolCallsAndUsage) {
    OpenAICompatProvider p("openai", priced());
    auto resp = p.parse_response(R"JSON({
        "choices": [{
            "message": {
                "content": null,
                "tool_calls": [{
                    "id": "call_1",
                    "type": "function",
                    "function": {"name": "shell", "arguments": "{\"command\":\"ls\"}"}
                }]
            },
            "finish_reason": "tool_calls"
        }],
        "usage": {
            "prompt_tokens": 1000000,
            "completion_tokens": 100000,
            "prompt_tokens_details": {"cached_tokens": 500000}
        }
    })JSON");

    ASSERT_EQ(resp.tool_calls.size(), 1u);
    EXPECT_EQ(resp.tool_calls[0].id, "call_1");
    EXPECT_EQ(resp.tool_calls[0].name, "shell");
    EXPECT_EQ(resp.tool_calls[0].arguments, "{\"command\":\"ls\"}");
    EXPECT_EQ(resp.content, "");
    EXPECT_EQ(resp.usage.input_tokens, 1000000);
    EXPECT_EQ(resp.usage.cached_tokens, 500000);
    // 0.5M uncached at $3, 0.5M cached at $0.3, 0.1M output at $15
    EXPECT_NEAR(resp.cost, 1.5 + 0.15 + 1.5, 1e-9);
}

TEST(ProviderTest, ReportedCostWins) {
    OpenAICompatProvider p("openrouter", priced());
    auto resp = p.parse_response(R"JSON({
        "choices": [{"message": {"content": "hi"}, "finish_reason": "stop"}],
        "usage": {"prompt_tokens": 10, "completion_tokens": 2, "prompt_cache_hit_tokens": 4, "cost": 0.0123}
    })JSON");
    EXPECT_EQ(resp.content, "hi");
    EXPECT_EQ(resp.usage.cached_tokens, 4);
    EXPECT_DOUBLE_EQ(resp.cost, 0.0123);
    EXPECT_FALSE(resp.has_tool_calls());
}

TEST(ProviderTest, TaggedToolCallsInContent) {
    OpenAICompatProvider p("local", priced());
    auto resp = p.parse_response(R"JSON({
        "choices": [{"message": {"content": "Looking.\n<tool_call>{\"name\": \"list_files\", \"arguments\": {\"directory\": \".\"}}</tool_call>"}}]
    })JSON");
    ASSERT_EQ(resp.tool_calls.size(), 1u);
    EXPECT_EQ(resp.tool_calls[0].name, "list_files");
    EXPECT_EQ(nlohmann::json::parse(resp.tool_calls[0].arguments)["directory"], ".");
    EXPECT_FALSE(resp.tool_calls[0].id.empty());
    EXPECT_EQ(resp.content, "Looking.");
    EXPECT_EQ(resp.finish_reason, "tool_calls");
}

TEST(ProviderTest, ErrorBodyIsClassified) {
    OpenAICompatProvider p("openai", priced());
    try {
        p.parse_response(R"({"error": {"message": "Rate limit reached, try again"}})");
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_EQ(e.kind(), ProviderErrorKind::rate_limit);
        EXPECT_TRUE(e.retryable());
        EXPECT_EQ(e.provider(), "openai");
    }
    EXPECT_THROW(p.parse_response("<html>bad gateway</html>"), ProviderError);
}

TEST(ProviderTest, ClassifyErrorText) {
    EXPECT_EQ(classify_provider_error("HTTP 401 Unauthorized"), ProviderErrorKind::auth);
    EXPECT_EQ(classify_provider_error("429 Too Many Requests"), ProviderErrorKind::rate_limit);
    EXPECT_EQ(classify_provider_error("Connection refused"), ProviderErrorKind::network);
    EXPECT_EQ(classify_provider_error("maximum context length exceeded"), ProviderErrorKind::context_overflow);
    EXPECT_EQ(classify_provider_error(""), ProviderErrorKind::unknown);
    EXPECT_FALSE(is_retryable_error(ProviderErrorKind::auth));
    EXPECT_TRUE(is_retryable_error(ProviderErrorKind::overloaded));
}

} // namespace
