#pragma once
#include "config.hpp"
#include "cost_tracker.hpp"
#include "mcp_client.hpp"
#include "message.hpp"
#include <string>
#include <vector>

namespace strata {

struct ProviderRequest {
    std::vector<Message> messages;
    std::vector<ToolSchema> tools;
    std::string model;          // "provider:model" at the router, bare model at a provider
    double temperature = 0.7;
    int max_tokens = 4096;
    bool cache_tools = false;   // cache breakpoint after the tool definitions
};

struct ProviderResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    std::string finish_reason;
    Usage usage;
    double cost = 0.0;
    bool has_tool_calls() const { return !tool_calls.empty(); }
};

class Provider {
public:
    virtual ~Provider() = default;
    virtual std::string name() const = 0;
    // Throws ProviderError.
    virtual ProviderResponse chat(const ProviderRequest& req) = 0;
};

// Any /chat/completions endpoint: OpenRouter, OpenAI, DeepSeek, local servers.
class OpenAICompatProvider : public Provider {
public:
    OpenAICompatProvider(std::string name, const ProviderConfig& cfg);

    std::string name() const override { return name_; }
    ProviderResponse chat(const ProviderRequest& req) override;

    nlohmann::json build_body(const ProviderRequest& req) const;
    ProviderResponse parse_response(const std::string& body) const;

private:
    std::string name_;
    ProviderConfig config_;
    UrlParts url_;

    bool supports_cache_control(const std::string& model) const;
    double compute_cost(const Usage& usage) const;
};

} // namespace strata
