#include "provider.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <iostream>

namespace strata {

OpenAICompatProvider::OpenAICompatProvider(std::string name, const ProviderConfig& cfg)
    : name_(std::move(name)), config_(cfg), url_(parse_url(cfg.api_base)) {}

// Explicit cache breakpoints only matter for Anthropic and Gemini models;
// OpenAI and DeepSeek cache prefixes on their own.
bool OpenAICompatProvider::supports_cache_control(const std::string& model) const {
    return model.find("claude") != std::string::npos ||
           model.find("anthropic") != std::string::npos ||
           model.find("gemini") != std::string::npos;
}

double OpenAICompatProvider::compute_cost(const Usage& usage) const {
    double uncached = static_cast<double>(usage.input_tokens - usage.cached_tokens);
    double cached_price = config_.cached_price > 0 ? config_.cached_price : config_.input_price;
    return (uncached * config_.input_price +
            usage.cached_tokens * cached_price +
            usage.output_tokens * config_.output_price) / 1e6;
}

// ── Fallback tool-call parsing for models that emit <tool_call>{...}</tool_call> ──

static size_t find_json_object_end(const std::string& s, size_t pos) {
    if (pos >= s.size() || s[pos] != '{') return std::string::npos;
    int depth = 0;
    bool in_str = false;
    bool esc = false;
    for (size_t i = pos; i < s.size(); i++) {
        char c = s[i];
        if (esc) { esc = false; continue; }
        if (c == '\\' && in_str) { esc = true; continue; }
        if (c == '"') { in_str = !in_str; continue; }
        if (in_str) continue;
        if (c == '{') depth++;
        else if (c == '}') { depth--; if (depth == 0) return i; }
    }
    return std::string::npos;
}

static std::vector<ToolCall> parse_tagged_tool_calls(std::string& text) {
    static const std::string open_tag = "<tool_call>";
    static const std::string close_tag = "</tool_call>";
    std::vector<ToolCall> calls;
    size_t pos = 0;
    while (true) {
        size_t start = text.find(open_tag, pos);
        if (start == std::string::npos) break;
        size_t end = text.find(close_tag, start);
        if (end == std::string::npos) break;

        std::string inner = text.substr(start + open_tag.size(), end - start - open_tag.size());
        size_t brace = inner.find('{');
        size_t brace_end = find_json_object_end(inner, brace);
        if (brace != std::string::npos && brace_end != std::string::npos) {
            try {
                auto j = nlohmann::json::parse(inner.substr(brace, brace_end - brace + 1));
                ToolCall tc;
                tc.id = generate_tool_call_id();
                tc.name = j.value("name", "");
                if (j.contains("arguments")) {
                    tc.arguments = j["arguments"].is_string() ? j["arguments"].get<std::string>()
                                                              : j["arguments"].dump();
                }
                if (!tc.name.empty()) calls.push_back(std::move(tc));
            } catch (const nlohmann::json::exception&) {
                // not a tool call after all
            }
        }
        text.erase(start, end + close_tag.size() - start);
        pos = start;
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\n')) text.pop_back();
    return calls;
}

nlohmann::json OpenAICompatProvider::build_body(const ProviderRequest& req) const {
    bool cache_control = supports_cache_control(req.model);

    nlohmann::json body;
    body["model"] = req.model;
    body["max_tokens"] = req.max_tokens;
    body["temperature"] = req.temperature;

    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& m : req.messages) {
        auto j = m.to_json();
        if (m.cached && cache_control && !m.content.empty()) {
            j["content"] = nlohmann::json::array({
                {{"type", "text"}, {"text", m.content}, {"cache_control", {{"type", "ephemeral"}}}}
            });
        }
        msgs.push_back(std::move(j));
    }

    if (!req.tools.empty()) {
        auto& tools = body["tools"];
        for (auto& t : req.tools) tools.push_back(t.to_json());
        if (req.cache_tools && cache_control) {
            tools.back()["cache_control"] = {{"type", "ephemeral"}};
        }
    }

    if (name_ == "openrouter") body["usage"] = {{"include", true}};
    return body;
}

ProviderResponse OpenAICompatProvider::parse_response(const std::string& body) const {
    ProviderResponse resp;
    try {
        auto j = nlohmann::json::parse(body);
        if (j.contains("error")) {
            std::string msg = j["error"].is_object() ? j["error"].value("message", j["error"].dump())
                                                     : j["error"].dump();
            throw ProviderError(classify_provider_error(msg), name_, msg);
        }
        if (j.contains("choices") && !j["choices"].empty()) {
            auto& choice = j["choices"][0];
            auto& msg = choice["message"];
            resp.content = msg.contains("content") && msg["content"].is_string()
                           ? msg["content"].get<std::string>() : "";
            if (choice.contains("finish_reason") && choice["finish_reason"].is_string())
                resp.finish_reason = choice["finish_reason"].get<std::string>();

            if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
                for (auto& tc : msg["tool_calls"]) {
                    ToolCall t;
                    t.id = tc.value("id", "");
                    if (t.id.empty()) t.id = generate_tool_call_id();
                    if (tc.contains("function")) {
                        t.name = tc["function"].value("name", "");
                        auto& args = tc["function"]["arguments"];
                        t.arguments = args.is_string() ? args.get<std::string>() : args.dump();
                    }
                    if (!t.name.empty()) resp.tool_calls.push_back(std::move(t));
                }
            }
        }
        if (j.contains("usage") && j["usage"].is_object()) {
            auto& u = j["usage"];
            resp.usage.input_tokens = u.value("prompt_tokens", 0);
            resp.usage.output_tokens = u.value("completion_tokens", 0);
            if (u.contains("prompt_tokens_details") && u["prompt_tokens_details"].is_object()) {
                resp.usage.cached_tokens = u["prompt_tokens_details"].value("cached_tokens", 0);
            } else {
                resp.usage.cached_tokens = u.value("prompt_cache_hit_tokens", 0);
            }
            if (u.contains("cost") && u["cost"].is_number()) {
                resp.cost = u["cost"].get<double>();
            } else {
                resp.cost = compute_cost(resp.usage);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProviderError(ProviderErrorKind::unknown, name_,
                            std::string("failed to parse response: ") + e.what());
    }

    if (resp.tool_calls.empty() && resp.content.find("<tool_call>") != std::string::npos) {
        resp.tool_calls = parse_tagged_tool_calls(resp.content);
    }
    if (resp.finish_reason.empty()) {
        resp.finish_reason = resp.has_tool_calls() ? "tool_calls" : "stop";
    }
    return resp;
}

static ProviderErrorKind kind_for_status(int status, const std::string& body) {
    if (status == 401 || status == 403) return ProviderErrorKind::auth;
    if (status == 402) return ProviderErrorKind::billing;
    if (status == 429) return ProviderErrorKind::rate_limit;
    if (status == 408 || status == 504) return ProviderErrorKind::timeout;
    if (status >= 500) return ProviderErrorKind::overloaded;
    return classify_provider_error(body);
}

ProviderResponse OpenAICompatProvider::chat(const ProviderRequest& req) {
    httplib::Client cli(url_.base());
    cli.set_connection_timeout(30);
    cli.set_read_timeout(300);

    std::string path = url_.path + "/chat/completions";
    std::string payload = build_body(req).dump();

    httplib::Headers headers;
    std::string key = config_.resolved_api_key();
    if (!key.empty()) {
        headers.emplace("Authorization", "Bearer " + key);
    }
    if (name_ == "openrouter") {
        headers.emplace("X-Title", "strata");
    }

    if (log_enabled(LogLevel::debug)) {
        std::cerr << "[provider] POST " << url_.base() << path << " model=" << req.model
                  << " messages=" << req.messages.size() << " tools=" << req.tools.size() << "\n";
    }

    auto res = cli.Post(path, headers, payload, "application/json");
    if (!res) {
        std::string err = httplib::to_string(res.error());
        auto kind = classify_provider_error(err);
        if (kind == ProviderErrorKind::unknown) kind = ProviderErrorKind::network;
        throw ProviderError(kind, name_, "request failed: " + err);
    }
    if (res->status != 200) {
        throw ProviderError(kind_for_status(res->status, res->body), name_,
                            "status " + std::to_string(res->status) + ": " + res->body);
    }
    return parse_response(res->body);
}

} // namespace strata
