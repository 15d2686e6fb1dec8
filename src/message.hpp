#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace strata {

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // JSON string
};

struct Message {
    std::string role;       // "system", "user", "assistant", "tool"
    std::string content;
    std::string tool_call_id;         // for role="tool"
    std::string name;                 // tool name for role="tool", layer name for layer output
    std::vector<ToolCall> tool_calls; // for role="assistant" with tool calls
    bool cached = false;              // cache breakpoint after this message
    int64_t timestamp = 0;
    int tokens = 0;                   // filled in by ContextManager::append

    bool has_tool_calls() const { return !tool_calls.empty(); }

    // OpenAI chat-completions wire format.
    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role;
        if (!content.empty() || tool_calls.empty()) j["content"] = content;
        if (!tool_call_id.empty()) j["tool_call_id"] = tool_call_id;
        if (role == "tool" && !name.empty()) j["name"] = name;
        if (!tool_calls.empty()) {
            auto& arr = j["tool_calls"];
            for (auto& tc : tool_calls) {
                arr.push_back({
                    {"id", tc.id},
                    {"type", "function"},
                    {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
                });
            }
        }
        return j;
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = j.value("role", "");
        if (j.contains("content") && j["content"].is_string())
            m.content = j["content"].get<std::string>();
        m.tool_call_id = j.value("tool_call_id", "");
        m.name = j.value("name", "");
        if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
            for (auto& tc : j["tool_calls"]) {
                ToolCall t;
                t.id = tc.value("id", "");
                if (tc.contains("function")) {
                    auto& fn = tc["function"];
                    t.name = fn.value("name", "");
                    if (fn.contains("arguments")) {
                        auto& args = fn["arguments"];
                        t.arguments = args.is_string() ? args.get<std::string>() : args.dump();
                    }
                }
                m.tool_calls.push_back(std::move(t));
            }
        }
        return m;
    }

    // Persistence format: wire fields plus local metadata.
    nlohmann::json to_record() const {
        auto j = to_json();
        if (!name.empty()) j["name"] = name;
        j["cached"] = cached;
        j["timestamp"] = timestamp;
        j["tokens"] = tokens;
        return j;
    }

    static Message from_record(const nlohmann::json& j) {
        auto m = from_json(j);
        m.cached = j.value("cached", false);
        m.timestamp = j.value("timestamp", static_cast<int64_t>(0));
        m.tokens = j.value("tokens", 0);
        return m;
    }
};

inline Message make_message(const std::string& role, const std::string& content) {
    Message m;
    m.role = role;
    m.content = content;
    return m;
}

} // namespace strata
