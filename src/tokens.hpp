#pragma once
#include "message.hpp"
#include "utils.hpp"
#include <string>
#include <vector>

namespace strata {

// ── Token estimation (4 codepoints ≈ 1 token, rounded up) ──
inline int estimate_tokens(const std::string& text) {
    return static_cast<int>((utf8_length(text) + 3) / 4);
}

inline int estimate_tokens(const Message& msg) {
    int tokens = estimate_tokens(msg.content) + 4; // role overhead
    for (auto& tc : msg.tool_calls) {
        tokens += estimate_tokens(tc.name) + estimate_tokens(tc.arguments) + 8;
    }
    return tokens;
}

inline int estimate_tokens(const std::vector<Message>& msgs) {
    int total = 0;
    for (auto& m : msgs) total += estimate_tokens(m);
    return total;
}

inline std::string truncation_marker(int dropped_tokens) {
    return "[truncated " + std::to_string(dropped_tokens) + " tokens]";
}

// Keeps the head (and, when keep_tail is set, a quarter of the budget as tail)
// on codepoint and preferably line boundaries, so the estimate of the result
// never exceeds max_tokens.
inline std::string truncate_to_tokens(const std::string& text, int max_tokens, bool keep_tail) {
    int total = estimate_tokens(text);
    if (max_tokens <= 0 || total <= max_tokens) return text;

    std::string marker = "\n" + truncation_marker(total - max_tokens) + "\n";
    int budget_tokens = max_tokens - estimate_tokens(marker) - 1;
    if (budget_tokens < 0) budget_tokens = 0;
    size_t budget = static_cast<size_t>(budget_tokens) * 4;

    size_t tail_cps = keep_tail ? budget / 4 : 0;
    size_t head_cps = budget - tail_cps;

    std::string head = utf8_head(text, head_cps);
    size_t nl = head.rfind('\n');
    if (nl != std::string::npos && nl + 1 >= head.size() / 2) head.resize(nl + 1);

    std::string tail = tail_cps > 0 ? utf8_tail(text, tail_cps) : "";
    size_t tnl = tail.find('\n');
    if (tnl != std::string::npos && tnl < tail.size() / 2) tail = tail.substr(tnl + 1);

    if (!head.empty() && head.back() == '\n') head.pop_back();
    return head + marker + tail;
}

} // namespace strata
