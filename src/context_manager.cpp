#include "context_manager.hpp"
#include "tokens.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace strata {

void ContextManager::refresh_tokens(Message& m) {
    m.tokens = estimate_tokens(m);
}

void ContextManager::set_system(const std::string& content) {
    Message m = make_message("system", content);
    m.timestamp = epoch_now();
    m.cached = system_ ? system_->cached : false;
    refresh_tokens(m);
    system_ = std::move(m);
}

void ContextManager::append(Message msg) {
    if (msg.timestamp == 0) msg.timestamp = epoch_now();
    refresh_tokens(msg);
    messages_.push_back(std::move(msg));
}

std::vector<Message> ContextManager::request_messages() const {
    std::vector<Message> out;
    out.reserve(messages_.size() + 1);
    if (system_) out.push_back(*system_);
    out.insert(out.end(), messages_.begin(), messages_.end());
    return out;
}

int ContextManager::estimate() const {
    int total = system_ ? system_->tokens : 0;
    for (auto& m : messages_) total += m.tokens;
    return total;
}

// [begin, end) ranges, each starting at a user message. Anything before the
// first user message forms its own leading range.
std::vector<std::pair<size_t, size_t>> ContextManager::exchanges() const {
    std::vector<std::pair<size_t, size_t>> out;
    size_t start = 0;
    for (size_t i = 1; i < messages_.size(); i++) {
        if (messages_[i].role == "user") {
            out.emplace_back(start, i);
            start = i;
        }
    }
    if (!messages_.empty()) out.emplace_back(start, messages_.size());
    return out;
}

// Tool results stay in the unit of the call that produced them.
std::vector<std::pair<size_t, size_t>> ContextManager::call_units() const {
    std::vector<std::pair<size_t, size_t>> out;
    size_t start = 0;
    for (size_t i = 1; i < messages_.size(); i++) {
        if (messages_[i].role != "tool") {
            out.emplace_back(start, i);
            start = i;
        }
    }
    if (!messages_.empty()) out.emplace_back(start, messages_.size());
    return out;
}

bool ContextManager::maybe_truncate(int limit) {
    if (limit <= 0) return false;
    int before = estimate();
    if (before <= limit) return false;
    size_t before_count = messages_.size();

    // 1. Oldest whole exchanges; the current one always stays
    while (estimate() > limit) {
        auto ex = exchanges();
        if (ex.size() <= 1) break;
        messages_.erase(messages_.begin() + static_cast<long>(ex[0].first),
                        messages_.begin() + static_cast<long>(ex[0].second));
    }

    auto shrink = [&](Message& m, int floor) {
        int ct = estimate_tokens(m.content);
        if (ct <= floor + 8) return;
        int excess = estimate() - limit;
        int target = std::max(ct - excess, std::max(floor, 1));
        std::string cut = truncate_to_tokens(m.content, target, false);
        if (estimate_tokens(cut) >= ct) return;
        m.content = std::move(cut);
        refresh_tokens(m);
    };

    // 2. Message contents, oldest first
    for (size_t i = 0; i < messages_.size() && estimate() > limit; i++) {
        shrink(messages_[i], kMinContentTokens);
    }

    // 3. Oldest call/result units until one is left
    while (estimate() > limit) {
        auto units = call_units();
        if (units.size() <= 1) break;
        messages_.erase(messages_.begin() + static_cast<long>(units[0].first),
                        messages_.begin() + static_cast<long>(units[0].second));
    }

    // 4. Inside the last unit, the oldest call leaves with its result
    while (estimate() > limit && drop_oldest_call()) {
    }

    // 5. Whatever is left, with no floor
    for (size_t i = 0; i < messages_.size() && estimate() > limit; i++) {
        shrink(messages_[i], 0);
    }

    if (system_ && estimate() > limit) shrink(*system_, kMinContentTokens);

    int after = estimate();
    if (log_enabled(LogLevel::info)) {
        std::cerr << "[context] Truncated " << before << " -> " << after << " tokens ("
                  << before_count << " -> " << messages_.size() << " messages)";
        if (after > limit) std::cerr << ", still over limit " << limit;
        std::cerr << "\n";
    }
    return after != before || messages_.size() != before_count;
}

// Removes the first call of a multi-call assistant message together with its
// result. False when every assistant message is down to one call.
bool ContextManager::drop_oldest_call() {
    for (auto& m : messages_) {
        if (m.role != "assistant" || m.tool_calls.size() <= 1) continue;
        std::string id = m.tool_calls.front().id;
        m.tool_calls.erase(m.tool_calls.begin());
        refresh_tokens(m);
        messages_.erase(
            std::remove_if(messages_.begin(), messages_.end(), [&](const Message& r) {
                return r.role == "tool" && r.tool_call_id == id;
            }),
            messages_.end());
        return true;
    }
    return false;
}

// Last index whose prefix has no pending tool calls, or -1.
int ContextManager::tail_marker_index() const {
    std::set<std::string> pending;
    int last = -1;
    for (size_t i = 0; i < messages_.size(); i++) {
        auto& m = messages_[i];
        if (m.role == "assistant") {
            for (auto& tc : m.tool_calls) pending.insert(tc.id);
        } else if (m.role == "tool") {
            pending.erase(m.tool_call_id);
        }
        if (pending.empty()) last = static_cast<int>(i);
    }
    return last;
}

void ContextManager::mark_cache_boundary() {
    if (system_) system_->cached = true;
    tools_cached_ = true;

    for (auto& m : messages_) m.cached = false;
    int idx = tail_marker_index();
    if (idx >= 0) messages_[static_cast<size_t>(idx)].cached = true;
    last_checkpoint_ = epoch_now();
}

bool ContextManager::maybe_mark_cache_boundary(int tokens_threshold, int timeout_seconds) {
    if (tokens_threshold <= 0 && timeout_seconds <= 0) return false;
    auto info = cache_info();
    if (info.uncached_tokens == 0) return false;

    bool by_size = tokens_threshold > 0 && info.uncached_tokens >= tokens_threshold;
    bool by_time = timeout_seconds > 0 && last_checkpoint_ > 0 &&
                   epoch_now() - last_checkpoint_ >= timeout_seconds;
    if (!by_size && !by_time) return false;

    mark_cache_boundary();
    if (log_enabled(LogLevel::debug)) {
        std::cerr << "[context] Cache boundary moved (" << info.uncached_tokens
                  << " uncached tokens" << (by_time ? ", timeout" : "") << ")\n";
    }
    return true;
}

CacheInfo ContextManager::cache_info() const {
    CacheInfo info;
    info.last_checkpoint = last_checkpoint_;
    if ((system_ && system_->cached) || tools_cached_) info.markers++;

    int tail = -1;
    for (size_t i = 0; i < messages_.size(); i++) {
        if (messages_[i].cached) tail = static_cast<int>(i);
    }
    if (tail >= 0) info.markers++;

    if (system_) {
        if (system_->cached) info.cached_tokens += system_->tokens;
        else info.uncached_tokens += system_->tokens;
    }
    for (size_t i = 0; i < messages_.size(); i++) {
        if (static_cast<int>(i) <= tail) info.cached_tokens += messages_[i].tokens;
        else info.uncached_tokens += messages_[i].tokens;
    }
    return info;
}

void ContextManager::reduce(const Summarizer& summarizer) {
    if (messages_.empty()) return;
    std::string summary = summarizer(messages_);

    Message m = make_message("assistant", summary);
    m.name = "summary";
    m.cached = true;
    m.timestamp = epoch_now();
    refresh_tokens(m);

    // Reducing a reduced transcript never makes it bigger
    if (messages_.size() == 1 && m.tokens >= messages_[0].tokens) {
        messages_[0].cached = true;
        return;
    }
    int before = estimate();
    messages_.clear();
    messages_.push_back(std::move(m));
    last_checkpoint_ = epoch_now();
    if (log_enabled(LogLevel::info)) {
        std::cerr << "[context] Reduced " << before << " -> " << estimate() << " tokens\n";
    }
}

void ContextManager::replace_all(std::vector<Message> msgs) {
    for (auto& m : msgs) {
        if (m.timestamp == 0) m.timestamp = epoch_now();
        refresh_tokens(m);
    }
    messages_ = std::move(msgs);
}

void ContextManager::prune_orphans() {
    std::set<std::string> call_ids;
    for (auto& m : messages_) {
        if (m.role == "assistant") {
            for (auto& tc : m.tool_calls) call_ids.insert(tc.id);
        }
    }

    // Tool results whose call is gone
    messages_.erase(
        std::remove_if(messages_.begin(), messages_.end(), [&](const Message& m) {
            return m.role == "tool" && call_ids.find(m.tool_call_id) == call_ids.end();
        }),
        messages_.end());

    std::set<std::string> result_ids;
    for (auto& m : messages_) {
        if (m.role == "tool") result_ids.insert(m.tool_call_id);
    }

    // Calls whose results never arrived; drop the message if nothing is left
    for (auto& m : messages_) {
        if (m.role != "assistant" || m.tool_calls.empty()) continue;
        m.tool_calls.erase(
            std::remove_if(m.tool_calls.begin(), m.tool_calls.end(), [&](const ToolCall& tc) {
                return result_ids.find(tc.id) == result_ids.end();
            }),
            m.tool_calls.end());
        refresh_tokens(m);
    }
    messages_.erase(
        std::remove_if(messages_.begin(), messages_.end(), [](const Message& m) {
            return m.role == "assistant" && m.tool_calls.empty() && m.content.empty();
        }),
        messages_.end());
}

void ContextManager::clear() {
    messages_.clear();
    last_checkpoint_ = 0;
}

nlohmann::json ContextManager::to_json() const {
    nlohmann::json j;
    j["system"] = system_ ? system_->to_record() : nlohmann::json();
    j["messages"] = nlohmann::json::array();
    for (auto& m : messages_) j["messages"].push_back(m.to_record());
    j["tools_cached"] = tools_cached_;
    j["last_cache_checkpoint"] = last_checkpoint_;
    return j;
}

ContextManager ContextManager::from_json(const nlohmann::json& j) {
    ContextManager cm;
    if (j.contains("system") && j["system"].is_object()) {
        cm.system_ = Message::from_record(j["system"]);
        refresh_tokens(*cm.system_);
    }
    if (j.contains("messages") && j["messages"].is_array()) {
        for (auto& mj : j["messages"]) {
            cm.messages_.push_back(Message::from_record(mj));
            refresh_tokens(cm.messages_.back());
        }
    }
    cm.tools_cached_ = j.value("tools_cached", false);
    cm.last_checkpoint_ = j.value("last_cache_checkpoint", static_cast<int64_t>(0));
    return cm;
}

} // namespace strata
