#pragma once
#include "message.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata {

struct CacheInfo {
    int markers = 0;            // system/tool marker counts as one
    int cached_tokens = 0;      // tokens up to and including the tail marker
    int uncached_tokens = 0;    // tokens after the tail marker
    int64_t last_checkpoint = 0;
};

using Summarizer = std::function<std::string(const std::vector<Message>&)>;

// The rolling transcript of one session. The system prompt lives in its own
// slot; messages() is the conversation proper.
class ContextManager {
public:
    // Content shorter than this is never truncated further.
    static constexpr int kMinContentTokens = 32;

    void set_system(const std::string& content);
    const std::optional<Message>& system() const { return system_; }

    void append(Message msg);
    const std::vector<Message>& messages() const { return messages_; }
    std::vector<Message> request_messages() const;
    size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }
    int estimate() const;

    // Returns true when the transcript changed. Limit 0 disables.
    bool maybe_truncate(int limit);

    void mark_cache_boundary();
    bool maybe_mark_cache_boundary(int tokens_threshold, int timeout_seconds);
    bool tools_cached() const { return tools_cached_; }
    CacheInfo cache_info() const;

    // Replaces the transcript with one summary message. The summarizer may
    // throw, leaving the transcript untouched.
    void reduce(const Summarizer& summarizer);

    void replace_all(std::vector<Message> msgs);
    void prune_orphans();
    void clear();

    nlohmann::json to_json() const;
    static ContextManager from_json(const nlohmann::json& j);

private:
    std::optional<Message> system_;
    std::vector<Message> messages_;
    bool tools_cached_ = false;
    int64_t last_checkpoint_ = 0;

    static void refresh_tokens(Message& m);
    std::vector<std::pair<size_t, size_t>> exchanges() const;
    std::vector<std::pair<size_t, size_t>> call_units() const;
    bool drop_oldest_call();
    int tail_marker_index() const;
};

} // namespace strata
