#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata {

struct Usage {
    int input_tokens = 0;
    int output_tokens = 0;
    int cached_tokens = 0;
};

struct CostRecord {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t cached_tokens = 0;
    double cost = 0.0;
    int calls = 0;
    int errors = 0;
    int64_t time_ms = 0;

    void add(const CostRecord& o);
    double cached_percent() const {
        return input_tokens > 0 ? 100.0 * static_cast<double>(cached_tokens) / static_cast<double>(input_tokens) : 0.0;
    }
};

// (session, layer, tool). Empty layer means the main exchange; empty tool
// means a provider call.
struct CostKey {
    std::string session;
    std::string layer;
    std::string tool;

    bool operator<(const CostKey& o) const {
        return std::tie(session, layer, tool) < std::tie(o.session, o.layer, o.tool);
    }
};

class CostTracker {
public:
    void record_provider(const std::string& session, const std::string& layer,
                         const Usage& usage, double cost, int64_t time_ms);
    void record_tool(const std::string& session, const std::string& layer,
                     const std::string& tool, int64_t time_ms, bool error);

    CostRecord session_total(const std::string& session) const;
    CostRecord layer_total(const std::string& session, const std::string& layer) const;
    CostRecord tool_total(const std::string& session, const std::string& tool) const;
    std::vector<std::pair<CostKey, CostRecord>> breakdown(const std::string& session) const;
    std::string report(const std::string& session) const;

    // Spend since the last checkpoint; threshold 0 disables.
    bool spending_exceeded(const std::string& session, double threshold) const;
    void checkpoint_spending(const std::string& session);

    nlohmann::json to_json(const std::string& session) const;
    void restore(const std::string& session, const nlohmann::json& j);

private:
    mutable std::mutex mutex_;
    std::map<CostKey, CostRecord> records_;
    std::map<std::string, double> checkpoints_;

    CostRecord sum_if(const std::string& session, const std::string* layer,
                      const std::string* tool) const;
};

} // namespace strata
