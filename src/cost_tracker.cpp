#include "cost_tracker.hpp"
#include <cstdio>
#include <iostream>
#include <sstream>

namespace strata {

void CostRecord::add(const CostRecord& o) {
    input_tokens += o.input_tokens;
    output_tokens += o.output_tokens;
    cached_tokens += o.cached_tokens;
    cost += o.cost;
    calls += o.calls;
    errors += o.errors;
    time_ms += o.time_ms;
}

void CostTracker::record_provider(const std::string& session, const std::string& layer,
                                  const Usage& usage, double cost, int64_t time_ms) {
    CostRecord r;
    r.input_tokens = usage.input_tokens;
    r.output_tokens = usage.output_tokens;
    r.cached_tokens = usage.cached_tokens;
    r.cost = cost;
    r.calls = 1;
    r.time_ms = time_ms;
    std::lock_guard<std::mutex> lock(mutex_);
    records_[CostKey{session, layer, ""}].add(r);
}

void CostTracker::record_tool(const std::string& session, const std::string& layer,
                              const std::string& tool, int64_t time_ms, bool error) {
    CostRecord r;
    r.calls = 1;
    r.errors = error ? 1 : 0;
    r.time_ms = time_ms;
    std::lock_guard<std::mutex> lock(mutex_);
    records_[CostKey{session, layer, tool}].add(r);
}

CostRecord CostTracker::sum_if(const std::string& session, const std::string* layer,
                               const std::string* tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    CostRecord total;
    for (auto& [key, rec] : records_) {
        if (key.session != session) continue;
        if (layer && key.layer != *layer) continue;
        if (tool && key.tool != *tool) continue;
        total.add(rec);
    }
    return total;
}

CostRecord CostTracker::session_total(const std::string& session) const {
    return sum_if(session, nullptr, nullptr);
}

CostRecord CostTracker::layer_total(const std::string& session, const std::string& layer) const {
    return sum_if(session, &layer, nullptr);
}

CostRecord CostTracker::tool_total(const std::string& session, const std::string& tool) const {
    return sum_if(session, nullptr, &tool);
}

std::vector<std::pair<CostKey, CostRecord>> CostTracker::breakdown(const std::string& session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<CostKey, CostRecord>> out;
    for (auto& [key, rec] : records_) {
        if (key.session == session) out.emplace_back(key, rec);
    }
    return out;
}

static std::string fmt_cost(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "$%.5f", v);
    return buf;
}

std::string CostTracker::report(const std::string& session) const {
    auto total = session_total(session);
    std::map<std::string, CostRecord> layers;
    std::map<std::string, CostRecord> tools;
    CostRecord api;
    for (auto& [key, rec] : breakdown(session)) {
        if (!key.tool.empty()) {
            tools[key.tool].add(rec);
        } else {
            api.add(rec);
            layers[key.layer.empty() ? "main" : key.layer].add(rec);
        }
    }

    std::ostringstream out;
    char pct[16];
    std::snprintf(pct, sizeof(pct), "%.1f%%", total.cached_percent());
    out << "Session " << session << "\n"
        << "  tokens: input " << total.input_tokens << ", output " << total.output_tokens
        << ", cached " << total.cached_tokens << " (" << pct << ")\n"
        << "  cost: " << fmt_cost(total.cost) << " over " << api.calls << " requests\n"
        << "  time: api " << api.time_ms << " ms";
    int64_t tool_ms = 0;
    for (auto& [_, rec] : tools) tool_ms += rec.time_ms;
    out << ", tools " << tool_ms << " ms\n";

    if (!layers.empty()) {
        out << "  by layer:\n";
        for (auto& [name, rec] : layers) {
            out << "    " << name << ": " << rec.calls << " calls, "
                << rec.input_tokens << "/" << rec.output_tokens << " tokens, "
                << fmt_cost(rec.cost) << ", " << rec.time_ms << " ms\n";
        }
    }
    if (!tools.empty()) {
        out << "  by tool:\n";
        for (auto& [name, rec] : tools) {
            out << "    " << name << ": " << rec.calls << " calls";
            if (rec.errors > 0) out << " (" << rec.errors << " failed)";
            out << ", " << rec.time_ms << " ms\n";
        }
    }
    return out.str();
}

bool CostTracker::spending_exceeded(const std::string& session, double threshold) const {
    if (threshold <= 0.0) return false;
    double spent = session_total(session).cost;
    double checkpoint = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = checkpoints_.find(session);
        if (it != checkpoints_.end()) checkpoint = it->second;
    }
    return spent - checkpoint >= threshold;
}

void CostTracker::checkpoint_spending(const std::string& session) {
    double spent = session_total(session).cost;
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoints_[session] = spent;
}

nlohmann::json CostTracker::to_json(const std::string& session) const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& [key, rec] : breakdown(session)) {
        arr.push_back({
            {"layer", key.layer},
            {"tool", key.tool},
            {"input_tokens", rec.input_tokens},
            {"output_tokens", rec.output_tokens},
            {"cached_tokens", rec.cached_tokens},
            {"cost", rec.cost},
            {"calls", rec.calls},
            {"errors", rec.errors},
            {"time_ms", rec.time_ms}
        });
    }
    return arr;
}

void CostTracker::restore(const std::string& session, const nlohmann::json& j) {
    if (!j.is_array()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& item : j) {
        if (!item.is_object()) continue;
        try {
            CostRecord r;
            r.input_tokens = item.value("input_tokens", static_cast<int64_t>(0));
            r.output_tokens = item.value("output_tokens", static_cast<int64_t>(0));
            r.cached_tokens = item.value("cached_tokens", static_cast<int64_t>(0));
            r.cost = item.value("cost", 0.0);
            r.calls = item.value("calls", 0);
            r.errors = item.value("errors", 0);
            r.time_ms = item.value("time_ms", static_cast<int64_t>(0));
            records_[CostKey{session, item.value("layer", ""), item.value("tool", "")}].add(r);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[cost] skipping bad record (" << e.what() << ")\n";
        }
    }
}

} // namespace strata
