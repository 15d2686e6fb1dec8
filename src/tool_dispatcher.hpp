#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "cost_tracker.hpp"
#include "mcp_registry.hpp"
#include "message.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace strata {

// Who is calling: used for the allow-list and for cost attribution.
struct DispatchContext {
    std::string session;
    std::string layer;          // empty for the main exchange
    ToolScope scope;

    std::string describe() const {
        return layer.empty() ? "the active role" : "layer '" + layer + "'";
    }
};

// One entry per requested call, in request order. Exactly one of result and
// error is meaningful.
struct ToolOutcome {
    ToolCall call;
    ToolResult result;
    std::exception_ptr error;
};

class ToolDispatcher {
public:
    ToolDispatcher(const Config& cfg, ToolServerRegistry& registry, CostTracker& costs);

    // Throws ToolNotAllowed. Never contacts a server.
    void check_allowed(const std::string& tool, const DispatchContext& ctx) const;
    bool is_allowed(const std::string& tool, const DispatchContext& ctx) const;

    // Schemas the given context may call, for the provider request.
    std::vector<ToolSchema> tools_for(const DispatchContext& ctx) const;

    ToolResult execute(const ToolCall& call, const DispatchContext& ctx,
                       const CancellationToken& token);

    // Runs the calls concurrently. Returns every outcome in request order, or
    // throws CancelledError and returns nothing.
    std::vector<ToolOutcome> execute_batch(const std::vector<ToolCall>& calls,
                                           const DispatchContext& ctx,
                                           const CancellationToken& token);

    // Warning annotation, truncation, or ResponseTooLarge.
    ToolResult apply_size_policy(ToolResult result) const;

    // Calls still running on worker threads, abandoned ones included.
    int in_flight() const { return in_flight_->load(); }
    // Waits for them to finish; false when the limit passed first.
    bool wait_idle(std::chrono::milliseconds limit) const;

private:
    const Config& config_;
    ToolServerRegistry& registry_;
    CostTracker& costs_;
    std::shared_ptr<std::atomic<int>> in_flight_ = std::make_shared<std::atomic<int>>(0);

    void check_allowed(const std::string& tool, const std::string& server,
                       const DispatchContext& ctx) const;
};

} // namespace strata
