#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "cost_tracker.hpp"
#include "message.hpp"
#include "provider_router.hpp"
#include "tool_dispatcher.hpp"
#include <map>
#include <string>
#include <vector>

namespace strata {

// Session metadata a layer prompt may reference.
struct LayerRunContext {
    std::string session_id;
    std::string role_name;
    std::string role_system;     // the role's system prompt, %{SYSTEM}
    std::string session_model;   // used when the layer names no model
    std::string cwd;
    std::string layer_context;   // accumulated output of earlier layers, %{CONTEXT}
};

struct LayerResult {
    std::string output;
    Usage usage;
    double cost = 0.0;
    int64_t time_ms = 0;
    int tool_calls = 0;
};

// Replaces %{NAME} with vars[NAME]; unknown names are left as they are.
std::string render_template(const std::string& tmpl, const std::map<std::string, std::string>& vars);

// "last": the request alone. "all": the transcript, then the request.
std::string build_layer_input(InputMode mode, const std::string& request,
                              const std::vector<Message>& transcript);

// Runs one layer: a provider call with the layer's own prompt and model, plus
// tool rounds restricted to the layer's scope. One executor serves every layer.
class LayerExecutor {
public:
    LayerExecutor(const Config& cfg, ProviderRouter& router, ToolDispatcher& dispatcher,
                  CostTracker& costs);

    // Throws ProviderError, ToolNotAllowed and friends, or CancelledError.
    LayerResult run(const LayerConfig& layer, const std::string& input,
                    const std::vector<Message>& transcript, const LayerRunContext& ctx,
                    const CancellationToken& token);

private:
    const Config& config_;
    ProviderRouter& router_;
    ToolDispatcher& dispatcher_;
    CostTracker& costs_;
};

} // namespace strata
