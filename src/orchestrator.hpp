#pragma once
#include "context_manager.hpp"
#include "layer.hpp"
#include <string>
#include <vector>

namespace strata {

struct FinalRequest {
    std::string text;               // what the main exchange sends as the user message
    bool transcript_modified = false;
    bool degraded = false;          // a layer failed; text is the original request
    std::string error;
    std::vector<std::string> layers_run;
};

// Runs a role's layer chain in declared order and threads each layer's output
// into the transcript or the template context of later layers.
class LayerOrchestrator {
public:
    explicit LayerOrchestrator(LayerExecutor& executor) : executor_(executor) {}

    // Never throws for a failing layer (the result is degraded and the
    // transcript restored). CancelledError propagates after the restore.
    FinalRequest run_chain(const std::vector<LayerConfig>& layers, ContextManager& context,
                           const std::string& request, LayerRunContext ctx,
                           const CancellationToken& token);

    // One layer outside a chain, for /run and agent tools. Throws on failure.
    LayerResult run_single(const LayerConfig& layer, const std::vector<Message>& transcript,
                           const std::string& input, const LayerRunContext& ctx,
                           const CancellationToken& token);

private:
    LayerExecutor& executor_;
};

} // namespace strata
