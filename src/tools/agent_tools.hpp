#pragma once
#include "../config.hpp"
#include "../layer.hpp"
#include "../tool_registry.hpp"
#include <functional>

namespace strata {

// Supplies the session metadata at call time.
using LayerContextFn = std::function<LayerRunContext()>;

// One "agent_<name>" tool per configured agent. Each runs the layer of the
// same name on the given task and returns its output. The executor and
// whatever context_fn reads must outlive the dispatcher's in-flight calls.
void register_agent_tools(ToolRegistry& reg, const Config& cfg, LayerExecutor& executor,
                          LayerContextFn context_fn);

} // namespace strata
