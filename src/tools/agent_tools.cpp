#include "agent_tools.hpp"
#include "../cancellation.hpp"

namespace strata {

void register_agent_tools(ToolRegistry& reg, const Config& cfg, LayerExecutor& executor,
                          LayerContextFn context_fn) {
    for (auto& agent : cfg.agents) {
        const LayerConfig* layer = cfg.find_layer(agent.name);
        if (!layer) throw ConfigError("agent '" + agent.name + "' has no layer of the same name");
        LayerConfig lc = *layer;

        ToolDef td;
        td.name = "agent_" + agent.name;
        td.description = agent.description.empty()
                         ? "Delegate a task to the " + agent.name + " agent."
                         : agent.description;
        td.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "task": {"type": "string", "description": "What the agent should do"}
            },
            "required": ["task"]
        })JSON");

        td.func = [lc, &executor, context_fn](const nlohmann::json& args,
                                              const CancellationToken& token) -> std::string {
            std::string task = args.value("task", "");
            if (task.empty()) throw Error("task is required");
            token.throw_if_cancelled();

            // The token is cancelled when the dispatcher abandons this call
            auto result = executor.run(lc, task, {}, context_fn(), token);
            return result.output;
        };
        reg.register_tool(std::move(td));
    }
}

} // namespace strata
