#include "orchestrator.hpp"
#include "utils.hpp"
#include <iostream>

namespace strata {

FinalRequest LayerOrchestrator::run_chain(const std::vector<LayerConfig>& layers,
                                          ContextManager& context, const std::string& request,
                                          LayerRunContext ctx, const CancellationToken& token) {
    FinalRequest fr;
    fr.text = request;
    if (layers.empty()) return fr;

    std::vector<Message> snapshot = context.messages();
    std::string current = request;

    try {
        for (auto& layer : layers) {
            token.throw_if_cancelled();
            auto result = executor_.run(layer, current, context.messages(), ctx, token);
            fr.layers_run.push_back(layer.name);

            switch (layer.output_mode) {
            case OutputMode::none:
                if (!result.output.empty()) {
                    ctx.layer_context += "## " + layer.name + "\n" + result.output + "\n\n";
                }
                break;
            case OutputMode::append: {
                Message m = make_message("user", result.output);
                m.name = layer.name;
                context.append(std::move(m));
                fr.transcript_modified = true;
                break;
            }
            case OutputMode::replace:
                context.replace_all({});
                current = result.output;
                fr.transcript_modified = true;
                break;
            }
        }
    } catch (const CancelledError&) {
        context.replace_all(std::move(snapshot));
        throw;
    } catch (const std::exception& e) {
        context.replace_all(std::move(snapshot));
        std::string failed = fr.layers_run.size() < layers.size()
                             ? layers[fr.layers_run.size()].name : "?";
        std::cerr << "[layer:" << failed << "] failed, using the original request: "
                  << e.what() << "\n";
        fr.text = request;
        fr.transcript_modified = false;
        fr.degraded = true;
        fr.error = "layer '" + failed + "': " + e.what();
        return fr;
    }

    fr.text = current;
    return fr;
}

LayerResult LayerOrchestrator::run_single(const LayerConfig& layer,
                                          const std::vector<Message>& transcript,
                                          const std::string& input, const LayerRunContext& ctx,
                                          const CancellationToken& token) {
    auto result = executor_.run(layer, input, transcript, ctx, token);
    if (log_enabled(LogLevel::debug)) {
        std::cerr << "[layer:" << layer.name << "] single run, " << result.output.size()
                  << " chars\n";
    }
    return result;
}

} // namespace strata
