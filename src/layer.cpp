#include "layer.hpp"
#include "utils.hpp"
#include <chrono>
#include <iostream>

namespace strata {

std::string render_template(const std::string& tmpl, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t start = tmpl.find("%{", pos);
        if (start == std::string::npos) break;
        size_t end = tmpl.find('}', start + 2);
        if (end == std::string::npos) break;

        out.append(tmpl, pos, start - pos);
        std::string key = tmpl.substr(start + 2, end - start - 2);
        auto it = vars.find(key);
        if (it != vars.end()) {
            out += it->second;
        } else {
            out.append(tmpl, start, end - start + 1);
        }
        pos = end + 1;
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

std::string build_layer_input(InputMode mode, const std::string& request,
                              const std::vector<Message>& transcript) {
    if (mode == InputMode::last || transcript.empty()) return request;

    std::string out = "Conversation so far:\n\n";
    for (auto& m : transcript) {
        out += "[" + m.role + (m.name.empty() ? "" : ":" + m.name) + "] ";
        out += m.content;
        for (auto& tc : m.tool_calls) {
            out += "\n(called " + tc.name + " " + tc.arguments + ")";
        }
        out += "\n\n";
    }
    out += "Current request:\n" + request;
    return out;
}

LayerExecutor::LayerExecutor(const Config& cfg, ProviderRouter& router,
                             ToolDispatcher& dispatcher, CostTracker& costs)
    : config_(cfg), router_(router), dispatcher_(dispatcher), costs_(costs) {}

LayerResult LayerExecutor::run(const LayerConfig& layer, const std::string& input,
                               const std::vector<Message>& transcript,
                               const LayerRunContext& ctx, const CancellationToken& token) {
    auto started = std::chrono::steady_clock::now();
    LayerResult result;

    std::map<std::string, std::string> vars = layer.parameters;
    vars["SYSTEM"] = ctx.role_system;
    vars["CONTEXT"] = ctx.layer_context;
    vars["INPUT"] = input;
    vars["ROLE"] = ctx.role_name;
    vars["CWD"] = ctx.cwd;
    vars["DATE"] = today_str();
    vars["SESSION"] = ctx.session_id;

    DispatchContext dctx;
    dctx.session = ctx.session_id;
    dctx.layer = layer.name;
    dctx.scope = layer.mcp;

    ProviderRequest req;
    req.model = layer.model.empty() ? ctx.session_model : layer.model;
    req.temperature = layer.temperature;
    req.max_tokens = layer.max_tokens > 0 ? layer.max_tokens : config_.max_tokens;
    req.tools = dispatcher_.tools_for(dctx);

    Message sys = make_message("system", render_template(layer.system_prompt, vars));
    sys.cached = true;
    req.messages.push_back(std::move(sys));
    req.messages.push_back(make_message("user", build_layer_input(layer.input_mode, input, transcript)));

    if (log_enabled(LogLevel::info)) {
        std::cerr << "[layer:" << layer.name << "] model=" << req.model
                  << " tools=" << req.tools.size() << "\n";
    }

    for (int round = 0;; round++) {
        auto t0 = std::chrono::steady_clock::now();
        auto resp = router_.send(req, token);
        int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();

        costs_.record_provider(ctx.session_id, layer.name, resp.usage, resp.cost, ms);
        result.usage.input_tokens += resp.usage.input_tokens;
        result.usage.output_tokens += resp.usage.output_tokens;
        result.usage.cached_tokens += resp.usage.cached_tokens;
        result.cost += resp.cost;

        if (!resp.has_tool_calls() || req.tools.empty()) {
            result.output = resp.content;
            break;
        }
        if (round >= config_.max_tool_rounds) {
            std::cerr << "[layer:" << layer.name << "] tool round limit reached ("
                      << config_.max_tool_rounds << ")\n";
            result.output = resp.content;
            break;
        }

        Message assistant = make_message("assistant", resp.content);
        assistant.tool_calls = resp.tool_calls;
        req.messages.push_back(std::move(assistant));

        // A layer never continues past a failed tool
        auto outcomes = dispatcher_.execute_batch(resp.tool_calls, dctx, token);
        for (auto& o : outcomes) {
            if (o.error) std::rethrow_exception(o.error);
            Message tm = make_message("tool", o.result.content);
            tm.tool_call_id = o.call.id;
            tm.name = o.call.name;
            req.messages.push_back(std::move(tm));
            result.tool_calls++;
        }
    }

    result.time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    if (log_enabled(LogLevel::debug)) {
        std::cerr << "[layer:" << layer.name << "] done in " << result.time_ms << " ms, "
                  << result.tool_calls << " tool calls, $" << result.cost << "\n";
    }
    return result;
}

} // namespace strata
