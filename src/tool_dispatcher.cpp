#include "tool_dispatcher.hpp"
#include "patterns.hpp"
#include "tokens.hpp"
#include "utils.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <thread>

namespace strata {

ToolDispatcher::ToolDispatcher(const Config& cfg, ToolServerRegistry& registry, CostTracker& costs)
    : config_(cfg), registry_(registry), costs_(costs) {}

void ToolDispatcher::check_allowed(const std::string& tool, const std::string& server,
                                   const DispatchContext& ctx) const {
    for (auto& p : config_.denied_tools) {
        if (tool_pattern_matches(p, tool, server)) {
            throw ToolNotAllowed(tool, "this configuration (denied)");
        }
    }
    if (!tool_allowed_by_patterns(config_.allowed_tools, tool, server)) {
        throw ToolNotAllowed(tool, "this configuration");
    }
    if (!ctx.scope.enabled()) {
        throw ToolNotAllowed(tool, ctx.describe() + " (no tool servers)");
    }
    if (!tool_allowed_by_patterns(ctx.scope.allowed_tools, tool, server)) {
        throw ToolNotAllowed(tool, ctx.describe());
    }
    if (!server.empty()) {
        auto& refs = ctx.scope.server_refs;
        if (std::find(refs.begin(), refs.end(), server) == refs.end()) {
            throw ToolNotAllowed(tool, ctx.describe() + " (server '" + server + "' not enabled)");
        }
    }
}

void ToolDispatcher::check_allowed(const std::string& tool, const DispatchContext& ctx) const {
    auto server = registry_.server_for_tool(tool);
    check_allowed(tool, server.value_or(""), ctx);
}

bool ToolDispatcher::is_allowed(const std::string& tool, const DispatchContext& ctx) const {
    try {
        check_allowed(tool, ctx);
        return true;
    } catch (const ToolNotAllowed&) {
        return false;
    }
}

std::vector<ToolSchema> ToolDispatcher::tools_for(const DispatchContext& ctx) const {
    std::vector<ToolSchema> out;
    if (!ctx.scope.enabled()) return out;
    for (auto& t : registry_.tool_schemas()) {
        try {
            check_allowed(t.name, t.server, ctx);
            out.push_back(t);
        } catch (const ToolNotAllowed&) {
            continue;
        }
    }
    return out;
}

ToolResult ToolDispatcher::apply_size_policy(ToolResult result) const {
    result.tokens = estimate_tokens(result.content);
    int warn = config_.mcp_response_warning_threshold;
    int limit = config_.mcp_response_truncation_threshold;

    if (limit > 0 && result.tokens > limit) {
        if (!config_.enable_auto_truncation) {
            throw ResponseTooLarge(result.tool, result.server, result.tokens, limit,
                                   std::move(result.content));
        }
        int original = result.tokens;
        result.content = truncate_to_tokens(result.content, limit, true);
        result.tokens = estimate_tokens(result.content);
        result.truncated = true;
        result.warning = "output of ~" + std::to_string(original) + " tokens truncated to ~" +
                         std::to_string(result.tokens);
    } else if (warn > 0 && result.tokens > warn) {
        result.warning = "large output: ~" + std::to_string(result.tokens) + " tokens";
    }

    if (!result.warning.empty()) {
        std::cerr << "[dispatch] " << result.tool << ": " << result.warning << "\n";
    }
    return result;
}

ToolResult ToolDispatcher::execute(const ToolCall& call, const DispatchContext& ctx,
                                   const CancellationToken& token) {
    token.throw_if_cancelled();

    auto server = registry_.server_for_tool(call.name);
    check_allowed(call.name, server.value_or(""), ctx);
    if (!server) throw ToolNotFound(call.name);

    nlohmann::json args = nlohmann::json::object();
    if (!call.arguments.empty()) {
        try {
            args = nlohmann::json::parse(call.arguments);
        } catch (const nlohmann::json::exception& e) {
            ToolResult bad;
            bad.tool = call.name;
            bad.server = *server;
            bad.is_error = true;
            bad.content = std::string("[error] invalid arguments: ") + e.what();
            costs_.record_tool(ctx.session, ctx.layer, call.name, 0, true);
            return bad;
        }
    }

    if (log_enabled(LogLevel::debug)) {
        std::cerr << "[dispatch] " << call.name << " -> " << *server << "\n";
    }

    int64_t started = epoch_ms();
    auto conn = registry_.acquire(*server);
    int timeout = conn->config().timeout_seconds;
    std::string tool = call.name;

    // The worker owns its connection handle, so an abandoned call can finish safely.
    // Its own token is cancelled when the call is abandoned, which stops nested work.
    CancellationToken call_token;
    auto in_flight = in_flight_;
    in_flight->fetch_add(1);
    auto fut = spawn_detached([conn, tool, args, call_token, in_flight]() {
        struct Done {
            std::shared_ptr<std::atomic<int>> n;
            ~Done() { n->fetch_sub(1); }
        } done{in_flight};
        return conn->call_tool(tool, args, call_token);
    });

    switch (wait_cancellable(fut, token, std::chrono::milliseconds(timeout * 1000))) {
    case WaitResult::cancelled:
        call_token.cancel();
        costs_.record_tool(ctx.session, ctx.layer, call.name, epoch_ms() - started, true);
        throw CancelledError();
    case WaitResult::timed_out:
        call_token.cancel();
        costs_.record_tool(ctx.session, ctx.layer, call.name, epoch_ms() - started, true);
        registry_.mark_degraded(*server);
        throw ToolTimeout(call.name, *server, timeout);
    case WaitResult::ready:
        break;
    }

    ToolResult result;
    try {
        result = fut.get();
    } catch (const ToolTimeout&) {
        costs_.record_tool(ctx.session, ctx.layer, call.name, epoch_ms() - started, true);
        registry_.mark_degraded(*server);
        throw;
    } catch (const std::exception&) {
        costs_.record_tool(ctx.session, ctx.layer, call.name, epoch_ms() - started, true);
        throw;
    }
    registry_.mark_healthy(*server);
    costs_.record_tool(ctx.session, ctx.layer, call.name, epoch_ms() - started, result.is_error);
    return apply_size_policy(std::move(result));
}

std::vector<ToolOutcome> ToolDispatcher::execute_batch(const std::vector<ToolCall>& calls,
                                                       const DispatchContext& ctx,
                                                       const CancellationToken& token) {
    token.throw_if_cancelled();

    std::vector<std::future<ToolOutcome>> futures;
    futures.reserve(calls.size());
    for (auto& call : calls) {
        futures.push_back(std::async(std::launch::async, [this, call, &ctx, &token]() {
            ToolOutcome out;
            out.call = call;
            try {
                out.result = execute(call, ctx, token);
            } catch (...) {
                out.error = std::current_exception();
            }
            return out;
        }));
    }

    // Every worker observes the token, so joining here is bounded
    std::vector<ToolOutcome> outcomes;
    outcomes.reserve(calls.size());
    for (auto& f : futures) outcomes.push_back(f.get());

    if (token.cancelled()) throw CancelledError();
    return outcomes;
}

bool ToolDispatcher::wait_idle(std::chrono::milliseconds limit) const {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (in_flight_->load() > 0) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

} // namespace strata
