#include "session_engine.hpp"
#include "utils.hpp"
#include <chrono>
#include <iostream>
#include <sstream>

namespace strata {

const char* to_string(SessionState s) {
    switch (s) {
    case SessionState::dispatching:    return "dispatching";
    case SessionState::tool_executing: return "tool_executing";
    case SessionState::cancelling:     return "cancelling";
    default:                           return "idle";
    }
}

SessionEngine::SessionEngine(const Config& cfg, ProviderRouter& router, ToolDispatcher& dispatcher,
                             LayerOrchestrator& orchestrator, CostTracker& costs, std::ostream& out)
    : config_(cfg), router_(router), dispatcher_(dispatcher), orchestrator_(orchestrator),
      costs_(costs), out_(out) {}

LayerRunContext SessionEngine::layer_context() const {
    LayerRunContext ctx;
    ctx.session_id = session_id_;
    ctx.role_name = role_.name;
    ctx.role_system = context_.system() ? context_.system()->content : role_.system;
    ctx.session_model = model_;
    ctx.cwd = cwd_;
    return ctx;
}

DispatchContext SessionEngine::dispatch_context() const {
    DispatchContext ctx;
    ctx.session = session_id_;
    ctx.scope = role_.mcp;
    return ctx;
}

bool SessionEngine::confirm(const std::string& question) {
    if (!confirm_) return false;
    return confirm_(question);
}

void SessionEngine::start(const std::string& role_name, const std::string& cwd) {
    role_ = config_.role(role_name);
    model_ = role_.model.empty() ? config_.model : role_.model;
    cwd_ = cwd;
    session_id_ = generate_session_id();
    created_ = epoch_now();
    layers_armed_ = true;
    context_ = ContextManager();

    std::map<std::string, std::string> vars = {
        {"ROLE", role_.name}, {"CWD", cwd_}, {"DATE", today_str()}, {"SESSION", session_id_},
        {"CONTEXT", ""}
    };
    if (!role_.system.empty()) context_.set_system(render_template(role_.system, vars));

    if (!role_.welcome.empty()) {
        std::string welcome = render_template(role_.welcome, vars);
        context_.append(make_message("assistant", welcome));
        out_ << welcome << "\n";
    }

    if (!config_.custom_instructions_file_name.empty()) {
        fs::path p = fs::path(cwd_) / config_.custom_instructions_file_name;
        std::error_code ec;
        if (fs::is_regular_file(p, ec)) {
            std::string text = read_file(p.string());
            if (!text.empty()) {
                Message m = make_message("user", text);
                m.name = "instructions";
                context_.append(std::move(m));
                if (log_enabled(LogLevel::info)) {
                    std::cerr << "[session] Loaded " << p.string() << "\n";
                }
            }
        }
    }

    if (context_.system() || !context_.empty()) context_.mark_cache_boundary();
    if (log_enabled(LogLevel::info)) {
        std::cerr << "[session] " << session_id_ << " started, role=" << role_.name
                  << " model=" << model_ << "\n";
    }
}

void SessionEngine::resume(StoredSession stored, const std::string& cwd) {
    try {
        role_ = config_.role(stored.info.role);
    } catch (const ConfigError& e) {
        std::cerr << "[session] " << e.what() << ", using role '" << config_.default_role << "'\n";
        role_ = config_.role(config_.default_role);
    }
    session_id_ = stored.info.id;
    created_ = stored.info.created;
    model_ = !stored.info.model.empty() ? stored.info.model
           : (role_.model.empty() ? config_.model : role_.model);
    cwd_ = cwd;
    context_ = std::move(stored.context);
    costs_.restore(session_id_, stored.costs);
    costs_.checkpoint_spending(session_id_);
    layers_armed_ = context_.empty();
    if (log_enabled(LogLevel::info)) {
        std::cerr << "[session] Resumed " << session_id_ << " (" << context_.size()
                  << " messages)\n";
    }
}

void SessionEngine::switch_role(const std::string& name) {
    role_ = config_.role(name);
    model_ = role_.model.empty() ? config_.model : role_.model;
}

SessionInfo SessionEngine::info() const {
    SessionInfo i;
    i.id = session_id_;
    i.role = role_.name;
    i.model = model_;
    i.created = created_;
    i.updated = epoch_now();
    return i;
}

void SessionEngine::save(const SessionStore& store) const {
    store.save(info(), context_, costs_.to_json(session_id_));
}

// Asks once per threshold crossing; the checkpoint re-arms the check.
bool SessionEngine::check_spending() {
    double threshold = config_.max_session_spending_threshold;
    if (!costs_.spending_exceeded(session_id_, threshold)) return true;

    auto total = costs_.session_total(session_id_);
    std::ostringstream q;
    q << "Session spending reached $" << total.cost << " (threshold $" << threshold
      << "). Continue?";
    if (!confirm(q.str())) return false;
    costs_.checkpoint_spending(session_id_);
    return true;
}

std::vector<Message> SessionEngine::run_tools(const std::vector<ToolCall>& calls,
                                              const CancellationToken& token) {
    auto outcomes = dispatcher_.execute_batch(calls, dispatch_context(), token);

    std::vector<Message> results;
    results.reserve(outcomes.size());
    for (auto& o : outcomes) {
        Message m;
        m.role = "tool";
        m.tool_call_id = o.call.id;
        m.name = o.call.name;

        if (!o.error) {
            m.content = o.result.content;
            if (!o.result.warning.empty()) {
                out_ << "[warning] " << o.call.name << ": " << o.result.warning << "\n";
            }
            results.push_back(std::move(m));
            continue;
        }

        try {
            std::rethrow_exception(o.error);
        } catch (const ResponseTooLarge& e) {
            std::ostringstream q;
            q << "Tool '" << e.tool() << "' returned ~" << e.tokens()
              << " tokens, over the response limit. Include it anyway?";
            if (confirm(q.str())) {
                m.content = e.content();
            } else {
                m.content = "User declined to process large output from tool '" + e.tool() +
                            "' (~" + std::to_string(e.tokens()) + " tokens).";
            }
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            // The model sees the failure and can react to it
            m.content = std::string("[error] ") + e.what();
            out_ << "[tool error] " << e.what() << "\n";
        }
        results.push_back(std::move(m));
    }
    return results;
}

TurnOutcome SessionEngine::run_turn(const std::string& input, const CancellationToken& token) {
    TurnOutcome outcome;
    std::vector<Message> snapshot = context_.messages();
    state_ = SessionState::dispatching;

    try {
        std::string request = input;
        if (role_.enable_layers && layers_armed_) {
            auto layers = config_.role_layers(role_);
            if (!layers.empty()) {
                auto fr = orchestrator_.run_chain(layers, context_, input, layer_context(), token);
                layers_armed_ = false;
                if (fr.degraded) {
                    outcome.degraded = true;
                    out_ << "[layers] " << fr.error << "; continuing with the original request\n";
                }
                request = fr.text;
            }
        }

        context_.append(make_message("user", request));

        for (int round = 0;; round++) {
            context_.maybe_truncate(config_.max_request_tokens_threshold);
            context_.maybe_mark_cache_boundary(config_.cache_tokens_threshold,
                                               config_.cache_timeout_seconds);
            if (!check_spending()) {
                context_.replace_all(std::move(snapshot));
                state_ = SessionState::idle;
                outcome.status = TurnOutcome::Status::declined;
                out_ << "[session] Request cancelled: spending threshold reached\n";
                return outcome;
            }

            ProviderRequest req;
            req.messages = context_.request_messages();
            req.tools = dispatcher_.tools_for(dispatch_context());
            req.model = model_;
            req.temperature = role_.temperature;
            req.max_tokens = config_.max_tokens;
            req.cache_tools = context_.tools_cached();

            state_ = SessionState::dispatching;
            auto t0 = std::chrono::steady_clock::now();
            auto resp = router_.send(std::move(req), token);
            int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - t0).count();
            costs_.record_provider(session_id_, "", resp.usage, resp.cost, ms);

            Message assistant = make_message("assistant", resp.content);
            if (!resp.has_tool_calls()) {
                context_.append(std::move(assistant));
                outcome.reply = resp.content;
                break;
            }
            if (config_.max_tool_rounds > 0 && round >= config_.max_tool_rounds) {
                out_ << "[session] Tool round limit reached (" << config_.max_tool_rounds << ")\n";
                context_.append(std::move(assistant));
                outcome.reply = resp.content;
                break;
            }

            state_ = SessionState::tool_executing;
            assistant.tool_calls = resp.tool_calls;
            auto results = run_tools(resp.tool_calls, token);

            // The call and all of its results land together
            context_.append(std::move(assistant));
            for (auto& m : results) context_.append(std::move(m));
            outcome.tool_rounds++;
        }
    } catch (const CancelledError&) {
        state_ = SessionState::cancelling;
        context_.replace_all(std::move(snapshot));
        context_.prune_orphans();
        state_ = SessionState::idle;
        outcome.status = TurnOutcome::Status::cancelled;
        out_ << "[session] Cancelled\n";
        return outcome;
    } catch (const ProviderError& e) {
        context_.replace_all(std::move(snapshot));
        state_ = SessionState::idle;
        outcome.status = TurnOutcome::Status::failed;
        outcome.error = e.what();
        out_ << "[error] provider " << e.provider() << " (" << to_string(e.kind()) << "): "
             << e.what() << "\n";
        return outcome;
    } catch (const std::exception& e) {
        context_.replace_all(std::move(snapshot));
        state_ = SessionState::idle;
        outcome.status = TurnOutcome::Status::failed;
        outcome.error = e.what();
        out_ << "[error] " << e.what() << "\n";
        return outcome;
    }

    state_ = SessionState::idle;
    return outcome;
}

LayerConfig SessionEngine::summary_layer() const {
    if (auto* cmd = config_.find_command("reduce")) return cmd->layer;

    LayerConfig l;
    l.name = "reduce";
    l.input_mode = InputMode::all;
    l.output_mode = OutputMode::replace;
    l.system_prompt =
        "Summarize the conversation so the work can continue from the summary alone. "
        "Keep decisions, file names, open problems and the current task.";
    return l;
}

void SessionEngine::reduce(const CancellationToken& token) {
    LayerConfig layer = summary_layer();
    auto ctx = layer_context();
    context_.reduce([&](const std::vector<Message>& msgs) {
        return orchestrator_.run_single(layer, msgs, "Summarize the conversation above.", ctx, token).output;
    });
}

std::string SessionEngine::run_command(const std::string& name, const std::string& args,
                                       const CancellationToken& token) {
    const CommandConfig* cmd = config_.find_command(name);
    if (!cmd) throw Error("unknown command '" + name + "' (see /list)");

    std::string input = args;
    if (input.empty()) {
        auto& msgs = context_.messages();
        for (auto it = msgs.rbegin(); it != msgs.rend(); ++it) {
            if (it->role == "user") { input = it->content; break; }
        }
    }

    auto result = orchestrator_.run_single(cmd->layer, context_.messages(), input,
                                           layer_context(), token);
    if (cmd->style == CommandStyle::command) return result.output;

    Message m = make_message("assistant", result.output);
    m.name = cmd->layer.name;
    switch (cmd->layer.output_mode) {
    case OutputMode::append:
        context_.append(std::move(m));
        break;
    case OutputMode::replace: {
        std::vector<Message> msgs;
        msgs.push_back(std::move(m));
        context_.replace_all(std::move(msgs));
        break;
    }
    case OutputMode::none:
        break;
    }
    return result.output;
}

} // namespace strata
