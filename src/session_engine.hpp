#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "context_manager.hpp"
#include "cost_tracker.hpp"
#include "orchestrator.hpp"
#include "provider_router.hpp"
#include "session_store.hpp"
#include "tool_dispatcher.hpp"
#include <atomic>
#include <functional>
#include <ostream>
#include <string>

namespace strata {

enum class SessionState { idle, dispatching, tool_executing, cancelling };

const char* to_string(SessionState s);

struct TurnOutcome {
    enum class Status { completed, cancelled, failed, declined };
    Status status = Status::completed;
    std::string reply;
    std::string error;
    int tool_rounds = 0;
    bool degraded = false;      // the layer chain failed and the raw input was used
};

// Yes/no prompt for the user; tests script it.
using ConfirmFn = std::function<bool(const std::string& question)>;

// One interactive session: the active role, its transcript and the turn loop.
// A single thread drives it; status lines go to the given stream.
class SessionEngine {
public:
    SessionEngine(const Config& cfg, ProviderRouter& router, ToolDispatcher& dispatcher,
                  LayerOrchestrator& orchestrator, CostTracker& costs, std::ostream& out);

    void set_confirm(ConfirmFn fn) { confirm_ = std::move(fn); }

    // New session: system prompt, welcome message, custom instructions, cache markers.
    // Throws ConfigError for an unknown role.
    void start(const std::string& role_name, const std::string& cwd);
    void resume(StoredSession stored, const std::string& cwd);

    // Never throws for provider or tool failures; the outcome says what happened.
    TurnOutcome run_turn(const std::string& input, const CancellationToken& token);

    // Replaces the transcript with a summary from the "reduce" command layer.
    void reduce(const CancellationToken& token);
    void rearm_layers() { layers_armed_ = true; }
    bool layers_armed() const { return layers_armed_; }

    // Runs a configured /run command. Command style prints only; layer style
    // also applies the layer's output mode to the transcript.
    std::string run_command(const std::string& name, const std::string& args,
                            const CancellationToken& token);

    void switch_role(const std::string& name);
    void set_model(const std::string& model) { model_ = model; }

    SessionInfo info() const;
    void save(const SessionStore& store) const;

    const std::string& session_id() const { return session_id_; }
    const RoleConfig& role() const { return role_; }
    const std::string& model() const { return model_; }
    SessionState state() const { return state_.load(); }
    ContextManager& context() { return context_; }
    const ContextManager& context() const { return context_; }
    const Config& config() const { return config_; }
    CostTracker& costs() { return costs_; }

private:
    const Config& config_;
    ProviderRouter& router_;
    ToolDispatcher& dispatcher_;
    LayerOrchestrator& orchestrator_;
    CostTracker& costs_;
    std::ostream& out_;
    ConfirmFn confirm_;

    std::string session_id_;
    RoleConfig role_;
    std::string model_;
    std::string cwd_;
    int64_t created_ = 0;
    ContextManager context_;
    bool layers_armed_ = true;
    std::atomic<SessionState> state_{SessionState::idle};

    LayerRunContext layer_context() const;
    DispatchContext dispatch_context() const;
    bool confirm(const std::string& question);
    bool check_spending();
    std::vector<Message> run_tools(const std::vector<ToolCall>& calls,
                                   const CancellationToken& token);
    LayerConfig summary_layer() const;
};

} // namespace strata
