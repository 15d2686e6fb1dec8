#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "commands.hpp"
#include "config.hpp"
#include "cost_tracker.hpp"
#include "layer.hpp"
#include "mcp_registry.hpp"
#include "orchestrator.hpp"
#include "provider_router.hpp"
#include "session_engine.hpp"
#include "session_store.hpp"
#include "tool_dispatcher.hpp"
#include "tools/agent_tools.hpp"
#include "tools/developer_tools.hpp"
#include "tools/filesystem_tools.hpp"
#include "tools/web_tools.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void on_sigint(int) {
    g_interrupted = true;
}

void install_sigint_handler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_sigint;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
}

void print_usage() {
    std::cout << "Usage: strata [options]\n\n"
              << "Options:\n"
              << "  --config PATH       Config file (default ~/.strata/config.json)\n"
              << "  --role NAME         Role to start with\n"
              << "  --model ID          Model as provider:model\n"
              << "  --resume ID         Continue a saved session\n"
              << "  --sessions          List saved sessions\n"
              << "  -m, --message MSG   Send one message and exit\n"
              << "  --init              Write the default config and exit\n";
}

bool ask_yes_no(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace strata;

    std::string config_path = default_config_path();
    std::string role_name;
    std::string model_override;
    std::string resume_id;
    std::string message;
    bool list_sessions = false;
    bool init = false;

    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else if (args[i] == "--role" && i + 1 < args.size()) {
            role_name = args[++i];
        } else if (args[i] == "--model" && i + 1 < args.size()) {
            model_override = args[++i];
        } else if (args[i] == "--resume" && i + 1 < args.size()) {
            resume_id = args[++i];
        } else if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
            message = args[++i];
        } else if (args[i] == "--sessions") {
            list_sessions = true;
        } else if (args[i] == "--init") {
            init = true;
        } else if (args[i] == "-h" || args[i] == "--help") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << args[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (init) {
        try {
            Config::make_default().save(expand_path(config_path));
            std::cout << "Wrote " << config_path << "\n";
            return 0;
        } catch (const std::exception& e) {
            std::cerr << "[config] " << e.what() << "\n";
            return 1;
        }
    }

    Config cfg;
    try {
        cfg = Config::load(expand_path(config_path));
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }
    set_log_level(parse_log_level(cfg.log_level));

    SessionStore store(cfg.sessions_path());
    if (list_sessions) {
        for (auto& id : store.list()) std::cout << id << "\n";
        return 0;
    }

    std::string cwd = fs::current_path().string();

    CostTracker costs;
    ToolServerRegistry registry(cfg);
    ToolDispatcher dispatcher(cfg, registry, costs);
    ProviderRouter router(cfg);
    LayerExecutor executor(cfg, router, dispatcher, costs);
    LayerOrchestrator orchestrator(executor);
    SessionEngine engine(cfg, router, dispatcher, orchestrator, costs, std::cout);
    engine.set_confirm(ask_yes_no);

    try {
        auto developer = std::make_shared<ToolRegistry>();
        register_developer_tools(*developer, cwd);
        auto filesystem = std::make_shared<ToolRegistry>();
        register_filesystem_tools(*filesystem, cwd);
        auto web = std::make_shared<ToolRegistry>();
        register_web_tools(*web, cwd);
        auto agent = std::make_shared<ToolRegistry>();
        register_agent_tools(*agent, cfg, executor, [&engine, cwd]() {
            LayerRunContext ctx;
            ctx.session_id = engine.session_id();
            ctx.role_name = engine.role().name;
            if (engine.context().system()) ctx.role_system = engine.context().system()->content;
            ctx.session_model = engine.model();
            ctx.cwd = cwd;
            return ctx;
        });

        registry.register_builtin("developer", developer);
        registry.register_builtin("filesystem", filesystem);
        registry.register_builtin("web", web);
        registry.register_builtin("agent", agent);
        for (auto& s : cfg.servers) registry.register_server(s);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << "\n";
        return 1;
    }

    registry.initialize();
    registry.start_health_monitor();

    try {
        if (!resume_id.empty()) {
            engine.resume(store.load(resume_id), cwd);
        } else {
            engine.start(role_name.empty() ? cfg.default_role : role_name, cwd);
        }
    } catch (const Error& e) {
        std::cerr << "[session] " << e.what() << "\n";
        return 1;
    }
    if (!model_override.empty()) engine.set_model(model_override);

    install_sigint_handler();

    // Abandoned tool calls (agent tools in particular) still reach the objects
    // above, so they must finish before main's locals go away.
    auto finish = [&]() {
        if (!dispatcher.wait_idle(std::chrono::seconds(10))) {
            std::cerr << "[dispatch] " << dispatcher.in_flight()
                      << " tool calls still running at exit\n";
        }
        registry.stop_health_monitor();
        registry.shutdown_all();
    };

    auto autosave = [&]() {
        try {
            engine.save(store);
        } catch (const Error& e) {
            std::cerr << "[session] save failed: " << e.what() << "\n";
        }
    };

    if (!message.empty()) {
        CancellationToken token;
        token.link(&g_interrupted);
        auto outcome = engine.run_turn(message, token);
        if (outcome.status == TurnOutcome::Status::completed) std::cout << outcome.reply << "\n";
        autosave();
        finish();
        return outcome.status == TurnOutcome::Status::completed ? 0 : 1;
    }

    CommandProcessor commands(engine, store, registry, std::cout);
    std::cout << "strata " << engine.session_id() << " (role " << engine.role().name
              << ", model " << engine.model() << "). /help for commands, Ctrl+C cancels a request.\n";

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        g_interrupted = false;
        CancellationToken token;
        token.link(&g_interrupted);

        if (CommandProcessor::is_command(line)) {
            auto r = commands.handle(line, token);
            if (r.exit) break;
            continue;
        }

        auto outcome = engine.run_turn(line, token);
        if (outcome.status == TurnOutcome::Status::completed) {
            std::cout << outcome.reply << "\n";
        }
        autosave();
    }

    autosave();
    finish();
    return 0;
}
