#include "commands.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iomanip>

namespace strata {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string preview(const std::string& text, size_t cps) {
    std::string one_line = text;
    std::replace(one_line.begin(), one_line.end(), '\n', ' ');
    if (utf8_length(one_line) <= cps) return one_line;
    return utf8_head(one_line, cps) + "...";
}

CommandResult CommandProcessor::handle(const std::string& line, const CancellationToken& token) {
    CommandResult r;
    if (!is_command(line)) return r;
    r.handled = true;

    std::string body = trim(line.substr(1));
    size_t sp = body.find(' ');
    std::string cmd = body.substr(0, sp);
    std::string arg = sp == std::string::npos ? "" : trim(body.substr(sp + 1));

    try {
        if (cmd == "exit" || cmd == "quit") {
            r.exit = true;
        } else if (cmd == "help") {
            help();
        } else if (cmd == "history") {
            history(arg);
        } else if (cmd == "cache") {
            cache();
        } else if (cmd == "info") {
            info();
        } else if (cmd == "role") {
            if (arg.empty()) {
                out_ << "Role: " << engine_.role().name << "\n";
            } else {
                engine_.switch_role(arg);
                out_ << "Switched to role '" << arg << "' (model " << engine_.model() << ")\n";
            }
        } else if (cmd == "model") {
            if (arg.empty()) {
                out_ << "Model: " << engine_.model() << "\n";
            } else {
                engine_.set_model(arg);
                out_ << "Model set to: " << arg << "\n";
            }
        } else if (cmd == "run") {
            if (arg.empty()) {
                out_ << "Usage: /run <command> [args]\n";
            } else {
                size_t s = arg.find(' ');
                std::string name = arg.substr(0, s);
                std::string rest = s == std::string::npos ? "" : trim(arg.substr(s + 1));
                out_ << engine_.run_command(name, rest, token) << "\n";
            }
        } else if (cmd == "list") {
            list();
        } else if (cmd == "mcp") {
            mcp();
        } else if (cmd == "reduce" || cmd == "done") {
            int before = engine_.context().estimate();
            engine_.reduce(token);
            out_ << "Reduced ~" << before << " -> ~" << engine_.context().estimate() << " tokens\n";
            if (cmd == "done") {
                engine_.rearm_layers();
                out_ << "Task done; layers run again on the next message.\n";
            }
        } else if (cmd == "truncate") {
            int limit = engine_.config().max_request_tokens_threshold;
            if (limit <= 0) {
                out_ << "Truncation is disabled (max_request_tokens_threshold = 0)\n";
            } else if (engine_.context().maybe_truncate(limit)) {
                engine_.context().prune_orphans();
                out_ << "Truncated to ~" << engine_.context().estimate() << " tokens\n";
            } else {
                out_ << "Nothing to truncate (~" << engine_.context().estimate() << " tokens)\n";
            }
        } else if (cmd == "save") {
            engine_.save(store_);
            out_ << "Saved to " << store_.path_for(engine_.session_id()) << "\n";
        } else {
            out_ << "Unknown command: /" << cmd << " (try /help)\n";
        }
    } catch (const CancelledError&) {
        out_ << "[session] Cancelled\n";
    } catch (const Error& e) {
        out_ << "[error] " << e.what() << "\n";
    }
    return r;
}

void CommandProcessor::help() {
    out_ << "Commands:\n"
         << "  /help               Show this help\n"
         << "  /exit, /quit        Leave the session\n"
         << "  /history [n]        Show the last n messages (default 10)\n"
         << "  /cache              Move the cache boundary and show cache state\n"
         << "  /info               Token usage and cost breakdown\n"
         << "  /role [name]        Show or switch the role\n"
         << "  /model [id]         Show or switch the model (provider:model)\n"
         << "  /run <cmd> [args]   Run a custom command\n"
         << "  /list               List custom commands\n"
         << "  /mcp                Tool servers and their health\n"
         << "  /reduce             Replace the transcript with a summary\n"
         << "  /done               Reduce and run the layers again on the next message\n"
         << "  /truncate           Truncate the transcript to the request limit now\n"
         << "  /save               Write the session to disk\n";
}

void CommandProcessor::history(const std::string& arg) {
    size_t n = 10;
    if (!arg.empty()) {
        try {
            n = static_cast<size_t>(std::max(1, std::stoi(arg)));
        } catch (const std::exception&) {
            out_ << "Usage: /history [n]\n";
            return;
        }
    }
    auto& msgs = engine_.context().messages();
    size_t start = msgs.size() > n ? msgs.size() - n : 0;
    for (size_t i = start; i < msgs.size(); i++) {
        auto& m = msgs[i];
        out_ << std::setw(4) << i << " " << m.role;
        if (!m.name.empty()) out_ << ":" << m.name;
        if (m.cached) out_ << " [cached]";
        out_ << " (~" << m.tokens << " tok) " << preview(m.content, 80);
        for (auto& tc : m.tool_calls) out_ << " <" << tc.name << ">";
        out_ << "\n";
    }
    if (msgs.empty()) out_ << "(empty)\n";
}

void CommandProcessor::cache() {
    auto& ctx = engine_.context();
    ctx.mark_cache_boundary();
    auto ci = ctx.cache_info();
    out_ << "Cache markers : " << ci.markers << "\n"
         << "Cached tokens : ~" << ci.cached_tokens << "\n"
         << "Uncached      : ~" << ci.uncached_tokens << "\n"
         << "Tools cached  : " << (ctx.tools_cached() ? "yes" : "no") << "\n";
}

void CommandProcessor::info() {
    auto& ctx = engine_.context();
    out_ << "Session  : " << engine_.session_id() << "\n"
         << "Role     : " << engine_.role().name << "\n"
         << "Model    : " << engine_.model() << "\n"
         << "Messages : " << ctx.size() << " (~" << ctx.estimate() << " tokens)\n"
         << engine_.costs().report(engine_.session_id());
}

void CommandProcessor::list() {
    auto& cmds = engine_.config().commands;
    if (cmds.empty()) {
        out_ << "No custom commands configured.\n";
        return;
    }
    for (auto& c : cmds) {
        out_ << "  " << c.layer.name
             << (c.style == CommandStyle::layer ? " [persisted]" : " [ephemeral]");
        if (!c.description.empty()) out_ << "  " << c.description;
        out_ << "\n";
    }
}

void CommandProcessor::mcp() {
    for (auto& name : registry_.server_names()) {
        auto* cfg = engine_.config().find_server(name);
        out_ << "  " << name << " (" << (cfg ? to_string(cfg->kind) : "?") << ") "
             << to_string(registry_.health(name));
        int restarts = registry_.restart_count(name);
        if (restarts > 0) out_ << ", " << restarts << " restarts";
        out_ << "\n";
    }
    for (auto& t : registry_.tool_schemas()) {
        out_ << "    " << t.server << ":" << t.name << "\n";
    }
}

} // namespace strata
