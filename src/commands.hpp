#pragma once
#include "mcp_registry.hpp"
#include "session_engine.hpp"
#include "session_store.hpp"
#include <ostream>
#include <string>

namespace strata {

struct CommandResult {
    bool handled = false;   // false: the line is a prompt for the model
    bool exit = false;
};

// Slash commands. Only /run, /reduce and /done reach a provider.
class CommandProcessor {
public:
    CommandProcessor(SessionEngine& engine, const SessionStore& store,
                     ToolServerRegistry& registry, std::ostream& out)
        : engine_(engine), store_(store), registry_(registry), out_(out) {}

    static bool is_command(const std::string& line) { return !line.empty() && line[0] == '/'; }

    CommandResult handle(const std::string& line, const CancellationToken& token);

private:
    SessionEngine& engine_;
    const SessionStore& store_;
    ToolServerRegistry& registry_;
    std::ostream& out_;

    void help();
    void history(const std::string& arg);
    void cache();
    void info();
    void list();
    void mcp();
};

} // namespace strata
