#pragma once
#include "../tool_registry.hpp"
#include <string>

namespace strata {

// "shell": runs a command with sh in the session's working directory.
void register_developer_tools(ToolRegistry& reg, const std::string& workdir);

// Destructive commands the shell tool refuses to run.
bool is_dangerous_command(const std::string& cmd);

} // namespace strata
