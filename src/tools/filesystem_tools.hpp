#pragma once
#include "../tool_registry.hpp"
#include <string>

namespace strata {

// "text_editor" (view, create, str_replace, insert) and "list_files".
// Relative paths resolve against workdir.
void register_filesystem_tools(ToolRegistry& reg, const std::string& workdir);

} // namespace strata
