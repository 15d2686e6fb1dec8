#pragma once
#include "../tool_registry.hpp"
#include <string>

namespace strata {

struct WebToolsOptions {
    std::string search_url = "https://api.search.brave.com/res/v1/web/search";
    std::string api_key_env = "BRAVE_API_KEY";
    int timeout_seconds = 30;
};

// "read_html" (web pages or local HTML files as Markdown) and "web_search"
// (Brave Search, key read from the environment on every call).
void register_web_tools(ToolRegistry& reg, const std::string& workdir,
                        const WebToolsOptions& opts = WebToolsOptions());

std::string html_to_markdown(const std::string& html);

// One "[rank] title | url | description" line per web result.
std::string format_search_results(const nlohmann::json& response, const std::string& query);

} // namespace strata
