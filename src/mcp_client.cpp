#include "mcp_client.hpp"

namespace strata {

std::string extract_mcp_content(const nlohmann::json& result) {
    if (result.contains("content") && result["content"].is_array()) {
        std::string output;
        for (auto& item : result["content"]) {
            if (item.value("type", "") == "text") {
                if (!output.empty()) output += "\n";
                output += item.value("text", "");
            }
        }
        return output.empty() ? result.dump() : output;
    }
    return result.dump();
}

ToolResult tool_result_from_mcp(const std::string& tool, const std::string& server,
                                const nlohmann::json& result) {
    ToolResult r;
    r.tool = tool;
    r.server = server;
    if (result.is_null()) {
        r.content = "[error] MCP tool call returned null";
        r.is_error = true;
        return r;
    }
    if (result.contains("error")) {
        auto& err = result["error"];
        r.content = "[error] MCP: " + (err.is_object() ? err.value("message", err.dump()) : err.dump());
        r.is_error = true;
        return r;
    }
    r.content = extract_mcp_content(result);
    r.is_error = result.value("isError", false);
    return r;
}

nlohmann::json make_jsonrpc_request(int id, const std::string& method, const nlohmann::json& params) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null() && !params.empty()) {
        req["params"] = params;
    }
    return req;
}

} // namespace strata
