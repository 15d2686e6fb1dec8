#pragma once
#include "mcp_client.hpp"
#include "mcp_stdio.hpp"
#include <atomic>
#include <mutex>
#include <optional>

namespace strata {

// MCP over HTTP POST (JSON or SSE-framed responses). With a command in the
// config the server is launched locally first; otherwise it is remote and
// always considered alive.
class McpHttpConnection : public McpConnection {
public:
    explicit McpHttpConnection(ToolServerConfig cfg);
    ~McpHttpConnection() override;

    void start() override;
    void stop() override;
    bool alive() const override;
    std::vector<ToolSchema> list_tools() override;
    ToolResult call_tool(const std::string& tool, const nlohmann::json& args,
                         const CancellationToken& token) override;

    bool is_local() const { return !config_.command.empty(); }

private:
    UrlParts url_;
    mutable std::mutex mutex_;  // guards session_id_ and child_
    ChildProcess child_;
    std::string session_id_;
    std::atomic<int> next_id_{1};
    std::atomic<bool> connected_{false};

    nlohmann::json request(const std::string& method, const nlohmann::json& params);
    void notify(const std::string& method);
    std::optional<nlohmann::json> post(const nlohmann::json& body, int id);
};

// Pulls the JSON-RPC message with the given id out of an SSE or plain JSON body.
std::optional<nlohmann::json> parse_rpc_body(const std::string& body, int id);

} // namespace strata
