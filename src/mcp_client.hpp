#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "tool_registry.hpp"
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <nlohmann/json.hpp>

namespace strata {

struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json parameters;
    std::string server;

    // OpenAI function-tool shape sent to providers.
    nlohmann::json to_json() const {
        return {
            {"type", "function"},
            {"function", {
                {"name", name},
                {"description", description},
                {"parameters", parameters}
            }}
        };
    }
};

struct ToolResult {
    std::string tool;
    std::string server;
    std::string content;
    bool is_error = false;
    bool truncated = false;
    int tokens = 0;
    std::string warning;    // set when the result crossed the warning threshold
};

// Joins the text items of an MCP tools/call result.
std::string extract_mcp_content(const nlohmann::json& result);

// Builds a ToolResult from a tools/call result object.
ToolResult tool_result_from_mcp(const std::string& tool, const std::string& server,
                                const nlohmann::json& result);

nlohmann::json make_jsonrpc_request(int id, const std::string& method, const nlohmann::json& params);

// One live connection to a tool server, whatever the transport.
class McpConnection {
public:
    explicit McpConnection(ToolServerConfig cfg) : config_(std::move(cfg)) {}
    virtual ~McpConnection() = default;

    McpConnection(const McpConnection&) = delete;
    McpConnection& operator=(const McpConnection&) = delete;

    // Throws ServerUnavailable when the server cannot be reached or initialized.
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool alive() const = 0;
    virtual std::vector<ToolSchema> list_tools() = 0;
    // Builtin tables observe the token; remote servers are bounded by their timeout.
    virtual ToolResult call_tool(const std::string& tool, const nlohmann::json& args,
                                 const CancellationToken& token) = 0;

    const std::string& name() const { return config_.name; }
    const ToolServerConfig& config() const { return config_; }

protected:
    ToolServerConfig config_;
};

// In-process server backed by a function table.
class BuiltinConnection : public McpConnection {
public:
    BuiltinConnection(ToolServerConfig cfg, std::shared_ptr<const ToolRegistry> table)
        : McpConnection(std::move(cfg)), table_(std::move(table)) {}

    void start() override { running_ = true; }
    void stop() override { running_ = false; }
    bool alive() const override { return running_; }

    std::vector<ToolSchema> list_tools() override {
        std::vector<ToolSchema> out;
        for (auto* def : table_->defs()) {
            out.push_back(ToolSchema{def->name, def->description, def->parameters, name()});
        }
        return out;
    }

    ToolResult call_tool(const std::string& tool, const nlohmann::json& args,
                         const CancellationToken& token) override {
        ToolResult r;
        r.tool = tool;
        r.server = name();
        try {
            r.content = table_->execute(tool, args, token);
        } catch (const CancelledError&) {
            throw;
        } catch (const ToolNotFound&) {
            throw;
        } catch (const std::exception& e) {
            r.content = std::string("[error] ") + e.what();
            r.is_error = true;
        }
        return r;
    }

private:
    std::shared_ptr<const ToolRegistry> table_;
    std::atomic<bool> running_{false};
};

} // namespace strata
