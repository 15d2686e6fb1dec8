#pragma once
#include "mcp_client.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>

namespace strata {

struct ChildProcess {
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
};

// Starts cfg.command in its own session with SIGINT ignored, so terminal
// interrupts never reach it. With capture_stdio the child's stdin/stdout are
// pipes back to us; otherwise they go to /dev/null.
ChildProcess spawn_child(const ToolServerConfig& cfg, bool capture_stdio);

// SIGTERM, wait up to grace_seconds, then SIGKILL. Closes the pipes.
void terminate_child(ChildProcess& child, int grace_seconds);

// Non-blocking; reaps the child when it has exited.
bool child_running(pid_t pid);

// MCP over newline-delimited JSON-RPC on a subprocess's stdin/stdout.
class McpStdioConnection : public McpConnection {
public:
    explicit McpStdioConnection(ToolServerConfig cfg);
    ~McpStdioConnection() override;

    void start() override;
    void stop() override;
    bool alive() const override;
    std::vector<ToolSchema> list_tools() override;
    ToolResult call_tool(const std::string& tool, const nlohmann::json& args,
                         const CancellationToken& token) override;

    pid_t pid() const { return child_.pid; }

private:
    std::mutex io_mutex_;            // one request/response exchange at a time
    mutable std::mutex state_mutex_; // guards child_ lifecycle
    ChildProcess child_;
    std::atomic<bool> connected_{false};
    mutable std::atomic<bool> exited_{false};
    int next_id_ = 1;
    std::string read_buffer_;

    // Returns nullopt when no response arrived before the timeout.
    std::optional<nlohmann::json> send_request(const std::string& method,
                                               const nlohmann::json& params,
                                               std::chrono::milliseconds timeout);
    void send_notification(const std::string& method, const nlohmann::json& params = {});
    bool read_line(std::string& line, std::chrono::steady_clock::time_point deadline);
    void write_line(const std::string& json_str);
};

} // namespace strata
