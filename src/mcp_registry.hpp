#pragma once
#include "config.hpp"
#include "mcp_client.hpp"
#include "tool_registry.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace strata {

enum class ServerHealth { starting, healthy, degraded, dead };

const char* to_string(ServerHealth h);

using ConnectionFactory =
    std::function<std::shared_ptr<McpConnection>(const ToolServerConfig&)>;

// Sole owner of tool-server handles. One entry per configured server name;
// handles are started lazily by acquire() or eagerly by initialize().
class ToolServerRegistry {
public:
    static constexpr int kMaxRestarts = 3;
    static constexpr int kRestartCooldownSeconds = 30;
    static constexpr int kFailedResetSeconds = 300;

    explicit ToolServerRegistry(const Config& cfg);
    ~ToolServerRegistry();

    ToolServerRegistry(const ToolServerRegistry&) = delete;
    ToolServerRegistry& operator=(const ToolServerRegistry&) = delete;

    // Function table for a builtin server; must precede register_server for it.
    void register_builtin(const std::string& name, std::shared_ptr<const ToolRegistry> table);

    // Throws ConfigError on duplicates or malformed transport parameters.
    void register_server(const ToolServerConfig& cfg);

    // Replaces how connections are made (tests use in-process fakes).
    void set_connection_factory(ConnectionFactory factory);

    // Live handle, starting it if needed. Throws ServerUnavailable after retries.
    std::shared_ptr<McpConnection> acquire(const std::string& name);

    ServerHealth health(const std::string& name) const;
    void mark_degraded(const std::string& name);
    void mark_healthy(const std::string& name);

    void shutdown(const std::string& name);
    void shutdown_all();

    // Starts every registered server; failures are logged and retried on first use.
    void initialize();

    std::optional<std::string> server_for_tool(const std::string& tool) const;
    std::vector<ToolSchema> tool_schemas() const;
    std::vector<std::string> server_names() const;
    int restart_count(const std::string& name) const;

    void start_health_monitor();
    void stop_health_monitor();
    // One monitor pass: reap dead servers and restart within the limits.
    void check_health();

private:
    struct Entry {
        ToolServerConfig config;
        std::shared_ptr<McpConnection> handle;
        ServerHealth status = ServerHealth::dead;
        bool starting = false;
        bool catalog_loaded = false;
        std::vector<ToolSchema> catalog;
        int restart_count = 0;
        int64_t last_restart = 0;
        int64_t failed_at = 0;
    };

    int start_retries_;
    int health_interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> order_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::shared_ptr<const ToolRegistry>> builtins_;
    std::map<std::string, std::string> tool_map_;
    ConnectionFactory factory_;

    std::thread monitor_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool monitor_stop_ = false;

    std::shared_ptr<McpConnection> make_connection(const ToolServerConfig& cfg) const;
    std::vector<ToolSchema> filter_catalog(const ToolServerConfig& cfg,
                                           std::vector<ToolSchema> tools) const;
    std::vector<ToolSchema> effective_catalog(const Entry& e) const;
    void rebuild_tool_map_locked();
};

} // namespace strata
