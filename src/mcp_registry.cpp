#include "mcp_registry.hpp"
#include "mcp_http.hpp"
#include "mcp_stdio.hpp"
#include "patterns.hpp"
#include "utils.hpp"
#include <iostream>

namespace strata {

const char* to_string(ServerHealth h) {
    switch (h) {
    case ServerHealth::starting: return "starting";
    case ServerHealth::healthy:  return "healthy";
    case ServerHealth::degraded: return "degraded";
    default:                     return "dead";
    }
}

ToolServerRegistry::ToolServerRegistry(const Config& cfg)
    : start_retries_(cfg.server_start_retries),
      health_interval_(cfg.health_check_interval_seconds) {}

ToolServerRegistry::~ToolServerRegistry() {
    stop_health_monitor();
    shutdown_all();
}

void ToolServerRegistry::register_builtin(const std::string& name,
                                          std::shared_ptr<const ToolRegistry> table) {
    std::lock_guard<std::mutex> lock(mutex_);
    builtins_[name] = std::move(table);
}

void ToolServerRegistry::register_server(const ToolServerConfig& cfg) {
    cfg.validate();
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(cfg.name)) {
        throw ConfigError("duplicate server name '" + cfg.name + "'");
    }

    Entry e;
    e.config = cfg;
    if (cfg.kind == TransportKind::builtin) {
        auto it = builtins_.find(cfg.name);
        if (it == builtins_.end()) {
            throw ConfigError("no builtin server named '" + cfg.name + "'");
        }
        // Builtin catalogs are known without starting anything
        std::vector<ToolSchema> tools;
        for (auto* def : it->second->defs()) {
            tools.push_back(ToolSchema{def->name, def->description, def->parameters, cfg.name});
        }
        e.catalog = filter_catalog(cfg, std::move(tools));
        e.catalog_loaded = true;
    }
    entries_.emplace(cfg.name, std::move(e));
    order_.push_back(cfg.name);
    rebuild_tool_map_locked();
}

void ToolServerRegistry::set_connection_factory(ConnectionFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factory_ = std::move(factory);
}

std::shared_ptr<McpConnection> ToolServerRegistry::make_connection(const ToolServerConfig& cfg) const {
    if (factory_) return factory_(cfg);
    switch (cfg.kind) {
    case TransportKind::stdio:
        return std::make_shared<McpStdioConnection>(cfg);
    case TransportKind::http:
        return std::make_shared<McpHttpConnection>(cfg);
    default: {
        auto it = builtins_.find(cfg.name);
        if (it == builtins_.end()) throw ServerUnavailable(cfg.name, "no builtin table");
        return std::make_shared<BuiltinConnection>(cfg, it->second);
    }
    }
}

std::vector<ToolSchema> ToolServerRegistry::filter_catalog(const ToolServerConfig& cfg,
                                                           std::vector<ToolSchema> tools) const {
    if (cfg.tools.empty()) return tools;
    std::vector<ToolSchema> out;
    for (auto& t : tools) {
        for (auto& p : cfg.tools) {
            if (glob_match(p, t.name)) { out.push_back(std::move(t)); break; }
        }
    }
    return out;
}

std::vector<ToolSchema> ToolServerRegistry::effective_catalog(const Entry& e) const {
    if (e.catalog_loaded) return e.catalog;
    // Not started yet: fall back to the exact names the config declares
    std::vector<ToolSchema> out;
    for (auto& p : e.config.tools) {
        if (!is_exact_pattern(p)) continue;
        out.push_back(ToolSchema{p, "Tool '" + p + "' on server '" + e.config.name + "'",
                                 {{"type", "object"}, {"properties", nlohmann::json::object()}},
                                 e.config.name});
    }
    return out;
}

void ToolServerRegistry::rebuild_tool_map_locked() {
    tool_map_.clear();
    for (auto& name : order_) {
        for (auto& t : effective_catalog(entries_.at(name))) {
            auto [it, inserted] = tool_map_.emplace(t.name, name);
            if (!inserted && log_enabled(LogLevel::debug)) {
                std::cerr << "[mcp] Tool '" << t.name << "' from '" << name
                          << "' shadowed by '" << it->second << "'\n";
            }
        }
    }
}

std::shared_ptr<McpConnection> ToolServerRegistry::acquire(const std::string& name) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw ServerUnavailable(name, "not configured");
    }
    Entry& entry = it->second;

    // Another caller is starting it: wait, then re-check instead of starting twice
    cv_.wait(lock, [&] { return !entry.starting; });
    if (entry.handle && entry.handle->alive()) return entry.handle;

    entry.starting = true;
    entry.status = ServerHealth::starting;
    ToolServerConfig cfg = entry.config;
    std::shared_ptr<McpConnection> old = std::move(entry.handle);
    lock.unlock();

    if (old) old->stop();

    std::shared_ptr<McpConnection> conn;
    std::vector<ToolSchema> catalog;
    std::string last_error;
    for (int attempt = 0; attempt <= start_retries_; attempt++) {
        try {
            {
                std::lock_guard<std::mutex> guard(mutex_);
                conn = make_connection(cfg);
            }
            conn->start();
            catalog = filter_catalog(cfg, conn->list_tools());
            break;
        } catch (const std::exception& e) {
            last_error = e.what();
        }
        if (conn) conn->stop();
        conn.reset();
        if (log_enabled(LogLevel::info)) {
            std::cerr << "[mcp] Start attempt " << (attempt + 1) << " for '" << name
                      << "' failed: " << last_error << "\n";
        }
    }

    lock.lock();
    entry.starting = false;
    if (!conn) {
        entry.status = ServerHealth::dead;
        cv_.notify_all();
        throw ServerUnavailable(name, last_error);
    }
    entry.handle = conn;
    entry.status = ServerHealth::healthy;
    entry.catalog = std::move(catalog);
    entry.catalog_loaded = true;
    rebuild_tool_map_locked();
    cv_.notify_all();
    if (log_enabled(LogLevel::info) && cfg.kind != TransportKind::builtin) {
        std::cerr << "[mcp] Started server '" << name << "' (" << entry.catalog.size() << " tools)\n";
    }
    return conn;
}

ServerHealth ToolServerRegistry::health(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) return ServerHealth::dead;
    return it->second.status;
}

void ToolServerRegistry::mark_degraded(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it != entries_.end() && it->second.status == ServerHealth::healthy)
        it->second.status = ServerHealth::degraded;
}

void ToolServerRegistry::mark_healthy(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it != entries_.end() && it->second.status == ServerHealth::degraded)
        it->second.status = ServerHealth::healthy;
}

void ToolServerRegistry::shutdown(const std::string& name) {
    std::shared_ptr<McpConnection> handle;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) return;
        cv_.wait(lock, [&] { return !it->second.starting; });
        handle = std::move(it->second.handle);
        it->second.status = ServerHealth::dead;
    }
    if (handle) {
        handle->stop();
        if (log_enabled(LogLevel::debug)) {
            std::cerr << "[mcp] Stopped server '" << name << "'\n";
        }
    }
}

void ToolServerRegistry::shutdown_all() {
    for (auto& name : server_names()) shutdown(name);
}

void ToolServerRegistry::initialize() {
    for (auto& name : server_names()) {
        try {
            acquire(name);
        } catch (const ServerUnavailable& e) {
            std::cerr << "[mcp] " << e.what() << " (will retry on first use)\n";
        }
    }
}

std::optional<std::string> ToolServerRegistry::server_for_tool(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tool_map_.find(tool);
    if (it == tool_map_.end()) return std::nullopt;
    return it->second;
}

std::vector<ToolSchema> ToolServerRegistry::tool_schemas() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolSchema> out;
    for (auto& name : order_) {
        for (auto& t : effective_catalog(entries_.at(name))) {
            auto it = tool_map_.find(t.name);
            if (it != tool_map_.end() && it->second == name) out.push_back(t);
        }
    }
    return out;
}

std::vector<std::string> ToolServerRegistry::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

int ToolServerRegistry::restart_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    return it == entries_.end() ? 0 : it->second.restart_count;
}

// ── Health monitor ──

void ToolServerRegistry::check_health() {
    std::vector<std::string> to_restart;
    std::vector<std::shared_ptr<McpConnection>> dead_handles;
    int64_t now = epoch_now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& name : order_) {
            Entry& e = entries_.at(name);
            if (e.config.kind == TransportKind::builtin || e.starting) continue;

            if (e.failed_at > 0 && now - e.failed_at >= kFailedResetSeconds) {
                e.failed_at = 0;
                e.restart_count = 0;
            }
            if (!e.handle) continue;
            if (e.handle->alive()) continue;

            std::cerr << "[mcp] Server '" << name << "' is not running\n";
            dead_handles.push_back(std::move(e.handle));
            e.status = ServerHealth::dead;

            if (e.restart_count >= kMaxRestarts) {
                if (e.failed_at == 0) e.failed_at = now;
                continue;
            }
            if (now - e.last_restart < kRestartCooldownSeconds) continue;
            e.restart_count++;
            e.last_restart = now;
            to_restart.push_back(name);
        }
    }

    for (auto& h : dead_handles) h->stop();

    for (auto& name : to_restart) {
        try {
            acquire(name);
            std::cerr << "[mcp] Restarted server '" << name << "'\n";
        } catch (const ServerUnavailable& e) {
            std::cerr << "[mcp] Restart failed: " << e.what() << "\n";
        }
    }
}

void ToolServerRegistry::start_health_monitor() {
    if (health_interval_ <= 0 || monitor_.joinable()) return;
    monitor_stop_ = false;
    monitor_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(monitor_mutex_);
        while (!monitor_stop_) {
            monitor_cv_.wait_for(lock, std::chrono::seconds(health_interval_),
                                 [this] { return monitor_stop_; });
            if (monitor_stop_) break;
            lock.unlock();
            check_health();
            lock.lock();
        }
    });
}

void ToolServerRegistry::stop_health_monitor() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_ = true;
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable()) monitor_.join();
}

} // namespace strata
