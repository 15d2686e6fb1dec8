#include "mcp_stdio.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

namespace strata {

ChildProcess spawn_child(const ToolServerConfig& cfg, bool capture_stdio) {
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    ChildProcess child;
    int pipe_stdin[2] = {-1, -1};
    int pipe_stdout[2] = {-1, -1};
    if (capture_stdio) {
        if (pipe(pipe_stdin) != 0) {
            throw ServerUnavailable(cfg.name, "failed to create pipes");
        }
        if (pipe(pipe_stdout) != 0) {
            close(pipe_stdin[0]); close(pipe_stdin[1]);
            throw ServerUnavailable(cfg.name, "failed to create pipes");
        }
    }

    // Build argv before forking
    std::vector<const char*> argv;
    argv.push_back(cfg.command.c_str());
    for (auto& arg : cfg.args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        if (capture_stdio) {
            close(pipe_stdin[0]); close(pipe_stdin[1]);
            close(pipe_stdout[0]); close(pipe_stdout[1]);
        }
        throw ServerUnavailable(cfg.name, std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: own session and no SIGINT, so Ctrl+C in the terminal stays with us
        setsid();
        std::signal(SIGINT, SIG_IGN);
        std::signal(SIGPIPE, SIG_DFL);

        int devnull = open("/dev/null", O_RDWR);
        if (capture_stdio) {
            close(pipe_stdin[1]);
            close(pipe_stdout[0]);
            dup2(pipe_stdin[0], STDIN_FILENO);
            dup2(pipe_stdout[1], STDOUT_FILENO);
            close(pipe_stdin[0]);
            close(pipe_stdout[1]);
        } else if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        for (auto& [k, v] : cfg.env) {
            setenv(k.c_str(), v.c_str(), 1);
        }

        execvp(cfg.command.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    child.pid = pid;
    if (capture_stdio) {
        close(pipe_stdin[0]);
        close(pipe_stdout[1]);
        child.stdin_fd = pipe_stdin[1];
        child.stdout_fd = pipe_stdout[0];
        fcntl(child.stdin_fd, F_SETFD, FD_CLOEXEC);
        fcntl(child.stdout_fd, F_SETFD, FD_CLOEXEC);
    }
    return child;
}

void terminate_child(ChildProcess& child, int grace_seconds) {
    if (child.stdin_fd >= 0) {
        close(child.stdin_fd);
        child.stdin_fd = -1;
    }
    if (child.stdout_fd >= 0) {
        close(child.stdout_fd);
        child.stdout_fd = -1;
    }
    if (child.pid > 0) {
        int status;
        if (waitpid(child.pid, &status, WNOHANG) == 0) {
            kill(child.pid, SIGTERM);
            int polls = grace_seconds * 10;
            bool exited = false;
            for (int i = 0; i < polls; i++) {
                if (waitpid(child.pid, &status, WNOHANG) != 0) { exited = true; break; }
                usleep(100000);
            }
            // Force kill if still running
            if (!exited) {
                kill(child.pid, SIGKILL);
                waitpid(child.pid, &status, 0);
            }
        }
        child.pid = -1;
    }
}

bool child_running(pid_t pid) {
    if (pid <= 0) return false;
    int status;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == 0) return true;
    // ECHILD means someone already reaped it
    return false;
}

McpStdioConnection::McpStdioConnection(ToolServerConfig cfg)
    : McpConnection(std::move(cfg)) {}

McpStdioConnection::~McpStdioConnection() {
    stop();
}

void McpStdioConnection::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (connected_) return;
        child_ = spawn_child(config_, true);
        exited_ = false;
    }

    auto timeout = std::chrono::milliseconds(config_.timeout_seconds * 1000);
    std::optional<nlohmann::json> init;
    try {
        init = send_request("initialize", {
            {"protocolVersion", "2025-06-18"},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", "strata"}, {"version", "1.0"}}}
        }, timeout);
    } catch (const ServerUnavailable&) {
        stop();
        throw;
    }

    if (!init || init->is_null() || init->contains("error")) {
        stop();
        throw ServerUnavailable(name(), "initialize failed");
    }

    send_notification("notifications/initialized");
    connected_ = true;
    if (log_enabled(LogLevel::debug)) {
        std::cerr << "[mcp:" << name() << "] Started pid " << child_.pid << "\n";
    }
}

void McpStdioConnection::stop() {
    connected_ = false;
    // Signal first so a reader blocked on the pipe sees EOF and releases io_mutex_
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (child_.pid > 0 && !exited_) kill(child_.pid, SIGTERM);
    }
    std::lock_guard<std::mutex> io(io_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    terminate_child(child_, config_.timeout_seconds);
    exited_ = true;
    read_buffer_.clear();
}

bool McpStdioConnection::alive() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!connected_ || exited_) return false;
    if (!child_running(child_.pid)) {
        exited_ = true;
        return false;
    }
    return true;
}

bool McpStdioConnection::read_line(std::string& line, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        size_t nl = read_buffer_.find('\n');
        if (nl != std::string::npos) {
            line = read_buffer_.substr(0, nl);
            read_buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return false;

        struct pollfd pfd;
        pfd.fd = child_.stdout_fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, 1000)));
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw ServerUnavailable(name(), std::string("poll failed: ") + std::strerror(errno));
        }
        if (ret == 0) continue;

        char buf[4096];
        ssize_t n = read(child_.stdout_fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            exited_ = true;
            throw ServerUnavailable(name(), "server closed its output");
        }
        read_buffer_.append(buf, static_cast<size_t>(n));
    }
}

void McpStdioConnection::write_line(const std::string& json_str) {
    std::string line = json_str + "\n";
    size_t total = 0;
    while (total < line.size()) {
        ssize_t n = write(child_.stdin_fd, line.c_str() + total, line.size() - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            exited_ = true;
            throw ServerUnavailable(name(), "write to server failed");
        }
        total += static_cast<size_t>(n);
    }
}

std::optional<nlohmann::json> McpStdioConnection::send_request(const std::string& method,
                                                              const nlohmann::json& params,
                                                              std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> io(io_mutex_);
    if (child_.stdin_fd < 0) throw ServerUnavailable(name(), "not running");

    int id = next_id_++;
    write_line(make_jsonrpc_request(id, method, params).dump());

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string line;
    while (read_line(line, deadline)) {
        if (line.empty()) continue;
        nlohmann::json resp;
        try {
            resp = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception&) {
            if (log_enabled(LogLevel::debug))
                std::cerr << "[mcp:" << name() << "] Skipping non-JSON line\n";
            continue;
        }
        // Notifications and late responses to abandoned requests
        if (!resp.contains("id") || !resp["id"].is_number_integer()) continue;
        if (resp["id"].get<int>() != id) continue;
        if (resp.contains("result")) return resp["result"];
        return resp;
    }
    return std::nullopt;
}

void McpStdioConnection::send_notification(const std::string& method, const nlohmann::json& params) {
    nlohmann::json notif = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null() && !params.empty()) {
        notif["params"] = params;
    }
    std::lock_guard<std::mutex> io(io_mutex_);
    write_line(notif.dump());
}

std::vector<ToolSchema> McpStdioConnection::list_tools() {
    std::vector<ToolSchema> tools;
    auto result = send_request("tools/list", nlohmann::json::object(),
                               std::chrono::milliseconds(config_.timeout_seconds * 1000));
    if (!result) throw ServerUnavailable(name(), "tools/list timed out");
    if (result->is_null() || !result->contains("tools")) return tools;

    for (auto& t : (*result)["tools"]) {
        ToolSchema ts;
        ts.name = t.value("name", "");
        ts.description = t.value("description", "");
        ts.server = name();
        if (t.contains("inputSchema")) {
            ts.parameters = t["inputSchema"];
        } else {
            ts.parameters = {{"type", "object"}, {"properties", nlohmann::json::object()}};
        }
        if (!ts.name.empty()) tools.push_back(std::move(ts));
    }
    return tools;
}

ToolResult McpStdioConnection::call_tool(const std::string& tool, const nlohmann::json& args,
                                        const CancellationToken&) {
    auto result = send_request("tools/call", {
        {"name", tool},
        {"arguments", args}
    }, std::chrono::milliseconds(config_.timeout_seconds * 1000));
    if (!result) throw ToolTimeout(tool, name(), config_.timeout_seconds);
    return tool_result_from_mcp(tool, name(), *result);
}

} // namespace strata
