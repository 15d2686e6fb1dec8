#include "mcp_http.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <iostream>
#include <thread>

namespace strata {

std::optional<nlohmann::json> parse_rpc_body(const std::string& body, int id) {
    auto matches = [id](const nlohmann::json& j) {
        return j.is_object() && j.contains("id") && j["id"].is_number_integer() && j["id"].get<int>() == id;
    };

    try {
        auto j = nlohmann::json::parse(body);
        if (matches(j)) return j;
        if (j.is_array()) {
            for (auto& item : j) {
                if (matches(item)) return item;
            }
        }
        return std::nullopt;
    } catch (const nlohmann::json::exception&) {
        // fall through to SSE framing
    }

    size_t line_start = 0;
    while (line_start < body.size()) {
        size_t line_end = body.find('\n', line_start);
        if (line_end == std::string::npos) line_end = body.size();
        std::string line = body.substr(line_start, line_end - line_start);
        line_start = line_end + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.rfind("data:", 0) != 0) continue;

        std::string data = line.substr(5);
        if (!data.empty() && data[0] == ' ') data.erase(0, 1);
        try {
            auto j = nlohmann::json::parse(data);
            if (matches(j)) return j;
        } catch (const nlohmann::json::exception&) {
            continue;
        }
    }
    return std::nullopt;
}

McpHttpConnection::McpHttpConnection(ToolServerConfig cfg)
    : McpConnection(std::move(cfg)), url_(parse_url(config_.url)) {}

McpHttpConnection::~McpHttpConnection() {
    stop();
}

void McpHttpConnection::start() {
    if (connected_) return;

    if (is_local()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!child_running(child_.pid)) {
            child_ = spawn_child(config_, false);
        }
    }

    // A local server needs a moment to bind its port
    int attempts = is_local() ? 10 : 1;
    std::string last_error;
    for (int i = 0; i < attempts; i++) {
        try {
            auto init = request("initialize", {
                {"protocolVersion", "2025-06-18"},
                {"capabilities", nlohmann::json::object()},
                {"clientInfo", {{"name", "strata"}, {"version", "1.0"}}}
            });
            if (init.contains("error")) throw ServerUnavailable(name(), "initialize rejected: " + init["error"].dump());
            notify("notifications/initialized");
            connected_ = true;
            if (log_enabled(LogLevel::debug)) {
                std::cerr << "[mcp:" << name() << "] Connected to " << config_.url << "\n";
            }
            return;
        } catch (const ServerUnavailable& e) {
            last_error = e.what();
        }
        if (i + 1 < attempts) std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    stop();
    throw ServerUnavailable(name(), last_error);
}

void McpHttpConnection::stop() {
    connected_ = false;
    std::lock_guard<std::mutex> lock(mutex_);
    session_id_.clear();
    if (child_.pid > 0) terminate_child(child_, config_.timeout_seconds);
}

bool McpHttpConnection::alive() const {
    if (!is_local()) return true;
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_ && child_running(child_.pid);
}

std::optional<nlohmann::json> McpHttpConnection::post(const nlohmann::json& body, int id) {
    httplib::Client cli(url_.base());
    // The dispatcher enforces the real deadline; leave the socket a little longer
    cli.set_connection_timeout(config_.timeout_seconds);
    cli.set_read_timeout(config_.timeout_seconds + 5);

    httplib::Headers headers = {
        {"Accept", "application/json, text/event-stream"}
    };
    if (!config_.auth_token.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.auth_token);
    }
    for (auto& [k, v] : config_.headers) headers.emplace(k, v);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_id_.empty()) headers.emplace("Mcp-Session-Id", session_id_);
    }

    std::string path = url_.path.empty() ? "/" : url_.path;
    auto res = cli.Post(path, headers, body.dump(), "application/json");
    if (!res) {
        throw ServerUnavailable(name(), "request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw ServerUnavailable(name(), "HTTP status " + std::to_string(res->status) + ": " + res->body);
    }
    if (res->has_header("Mcp-Session-Id")) {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id_ = res->get_header_value("Mcp-Session-Id");
    }
    if (id < 0) return std::nullopt;
    return parse_rpc_body(res->body, id);
}

nlohmann::json McpHttpConnection::request(const std::string& method, const nlohmann::json& params) {
    int id = next_id_++;
    auto resp = post(make_jsonrpc_request(id, method, params), id);
    if (!resp) throw ServerUnavailable(name(), "no response to " + method);
    if (resp->contains("result")) return (*resp)["result"];
    return *resp;
}

void McpHttpConnection::notify(const std::string& method) {
    post({{"jsonrpc", "2.0"}, {"method", method}}, -1);
}

std::vector<ToolSchema> McpHttpConnection::list_tools() {
    std::vector<ToolSchema> tools;
    auto result = request("tools/list", nlohmann::json::object());
    if (!result.contains("tools")) return tools;
    for (auto& t : result["tools"]) {
        ToolSchema ts;
        ts.name = t.value("name", "");
        ts.description = t.value("description", "");
        ts.server = name();
        ts.parameters = t.contains("inputSchema")
            ? t["inputSchema"]
            : nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
        if (!ts.name.empty()) tools.push_back(std::move(ts));
    }
    return tools;
}

ToolResult McpHttpConnection::call_tool(const std::string& tool, const nlohmann::json& args,
                                       const CancellationToken&) {
    auto result = request("tools/call", {{"name", tool}, {"arguments", args}});
    return tool_result_from_mcp(tool, name(), result);
}

} // namespace strata
