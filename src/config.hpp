#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace strata {

struct ProviderConfig {
    std::string api_key;
    std::string api_key_env;    // read from the environment when api_key is empty
    std::string api_base;
    double input_price = 0.0;   // USD per million input tokens
    double output_price = 0.0;  // USD per million output tokens
    double cached_price = 0.0;  // USD per million cached input tokens

    std::string resolved_api_key() const;
};

enum class TransportKind { builtin, stdio, http };

const char* to_string(TransportKind kind);

struct ToolServerConfig {
    std::string name;
    TransportKind kind = TransportKind::builtin;
    std::string command;        // stdio, or local http server to launch
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string url;            // http
    std::string auth_token;     // http: sent as Bearer token
    std::map<std::string, std::string> headers;
    int timeout_seconds = 30;
    std::vector<std::string> tools; // declared tool patterns (empty = everything the server lists)

    void validate() const;
};

// Which servers and tools a role or layer may use. No server refs means no tools.
struct ToolScope {
    std::vector<std::string> server_refs;
    std::vector<std::string> allowed_tools;

    bool enabled() const { return !server_refs.empty(); }
};

enum class InputMode { last, all };
enum class OutputMode { none, append, replace };

struct LayerConfig {
    std::string name;
    std::string model;          // empty = session model
    std::string system_prompt;
    double temperature = 0.2;
    int max_tokens = 0;         // 0 = Config::max_tokens
    InputMode input_mode = InputMode::last;
    OutputMode output_mode = OutputMode::none;
    ToolScope mcp;
    std::map<std::string, std::string> parameters;
};

enum class CommandStyle { command, layer };

struct CommandConfig {
    LayerConfig layer;
    CommandStyle style = CommandStyle::command;
    std::string description;
};

struct AgentConfig {
    std::string name;           // exposed as tool agent_<name>, runs the layer of the same name
    std::string description;
};

struct RoleConfig {
    std::string name;
    bool enable_layers = false;
    std::string model;          // empty = Config::model
    double temperature = 0.7;
    std::vector<std::string> layer_refs;
    std::string system;
    std::string welcome;
    ToolScope mcp;
};

struct Config {
    std::string log_level = "info";
    std::string model = "openrouter:anthropic/claude-sonnet-4";
    std::string default_role = "developer";
    std::string custom_instructions_file_name = "INSTRUCTIONS.md";
    std::string sessions_dir = "~/.strata/sessions";
    int max_tokens = 4096;

    // Thresholds: 0 disables each one.
    int mcp_response_warning_threshold = 10000;
    int mcp_response_truncation_threshold = 20000;
    int max_request_tokens_threshold = 20000;
    bool enable_auto_truncation = false;
    int cache_tokens_threshold = 2048;
    int cache_timeout_seconds = 240;
    double max_session_spending_threshold = 0.0;

    int max_retries = 3;
    int retry_backoff_ms = 1000;
    int max_tool_rounds = 25;
    int health_check_interval_seconds = 30;
    int server_start_retries = 2;

    std::map<std::string, ProviderConfig> providers;
    std::vector<RoleConfig> roles;
    std::vector<LayerConfig> layers;
    std::vector<CommandConfig> commands;
    std::vector<AgentConfig> agents;
    std::vector<ToolServerConfig> servers;
    std::vector<std::string> allowed_tools;   // global allow-list (empty = all)
    std::vector<std::string> denied_tools;

    std::string sessions_path() const { return expand_path(sessions_dir); }

    const RoleConfig& role(const std::string& name) const;
    const LayerConfig* find_layer(const std::string& name) const;
    const CommandConfig* find_command(const std::string& name) const;
    const ToolServerConfig* find_server(const std::string& name) const;
    std::vector<LayerConfig> role_layers(const RoleConfig& role) const;

    void validate() const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace strata
