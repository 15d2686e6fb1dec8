#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>
#include <set>

namespace strata {

std::string ProviderConfig::resolved_api_key() const {
    if (!api_key.empty()) return api_key;
    if (!api_key_env.empty()) {
        const char* v = std::getenv(api_key_env.c_str());
        if (v) return v;
    }
    return "";
}

const char* to_string(TransportKind kind) {
    switch (kind) {
    case TransportKind::stdio: return "stdin";
    case TransportKind::http:  return "http";
    default:                   return "builtin";
    }
}

static TransportKind parse_transport(const std::string& s) {
    if (s == "builtin") return TransportKind::builtin;
    if (s == "stdin" || s == "stdio") return TransportKind::stdio;
    if (s == "http") return TransportKind::http;
    throw ConfigError("unknown server type '" + s + "'");
}

void ToolServerConfig::validate() const {
    if (name.empty()) throw ConfigError("server name cannot be empty");
    if (timeout_seconds <= 0)
        throw ConfigError("server '" + name + "': timeout_seconds must be positive");
    switch (kind) {
    case TransportKind::stdio:
        if (command.empty()) throw ConfigError("server '" + name + "': stdin server requires a command");
        break;
    case TransportKind::http:
        if (url.empty()) throw ConfigError("server '" + name + "': http server requires a url");
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0)
            throw ConfigError("server '" + name + "': url must start with http:// or https://");
        break;
    case TransportKind::builtin:
        break;
    }
}

// ── JSON helpers ──

static InputMode parse_input_mode(const std::string& s) {
    if (s == "last") return InputMode::last;
    if (s == "all") return InputMode::all;
    throw ConfigError("unknown input_mode '" + s + "'");
}

static const char* input_mode_str(InputMode m) { return m == InputMode::all ? "all" : "last"; }

static OutputMode parse_output_mode(const std::string& s) {
    if (s == "none") return OutputMode::none;
    if (s == "append") return OutputMode::append;
    if (s == "replace") return OutputMode::replace;
    throw ConfigError("unknown output_mode '" + s + "'");
}

static const char* output_mode_str(OutputMode m) {
    switch (m) {
    case OutputMode::append:  return "append";
    case OutputMode::replace: return "replace";
    default:                  return "none";
    }
}

static ToolScope scope_from_json(const nlohmann::json& j) {
    ToolScope s;
    if (!j.is_object()) return s;
    s.server_refs = j.value("server_refs", std::vector<std::string>{});
    s.allowed_tools = j.value("allowed_tools", std::vector<std::string>{});
    return s;
}

static nlohmann::json scope_to_json(const ToolScope& s) {
    return {{"server_refs", s.server_refs}, {"allowed_tools", s.allowed_tools}};
}

static LayerConfig layer_from_json(const nlohmann::json& j) {
    LayerConfig l;
    l.name = j.value("name", "");
    if (l.name.empty()) throw ConfigError("layer name cannot be empty");
    l.model = j.value("model", "");
    l.system_prompt = j.value("system_prompt", "");
    l.temperature = j.value("temperature", l.temperature);
    l.max_tokens = j.value("max_tokens", 0);
    l.input_mode = parse_input_mode(j.value("input_mode", "last"));
    l.output_mode = parse_output_mode(j.value("output_mode", "none"));
    if (j.contains("mcp")) l.mcp = scope_from_json(j["mcp"]);
    if (j.contains("parameters") && j["parameters"].is_object()) {
        for (auto& [k, v] : j["parameters"].items()) {
            l.parameters[k] = v.is_string() ? v.get<std::string>() : v.dump();
        }
    }
    return l;
}

static nlohmann::json layer_to_json(const LayerConfig& l) {
    nlohmann::json j = {
        {"name", l.name},
        {"system_prompt", l.system_prompt},
        {"temperature", l.temperature},
        {"input_mode", input_mode_str(l.input_mode)},
        {"output_mode", output_mode_str(l.output_mode)},
        {"mcp", scope_to_json(l.mcp)}
    };
    if (!l.model.empty()) j["model"] = l.model;
    if (l.max_tokens > 0) j["max_tokens"] = l.max_tokens;
    if (!l.parameters.empty()) j["parameters"] = l.parameters;
    return j;
}

static RoleConfig role_from_json(const nlohmann::json& j) {
    RoleConfig r;
    r.name = j.value("name", "");
    r.enable_layers = j.value("enable_layers", false);
    r.model = j.value("model", "");
    r.temperature = j.value("temperature", r.temperature);
    r.layer_refs = j.value("layer_refs", std::vector<std::string>{});
    r.system = j.value("system", "");
    r.welcome = j.value("welcome", "");
    if (j.contains("mcp")) r.mcp = scope_from_json(j["mcp"]);
    return r;
}

static nlohmann::json role_to_json(const RoleConfig& r) {
    nlohmann::json j = {
        {"name", r.name},
        {"enable_layers", r.enable_layers},
        {"temperature", r.temperature},
        {"layer_refs", r.layer_refs},
        {"system", r.system},
        {"welcome", r.welcome},
        {"mcp", scope_to_json(r.mcp)}
    };
    if (!r.model.empty()) j["model"] = r.model;
    return j;
}

static ToolServerConfig server_from_json(const nlohmann::json& j) {
    ToolServerConfig s;
    s.name = j.value("name", "");
    s.kind = parse_transport(j.value("type", "builtin"));
    s.command = j.value("command", "");
    s.args = j.value("args", std::vector<std::string>{});
    s.env = j.value("env", std::map<std::string, std::string>{});
    s.url = j.value("url", "");
    s.auth_token = j.value("auth_token", "");
    s.headers = j.value("headers", std::map<std::string, std::string>{});
    s.timeout_seconds = j.value("timeout_seconds", s.timeout_seconds);
    s.tools = j.value("tools", std::vector<std::string>{});
    return s;
}

static nlohmann::json server_to_json(const ToolServerConfig& s) {
    nlohmann::json j = {
        {"name", s.name},
        {"type", to_string(s.kind)},
        {"timeout_seconds", s.timeout_seconds},
        {"tools", s.tools}
    };
    if (!s.command.empty()) j["command"] = s.command;
    if (!s.args.empty()) j["args"] = s.args;
    if (!s.env.empty()) j["env"] = s.env;
    if (!s.url.empty()) j["url"] = s.url;
    if (!s.auth_token.empty()) j["auth_token"] = s.auth_token;
    if (!s.headers.empty()) j["headers"] = s.headers;
    return j;
}

// ── Defaults ──

static RoleConfig default_developer_role() {
    RoleConfig r;
    r.name = "developer";
    r.enable_layers = true;
    r.temperature = 0.2;
    r.layer_refs = {"query_processor", "context_generator"};
    r.system =
        "You are an expert software developer working in %{CWD}.\n"
        "Use the available tools to inspect and change the project. Keep answers short, "
        "show the commands you ran and the files you changed.";
    r.welcome = "Developer session in %{CWD} (role: %{ROLE}). Type /help for commands.";
    r.mcp.server_refs = {"developer", "filesystem", "web", "agent"};
    return r;
}

static RoleConfig default_assistant_role() {
    RoleConfig r;
    r.name = "assistant";
    r.enable_layers = false;
    r.temperature = 0.7;
    r.system = "You are a helpful assistant. Answer concisely.";
    r.welcome = "Assistant session in %{CWD} (role: %{ROLE}). Type /help for commands.";
    r.mcp.server_refs = {"filesystem"};
    r.mcp.allowed_tools = {"list_files"};
    return r;
}

static std::vector<LayerConfig> default_layers() {
    LayerConfig qp;
    qp.name = "query_processor";
    qp.temperature = 0.2;
    qp.input_mode = InputMode::last;
    qp.output_mode = OutputMode::none;
    qp.system_prompt =
        "You turn a developer's request into a precise, self-contained task description.\n"
        "Working directory: %{CWD}\n"
        "Respond with the refined task only.";

    LayerConfig cg;
    cg.name = "context_generator";
    cg.temperature = 0.2;
    cg.input_mode = InputMode::last;
    cg.output_mode = OutputMode::append;
    cg.system_prompt =
        "You collect the project context needed to solve a task in %{CWD}.\n"
        "Use the tools to find and read the relevant files, then write a short report of "
        "the facts the developer needs, followed by the task itself.\n\n"
        "Refined task:\n%{CONTEXT}";
    cg.mcp.server_refs = {"filesystem"};
    cg.mcp.allowed_tools = {"text_editor", "list_files"};

    return {qp, cg};
}

static std::vector<CommandConfig> default_commands() {
    CommandConfig reduce;
    reduce.layer.name = "reduce";
    reduce.layer.temperature = 0.2;
    reduce.layer.input_mode = InputMode::all;
    reduce.layer.output_mode = OutputMode::replace;
    reduce.layer.system_prompt =
        "Summarize the conversation so far for a developer who will continue it. "
        "Keep decisions, changed files, commands that worked, and open work. "
        "Respond with the summary only.";
    reduce.style = CommandStyle::layer;
    reduce.description = "Compress the session into a summary";
    return {reduce};
}

static std::vector<ToolServerConfig> default_servers() {
    ToolServerConfig dev;
    dev.name = "developer";
    dev.kind = TransportKind::builtin;
    dev.timeout_seconds = 300;
    dev.tools = {"shell"};

    ToolServerConfig fsrv;
    fsrv.name = "filesystem";
    fsrv.kind = TransportKind::builtin;
    fsrv.timeout_seconds = 30;
    fsrv.tools = {"text_editor", "list_files"};

    ToolServerConfig web;
    web.name = "web";
    web.kind = TransportKind::builtin;
    web.timeout_seconds = 60;

    ToolServerConfig agent;
    agent.name = "agent";
    agent.kind = TransportKind::builtin;
    agent.timeout_seconds = 600;

    return {dev, fsrv, web, agent};
}

static std::map<std::string, ProviderConfig> default_providers() {
    std::map<std::string, ProviderConfig> p;
    p["openrouter"] = ProviderConfig{"", "OPENROUTER_API_KEY", "https://openrouter.ai/api/v1", 0, 0, 0};
    p["openai"] = ProviderConfig{"", "OPENAI_API_KEY", "https://api.openai.com/v1", 0, 0, 0};
    p["deepseek"] = ProviderConfig{"", "DEEPSEEK_API_KEY", "https://api.deepseek.com/v1", 0.27, 1.10, 0.07};
    p["local"] = ProviderConfig{"", "", "http://127.0.0.1:8000/v1", 0, 0, 0};
    return p;
}

Config Config::make_default() {
    Config c;
    c.providers = default_providers();
    c.roles = {default_developer_role(), default_assistant_role()};
    c.layers = default_layers();
    c.commands = default_commands();
    c.servers = default_servers();
    return c;
}

// ── Lookups ──

const RoleConfig& Config::role(const std::string& name) const {
    for (auto& r : roles) {
        if (r.name == name) return r;
    }
    throw ConfigError("unknown role '" + name + "'");
}

const LayerConfig* Config::find_layer(const std::string& name) const {
    for (auto& l : layers) {
        if (l.name == name) return &l;
    }
    return nullptr;
}

const CommandConfig* Config::find_command(const std::string& name) const {
    for (auto& c : commands) {
        if (c.layer.name == name) return &c;
    }
    return nullptr;
}

const ToolServerConfig* Config::find_server(const std::string& name) const {
    for (auto& s : servers) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

std::vector<LayerConfig> Config::role_layers(const RoleConfig& r) const {
    std::vector<LayerConfig> out;
    for (auto& ref : r.layer_refs) {
        auto* l = find_layer(ref);
        if (!l) throw ConfigError("role '" + r.name + "' references unknown layer '" + ref + "'");
        out.push_back(*l);
    }
    return out;
}

// ── Validation ──

void Config::validate() const {
    if (log_level != "none" && log_level != "info" && log_level != "debug")
        throw ConfigError("log_level must be none, info or debug");
    if (model.find(':') == std::string::npos)
        throw ConfigError("model '" + model + "' must have the form provider:model");
    if (mcp_response_warning_threshold < 0 || mcp_response_truncation_threshold < 0 ||
        max_request_tokens_threshold < 0 || cache_tokens_threshold < 0 ||
        cache_timeout_seconds < 0 || max_session_spending_threshold < 0.0)
        throw ConfigError("thresholds cannot be negative");
    if (max_retries < 0 || retry_backoff_ms < 0 || max_tool_rounds <= 0)
        throw ConfigError("max_retries and retry_backoff_ms must be >= 0, max_tool_rounds > 0");

    std::set<std::string> names;
    for (auto& s : servers) {
        s.validate();
        if (!names.insert(s.name).second)
            throw ConfigError("duplicate server name '" + s.name + "'");
    }

    auto check_scope = [&](const ToolScope& scope, const std::string& owner) {
        for (auto& ref : scope.server_refs) {
            if (!names.count(ref))
                throw ConfigError(owner + " references unknown server '" + ref + "'");
        }
    };

    std::set<std::string> layer_names;
    for (auto& l : layers) {
        if (!layer_names.insert(l.name).second)
            throw ConfigError("duplicate layer name '" + l.name + "'");
        check_scope(l.mcp, "layer '" + l.name + "'");
    }
    for (auto& c : commands) {
        check_scope(c.layer.mcp, "command '" + c.layer.name + "'");
    }
    for (auto& a : agents) {
        if (!find_layer(a.name))
            throw ConfigError("agent '" + a.name + "' has no layer of the same name");
    }

    std::set<std::string> role_names;
    for (auto& r : roles) {
        if (r.name.empty()) throw ConfigError("role name cannot be empty");
        if (!role_names.insert(r.name).second)
            throw ConfigError("duplicate role name '" + r.name + "'");
        check_scope(r.mcp, "role '" + r.name + "'");
        for (auto& ref : r.layer_refs) {
            if (!find_layer(ref))
                throw ConfigError("role '" + r.name + "' references unknown layer '" + ref + "'");
        }
    }
    if (!role_names.count(default_role))
        throw ConfigError("default_role '" + default_role + "' is not defined");
}

// ── Serialization ──

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["log_level"] = log_level;
    j["model"] = model;
    j["default_role"] = default_role;
    j["custom_instructions_file_name"] = custom_instructions_file_name;
    j["sessions_dir"] = sessions_dir;
    j["max_tokens"] = max_tokens;

    j["mcp_response_warning_threshold"] = mcp_response_warning_threshold;
    j["mcp_response_truncation_threshold"] = mcp_response_truncation_threshold;
    j["max_request_tokens_threshold"] = max_request_tokens_threshold;
    j["enable_auto_truncation"] = enable_auto_truncation;
    j["cache_tokens_threshold"] = cache_tokens_threshold;
    j["cache_timeout_seconds"] = cache_timeout_seconds;
    j["max_session_spending_threshold"] = max_session_spending_threshold;

    j["max_retries"] = max_retries;
    j["retry_backoff_ms"] = retry_backoff_ms;
    j["max_tool_rounds"] = max_tool_rounds;
    j["health_check_interval_seconds"] = health_check_interval_seconds;
    j["server_start_retries"] = server_start_retries;

    for (auto& [k, v] : providers) {
        auto& p = j["providers"][k];
        p["api_base"] = v.api_base;
        if (!v.api_key.empty()) p["api_key"] = v.api_key;
        if (!v.api_key_env.empty()) p["api_key_env"] = v.api_key_env;
        if (v.input_price > 0) p["input_price"] = v.input_price;
        if (v.output_price > 0) p["output_price"] = v.output_price;
        if (v.cached_price > 0) p["cached_price"] = v.cached_price;
    }

    j["roles"] = nlohmann::json::array();
    for (auto& r : roles) j["roles"].push_back(role_to_json(r));
    j["layers"] = nlohmann::json::array();
    for (auto& l : layers) j["layers"].push_back(layer_to_json(l));
    j["commands"] = nlohmann::json::array();
    for (auto& c : commands) {
        auto cj = layer_to_json(c.layer);
        cj["style"] = c.style == CommandStyle::layer ? "layer" : "command";
        if (!c.description.empty()) cj["description"] = c.description;
        j["commands"].push_back(cj);
    }
    j["agents"] = nlohmann::json::array();
    for (auto& a : agents) j["agents"].push_back({{"name", a.name}, {"description", a.description}});

    auto& mcp = j["mcp"];
    mcp["servers"] = nlohmann::json::array();
    for (auto& s : servers) mcp["servers"].push_back(server_to_json(s));
    mcp["allowed_tools"] = allowed_tools;
    mcp["denied_tools"] = denied_tools;
    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c = make_default();
    try {
        c.log_level = j.value("log_level", c.log_level);
        c.model = j.value("model", c.model);
        c.default_role = j.value("default_role", c.default_role);
        c.custom_instructions_file_name = j.value("custom_instructions_file_name", c.custom_instructions_file_name);
        c.sessions_dir = j.value("sessions_dir", c.sessions_dir);
        c.max_tokens = j.value("max_tokens", c.max_tokens);

        c.mcp_response_warning_threshold = j.value("mcp_response_warning_threshold", c.mcp_response_warning_threshold);
        c.mcp_response_truncation_threshold = j.value("mcp_response_truncation_threshold", c.mcp_response_truncation_threshold);
        c.max_request_tokens_threshold = j.value("max_request_tokens_threshold", c.max_request_tokens_threshold);
        c.enable_auto_truncation = j.value("enable_auto_truncation", c.enable_auto_truncation);
        c.cache_tokens_threshold = j.value("cache_tokens_threshold", c.cache_tokens_threshold);
        c.cache_timeout_seconds = j.value("cache_timeout_seconds", c.cache_timeout_seconds);
        c.max_session_spending_threshold = j.value("max_session_spending_threshold", c.max_session_spending_threshold);

        c.max_retries = j.value("max_retries", c.max_retries);
        c.retry_backoff_ms = j.value("retry_backoff_ms", c.retry_backoff_ms);
        c.max_tool_rounds = j.value("max_tool_rounds", c.max_tool_rounds);
        c.health_check_interval_seconds = j.value("health_check_interval_seconds", c.health_check_interval_seconds);
        c.server_start_retries = j.value("server_start_retries", c.server_start_retries);

        if (j.contains("providers") && j["providers"].is_object()) {
            for (auto& [k, v] : j["providers"].items()) {
                ProviderConfig pc = c.providers.count(k) ? c.providers[k] : ProviderConfig{};
                pc.api_base = v.value("api_base", pc.api_base);
                pc.api_key = v.value("api_key", pc.api_key);
                pc.api_key_env = v.value("api_key_env", pc.api_key_env);
                pc.input_price = v.value("input_price", pc.input_price);
                pc.output_price = v.value("output_price", pc.output_price);
                pc.cached_price = v.value("cached_price", pc.cached_price);
                c.providers[k] = pc;
            }
        }

        if (j.contains("layers")) {
            c.layers.clear();
            for (auto& lj : j["layers"]) c.layers.push_back(layer_from_json(lj));
        }

        if (j.contains("commands")) {
            c.commands.clear();
            for (auto& cj : j["commands"]) {
                CommandConfig cmd;
                cmd.layer = layer_from_json(cj);
                std::string style = cj.value("style", "command");
                if (style != "command" && style != "layer")
                    throw ConfigError("command '" + cmd.layer.name + "': style must be command or layer");
                cmd.style = style == "layer" ? CommandStyle::layer : CommandStyle::command;
                cmd.description = cj.value("description", "");
                c.commands.push_back(std::move(cmd));
            }
        }

        if (j.contains("agents")) {
            for (auto& aj : j["agents"]) {
                AgentConfig a{aj.value("name", ""), aj.value("description", "")};
                if (a.name.empty()) throw ConfigError("agent name cannot be empty");
                c.agents.push_back(std::move(a));
            }
        }

        if (j.contains("roles")) {
            // Every role is merged over the assistant role, so unset fields are
            // resolved here once and never looked up again at runtime.
            nlohmann::json base = role_to_json(default_assistant_role());
            for (auto& rj : j["roles"]) {
                if (rj.value("name", "") == "assistant") base.update(rj);
            }
            c.roles.clear();
            for (auto& rj : j["roles"]) {
                nlohmann::json merged = base;
                merged.update(rj);
                c.roles.push_back(role_from_json(merged));
            }
            bool has_assistant = false;
            for (auto& r : c.roles) has_assistant = has_assistant || r.name == "assistant";
            if (!has_assistant) c.roles.push_back(role_from_json(base));
        }

        if (j.contains("mcp") && j["mcp"].is_object()) {
            auto& mcp = j["mcp"];
            if (mcp.contains("servers")) {
                c.servers.clear();
                for (auto& sj : mcp["servers"]) c.servers.push_back(server_from_json(sj));
            }
            c.allowed_tools = mcp.value("allowed_tools", c.allowed_tools);
            c.denied_tools = mcp.value("denied_tools", c.denied_tools);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed value: ") + e.what());
    }

    c.validate();
    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] No config at " << path << ", using defaults\n";
        return make_default();
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }
    return from_json(j);
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f) throw ConfigError("cannot write " + path);
    f << to_json().dump(2) << "\n";
}

} // namespace strata
