#include "developer_tools.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <sys/wait.h>
#include <vector>

namespace strata {

static constexpr size_t kMaxShellOutput = 4 << 20;

bool is_dangerous_command(const std::string& cmd) {
    static const std::vector<std::string> blocked = {
        "rm -rf /", "rm -rf /*", "mkfs", "shutdown", "reboot", "halt", "poweroff",
        "dd if=", ":(){ :|:& };:"
    };
    std::string lower = cmd;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto& b : blocked) {
        size_t pos = lower.find(b);
        if (pos == std::string::npos) continue;
        // "rm -rf /tmp/x" is fine; the root itself is not
        if (b == "rm -rf /") {
            size_t after = pos + b.size();
            if (after < lower.size() && lower[after] != ' ' && lower[after] != ';' &&
                lower[after] != '*') {
                continue;
            }
        }
        return true;
    }
    return false;
}

static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

static std::string run_shell(const std::string& cmd, const std::string& workdir, int timeout_sec) {
    std::string script = cmd;
    if (!workdir.empty()) script = "cd " + shell_quote(workdir) + " && " + script;

    std::string full = "sh -c " + shell_quote(script) + " 2>&1";
    if (timeout_sec > 0) {
        full = "timeout " + std::to_string(timeout_sec) + " " + full;
    }

    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) throw Error("failed to run command");

    std::string result;
    char buffer[4096];
    bool cut = false;
    while (fgets(buffer, sizeof(buffer), pipe)) {
        if (result.size() < kMaxShellOutput) {
            result += buffer;
        } else {
            cut = true;
        }
    }
    int status = pclose(pipe);
    if (WIFEXITED(status)) status = WEXITSTATUS(status);

    if (cut) result += "\n...[output cut at " + std::to_string(kMaxShellOutput) + " bytes]";
    if (status == 124 && timeout_sec > 0) {
        result += "\n[timed out after " + std::to_string(timeout_sec) + "s]";
    }
    result += "\n[exit code: " + std::to_string(status) + "]";
    return result;
}

void register_developer_tools(ToolRegistry& reg, const std::string& workdir) {
    auto dir = std::make_shared<std::string>(workdir);

    ToolDef def;
    def.name = "shell";
    def.description = "Run a shell command in the project directory. Returns stdout and stderr "
                      "combined, followed by the exit code.";
    def.parameters = nlohmann::json::parse(R"JSON({
        "type": "object",
        "properties": {
            "command": {"type": "string", "description": "Command line passed to sh -c"},
            "timeout": {"type": "integer", "description": "Seconds before the command is killed (default 120)"}
        },
        "required": ["command"]
    })JSON");

    def.func = [dir](const nlohmann::json& args, const CancellationToken&) -> std::string {
        std::string command = args.value("command", "");
        int timeout = args.value("timeout", 120);
        if (timeout < 1 || timeout > 3600) timeout = 120;

        if (command.empty()) throw Error("command is required");
        if (is_dangerous_command(command)) {
            throw Error("command blocked: potentially destructive operation");
        }
        return run_shell(command, *dir, timeout);
    };

    reg.register_tool(std::move(def));
}

} // namespace strata
