#include "filesystem_tools.hpp"
#include "../patterns.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

namespace strata {

static std::string resolve_path(const std::string& workdir, const std::string& path) {
    if (path.empty()) return workdir;
    std::string p = expand_path(path);
    if (p[0] == '/') return p;
    return (fs::path(workdir) / p).string();
}

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw Error("cannot read file: " + path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(f, line)) lines.push_back(line);
    return lines;
}

static void write_text(const std::string& path, const std::string& content) {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
    std::ofstream f(path, std::ios::trunc);
    if (!f) throw Error("cannot write file: " + path);
    f << content;
    if (!f) throw Error("failed writing file: " + path);
}

static std::string view(const std::string& path, const nlohmann::json& args) {
    if (fs::is_directory(path)) throw Error(path + " is a directory; use list_files");
    auto lines = read_lines(path);

    int from = 1;
    int to = static_cast<int>(lines.size());
    if (args.contains("view_range") && args["view_range"].is_array() &&
        args["view_range"].size() == 2) {
        from = std::max(1, args["view_range"][0].get<int>());
        int end = args["view_range"][1].get<int>();
        if (end > 0) to = std::min(to, end);
    }
    if (lines.empty()) return "(empty file)";
    if (from > to) {
        throw Error("view_range starts past the end of the file (" +
                    std::to_string(lines.size()) + " lines)");
    }

    std::ostringstream out;
    for (int i = from; i <= to; i++) {
        out << i << ": " << lines[static_cast<size_t>(i - 1)] << "\n";
    }
    return out.str();
}

static std::string str_replace(const std::string& path, const nlohmann::json& args) {
    std::string old_str = args.value("old_str", "");
    std::string new_str = args.value("new_str", "");
    if (old_str.empty()) throw Error("old_str is required");

    std::string content = read_file(path);
    if (content.empty() && !fs::exists(path)) throw Error("cannot read file: " + path);

    size_t pos = content.find(old_str);
    if (pos == std::string::npos) throw Error("old_str not found in " + path);
    if (content.find(old_str, pos + 1) != std::string::npos) {
        throw Error("old_str matches more than once in " + path + "; add more context");
    }
    content.replace(pos, old_str.size(), new_str);
    write_text(path, content);
    return "Replaced " + std::to_string(old_str.size()) + " chars with " +
           std::to_string(new_str.size()) + " chars in " + path;
}

static std::string insert(const std::string& path, const nlohmann::json& args) {
    int at = args.value("insert_line", -1);
    std::string text = args.value("new_str", "");
    auto lines = read_lines(path);
    if (at < 0 || at > static_cast<int>(lines.size())) {
        throw Error("insert_line must be between 0 and " + std::to_string(lines.size()));
    }

    std::vector<std::string> added;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) added.push_back(line);
    lines.insert(lines.begin() + at, added.begin(), added.end());

    std::string content;
    for (auto& l : lines) content += l + "\n";
    write_text(path, content);
    return "Inserted " + std::to_string(added.size()) + " lines after line " +
           std::to_string(at) + " in " + path;
}

void register_filesystem_tools(ToolRegistry& reg, const std::string& workdir) {
    auto dir = std::make_shared<std::string>(workdir);

    {
        ToolDef def;
        def.name = "text_editor";
        def.description = "View, create and edit text files. Commands: view (optional "
                          "view_range [from, to]), create (file_text), str_replace (old_str "
                          "must match exactly once), insert (insert_line, new_str).";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "command": {"type": "string", "enum": ["view", "create", "str_replace", "insert"]},
                "path": {"type": "string"},
                "view_range": {"type": "array", "items": {"type": "integer"}},
                "file_text": {"type": "string"},
                "old_str": {"type": "string"},
                "new_str": {"type": "string"},
                "insert_line": {"type": "integer"}
            },
            "required": ["command", "path"]
        })JSON");

        def.func = [dir](const nlohmann::json& args, const CancellationToken&) -> std::string {
            std::string command = args.value("command", "");
            std::string path = args.value("path", "");
            if (path.empty()) throw Error("path is required");
            std::string resolved = resolve_path(*dir, path);

            if (command == "view") return view(resolved, args);
            if (command == "create") {
                std::string text = args.value("file_text", "");
                write_text(resolved, text);
                return "Created " + resolved + " (" + std::to_string(text.size()) + " bytes)";
            }
            if (command == "str_replace") return str_replace(resolved, args);
            if (command == "insert") return insert(resolved, args);
            throw Error("unknown text_editor command '" + command + "'");
        };
        reg.register_tool(std::move(def));
    }

    {
        ToolDef def;
        def.name = "list_files";
        def.description = "List files under a directory, optionally filtered by a name glob "
                          "(e.g. *.cpp). Hidden entries are skipped.";
        def.parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "directory": {"type": "string"},
                "pattern": {"type": "string"},
                "max_depth": {"type": "integer"}
            }
        })JSON");

        def.func = [dir](const nlohmann::json& args, const CancellationToken&) -> std::string {
            std::string resolved = resolve_path(*dir, args.value("directory", ""));
            std::string pattern = args.value("pattern", "");
            int max_depth = args.value("max_depth", 3);

            std::error_code ec;
            if (!fs::is_directory(resolved, ec)) throw Error("not a directory: " + resolved);

            std::string out;
            int count = 0;
            auto it = fs::recursive_directory_iterator(
                resolved, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                std::string name = it->path().filename().string();
                if (!name.empty() && name[0] == '.') {
                    if (it->is_directory()) it.disable_recursion_pending();
                    continue;
                }
                if (it->is_directory() && it.depth() + 1 >= max_depth) {
                    it.disable_recursion_pending();
                }
                if (!pattern.empty() && !glob_match(pattern, name)) continue;

                std::error_code rel_ec;
                std::string rel = fs::relative(it->path(), resolved, rel_ec).string();
                if (rel_ec) rel = it->path().string();
                out += rel + (it->is_directory() ? "/" : "") + "\n";
                count++;
            }
            if (count == 0) return "No files found";
            return std::to_string(count) + " entries:\n" + out;
        };
        reg.register_tool(std::move(def));
    }
}

} // namespace strata
