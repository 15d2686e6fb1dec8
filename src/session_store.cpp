#include "session_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace strata {

void SessionStore::save(const SessionInfo& info, const ContextManager& context,
                        const nlohmann::json& costs) const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw Error("cannot create sessions directory " + dir_ + ": " + ec.message());

    std::string path = path_for(info.id);
    std::string tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw Error("cannot write session file " + tmp);

        nlohmann::json header = {
            {"type", "session"},
            {"id", info.id},
            {"role", info.role},
            {"model", info.model},
            {"created", info.created},
            {"updated", epoch_now()}
        };
        f << header.dump() << "\n";

        if (context.system()) {
            f << nlohmann::json{{"type", "system"}, {"message", context.system()->to_record()}}.dump() << "\n";
        }
        for (auto& m : context.messages()) {
            f << nlohmann::json{{"type", "message"}, {"message", m.to_record()}}.dump() << "\n";
        }

        auto state = context.to_json();
        f << nlohmann::json{
            {"type", "cache"},
            {"tools_cached", state["tools_cached"]},
            {"last_cache_checkpoint", state["last_cache_checkpoint"]}
        }.dump() << "\n";

        if (!costs.is_null()) {
            f << nlohmann::json{{"type", "costs"}, {"costs", costs}}.dump() << "\n";
        }
        f.flush();
        if (!f) throw Error("failed writing session file " + tmp);
    }

    fs::rename(tmp, path, ec);
    if (ec) throw Error("cannot replace session file " + path + ": " + ec.message());
}

StoredSession SessionStore::load(const std::string& id) const {
    std::string path = path_for(id);
    std::ifstream f(path);
    if (!f) throw Error("session '" + id + "' not found in " + dir_);

    StoredSession out;
    nlohmann::json state;
    state["messages"] = nlohmann::json::array();
    bool have_header = false;

    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            auto j = nlohmann::json::parse(line);
            if (!j.is_object()) throw Error("not a JSON object");

            std::string type = j.value("type", "");
            if (type == "session") {
                out.info.id = j.value("id", id);
                out.info.role = j.value("role", "");
                out.info.model = j.value("model", "");
                out.info.created = j.value("created", static_cast<int64_t>(0));
                out.info.updated = j.value("updated", static_cast<int64_t>(0));
                have_header = true;
            } else if (type == "system" || type == "message") {
                auto it = j.find("message");
                if (it == j.end() || !it->is_object()) throw Error("missing message object");
                Message::from_record(*it);
                if (type == "system") state["system"] = *it;
                else state["messages"].push_back(*it);
            } else if (type == "cache") {
                state["tools_cached"] = j.value("tools_cached", false);
                state["last_cache_checkpoint"] = j.value("last_cache_checkpoint", static_cast<int64_t>(0));
            } else if (type == "costs") {
                out.costs = j["costs"];
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[session] " << path << ":" << line_no << ": skipping bad line ("
                      << e.what() << ")\n";
        } catch (const Error& e) {
            std::cerr << "[session] " << path << ":" << line_no << ": skipping bad line ("
                      << e.what() << ")\n";
        }
    }

    if (!have_header) throw Error("session file " + path + " has no header");
    try {
        out.context = ContextManager::from_json(state);
    } catch (const nlohmann::json::exception& e) {
        throw Error("session file " + path + " is damaged: " + e.what());
    }
    return out;
}

std::vector<std::string> SessionStore::list() const {
    std::vector<std::pair<fs::file_time_type, std::string>> found;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return {};
    for (auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".jsonl") continue;
        found.emplace_back(entry.last_write_time(), entry.path().stem().string());
    }
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<std::string> out;
    for (auto& p : found) out.push_back(p.second);
    return out;
}

} // namespace strata
