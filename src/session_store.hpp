#pragma once
#include "context_manager.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata {

struct SessionInfo {
    std::string id;
    std::string role;
    std::string model;
    int64_t created = 0;
    int64_t updated = 0;
};

struct StoredSession {
    SessionInfo info;
    ContextManager context;
    nlohmann::json costs;
};

// One JSONL file per session: a header line, the system slot, one line per
// message, cache state and the cost records. Files are rewritten whole through
// a temp file and rename, so a crash never leaves a half-written transcript.
class SessionStore {
public:
    explicit SessionStore(std::string dir) : dir_(std::move(dir)) {}

    std::string path_for(const std::string& id) const { return dir_ + "/" + id + ".jsonl"; }
    bool exists(const std::string& id) const { return fs::exists(path_for(id)); }

    // Throws Error when the directory or file cannot be written.
    void save(const SessionInfo& info, const ContextManager& context,
              const nlohmann::json& costs) const;

    // Throws Error for a missing file or a missing header.
    StoredSession load(const std::string& id) const;

    // Session ids, most recently modified first.
    std::vector<std::string> list() const;

private:
    std::string dir_;
};

} // namespace strata
