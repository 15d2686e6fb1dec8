#pragma once
#include <string>
#include <vector>

namespace strata {

// Glob matching with '*' (any run) and '?' (one char). Case-sensitive.
inline bool glob_match(const std::string& pattern, const std::string& name) {
    size_t p = 0, n = 0;
    size_t star = std::string::npos, mark = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            p++; n++;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (star != std::string::npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') p++;
    return p == pattern.size();
}

inline bool is_exact_pattern(const std::string& pattern) {
    return pattern.find_first_of("*?") == std::string::npos;
}

// A pattern of the form "server:glob" only applies to tools served by that server.
inline bool tool_pattern_matches(const std::string& pattern, const std::string& tool,
                                 const std::string& server) {
    size_t colon = pattern.find(':');
    if (colon != std::string::npos) {
        if (pattern.compare(0, colon, server) != 0 || colon != server.size()) return false;
        return glob_match(pattern.substr(colon + 1), tool);
    }
    return glob_match(pattern, tool);
}

// Empty pattern list allows everything.
inline bool tool_allowed_by_patterns(const std::vector<std::string>& patterns,
                                     const std::string& tool, const std::string& server) {
    if (patterns.empty()) return true;
    for (auto& p : patterns) {
        if (tool_pattern_matches(p, tool, server)) return true;
    }
    return false;
}

} // namespace strata
