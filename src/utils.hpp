#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <atomic>

namespace strata {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    if (p == "~") return home_dir();
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.strata/config.json";
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline std::string format_time(const char* fmt) {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

inline std::string today_str() { return format_time("%Y-%m-%d"); }

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string generate_tool_call_id() {
    static std::atomic<int> counter{0};
    return "call_" + std::to_string(epoch_now()) + "_" + std::to_string(counter++);
}

inline std::string generate_session_id() {
    static std::atomic<int> counter{0};
    return format_time("%Y%m%d-%H%M%S") + "-" + std::to_string(counter++);
}

struct UrlParts {
    std::string scheme = "http";
    std::string host = "127.0.0.1";
    int port = 80;
    std::string path;       // no trailing slash
    std::string base() const { return scheme + "://" + host + ":" + std::to_string(port); }
};

inline UrlParts parse_url(const std::string& url) {
    UrlParts u;
    size_t pos = 0;
    if (url.rfind("https://", 0) == 0) {
        u.scheme = "https"; pos = 8; u.port = 443;
    } else if (url.rfind("http://", 0) == 0) {
        pos = 7;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        u.path = url.substr(slash);
        while (!u.path.empty() && u.path.back() == '/') u.path.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        u.host = host_port.substr(0, colon);
        u.port = std::atoi(host_port.substr(colon + 1).c_str());
    } else {
        u.host = host_port;
    }
    return u;
}

// ── UTF-8 helpers (lengths are in codepoints, never bytes) ──

inline size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

// Byte offset of the codepoint with index `cp` (s.size() if past the end).
inline size_t utf8_offset(const std::string& s, size_t cp) {
    size_t n = 0;
    for (size_t i = 0; i < s.size(); i++) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (n == cp) return i;
            n++;
        }
    }
    return s.size();
}

inline std::string utf8_head(const std::string& s, size_t cps) {
    return s.substr(0, utf8_offset(s, cps));
}

inline std::string utf8_tail(const std::string& s, size_t cps) {
    size_t len = utf8_length(s);
    if (cps >= len) return s;
    return s.substr(utf8_offset(s, len - cps));
}

// ── Log level (set once from config at startup) ──

enum class LogLevel { none = 0, info = 1, debug = 2 };

inline std::atomic<int>& log_level_storage() {
    static std::atomic<int> level{static_cast<int>(LogLevel::info)};
    return level;
}

inline void set_log_level(LogLevel level) {
    log_level_storage() = static_cast<int>(level);
}

inline LogLevel parse_log_level(const std::string& s) {
    if (s == "none") return LogLevel::none;
    if (s == "debug") return LogLevel::debug;
    return LogLevel::info;
}

inline bool log_enabled(LogLevel level) {
    return log_level_storage().load() >= static_cast<int>(level);
}

} // namespace strata
