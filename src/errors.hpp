#pragma once
#include <stdexcept>
#include <string>

namespace strata {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error("config: " + what) {}
};

class ServerUnavailable : public Error {
public:
    ServerUnavailable(const std::string& server, const std::string& reason)
        : Error("server '" + server + "' unavailable: " + reason), server_(server) {}
    const std::string& server() const { return server_; }
private:
    std::string server_;
};

class ToolTimeout : public Error {
public:
    ToolTimeout(const std::string& tool, const std::string& server, int seconds)
        : Error("tool '" + tool + "' on server '" + server + "' timed out after " +
                std::to_string(seconds) + "s"),
          tool_(tool), server_(server) {}
    const std::string& tool() const { return tool_; }
    const std::string& server() const { return server_; }
private:
    std::string tool_;
    std::string server_;
};

class ToolNotFound : public Error {
public:
    explicit ToolNotFound(const std::string& tool)
        : Error("no server provides tool '" + tool + "'"), tool_(tool) {}
    const std::string& tool() const { return tool_; }
private:
    std::string tool_;
};

class ToolNotAllowed : public Error {
public:
    ToolNotAllowed(const std::string& tool, const std::string& scope)
        : Error("tool '" + tool + "' is not allowed for " + scope), tool_(tool) {}
    const std::string& tool() const { return tool_; }
private:
    std::string tool_;
};

// Carries the full result so the caller can still accept it.
class ResponseTooLarge : public Error {
public:
    ResponseTooLarge(const std::string& tool, const std::string& server,
                     int tokens, int limit, std::string content)
        : Error("tool '" + tool + "' on server '" + server + "' returned ~" +
                std::to_string(tokens) + " tokens (limit " + std::to_string(limit) + ")"),
          tool_(tool), server_(server), tokens_(tokens), content_(std::move(content)) {}
    const std::string& tool() const { return tool_; }
    const std::string& server() const { return server_; }
    int tokens() const { return tokens_; }
    const std::string& content() const { return content_; }
private:
    std::string tool_;
    std::string server_;
    int tokens_;
    std::string content_;
};

enum class ProviderErrorKind {
    unknown,
    auth,
    rate_limit,
    network,
    timeout,
    overloaded,
    context_overflow,
    billing
};

const char* to_string(ProviderErrorKind kind);
ProviderErrorKind classify_provider_error(const std::string& error_text);
bool is_retryable_error(ProviderErrorKind kind);

class ProviderError : public Error {
public:
    ProviderError(ProviderErrorKind kind, const std::string& provider, const std::string& what)
        : Error(provider + ": " + what), kind_(kind), provider_(provider) {}
    ProviderErrorKind kind() const { return kind_; }
    const std::string& provider() const { return provider_; }
    bool retryable() const { return is_retryable_error(kind_); }
private:
    ProviderErrorKind kind_;
    std::string provider_;
};

class CancelledError : public Error {
public:
    CancelledError() : Error("operation cancelled") {}
};

} // namespace strata
