#include "errors.hpp"
#include <cctype>
#include <initializer_list>

namespace strata {

const char* to_string(ProviderErrorKind kind) {
    switch (kind) {
    case ProviderErrorKind::auth:             return "auth";
    case ProviderErrorKind::rate_limit:       return "rate_limit";
    case ProviderErrorKind::network:          return "network";
    case ProviderErrorKind::timeout:          return "timeout";
    case ProviderErrorKind::overloaded:       return "overloaded";
    case ProviderErrorKind::context_overflow: return "context_overflow";
    case ProviderErrorKind::billing:          return "billing";
    default:                                  return "unknown";
    }
}

static bool text_contains_any(const std::string& text, std::initializer_list<const char*> patterns) {
    for (auto p : patterns) {
        if (text.find(p) != std::string::npos) return true;
    }
    return false;
}

ProviderErrorKind classify_provider_error(const std::string& error_text) {
    if (error_text.empty()) return ProviderErrorKind::unknown;

    std::string lower;
    lower.reserve(error_text.size());
    for (char c : error_text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (text_contains_any(lower, {"rate limit", "rate_limit", "too many requests", "429",
                                   "quota exceeded", "resource_exhausted"}))
        return ProviderErrorKind::rate_limit;

    if (text_contains_any(lower, {"overloaded", "502", "503", "529"}))
        return ProviderErrorKind::overloaded;

    if (text_contains_any(lower, {"context window", "context length", "prompt too large",
                                   "maximum context", "token limit", "too many tokens"}))
        return ProviderErrorKind::context_overflow;

    if (text_contains_any(lower, {"timeout", "timed out", "deadline exceeded"}))
        return ProviderErrorKind::timeout;

    if (text_contains_any(lower, {"401", "403", "unauthorized", "forbidden",
                                   "invalid api key", "invalid_api_key", "authentication"}))
        return ProviderErrorKind::auth;

    if (text_contains_any(lower, {"402", "payment required", "insufficient credits",
                                   "billing", "insufficient balance"}))
        return ProviderErrorKind::billing;

    if (text_contains_any(lower, {"connection", "could not resolve", "network", "unreachable"}))
        return ProviderErrorKind::network;

    return ProviderErrorKind::unknown;
}

bool is_retryable_error(ProviderErrorKind kind) {
    return kind == ProviderErrorKind::rate_limit ||
           kind == ProviderErrorKind::network ||
           kind == ProviderErrorKind::timeout ||
           kind == ProviderErrorKind::overloaded;
}

} // namespace strata
