#pragma once
#include "cancellation.hpp"
#include "config.hpp"
#include "provider.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace strata {

// Splits "provider:model" at the first colon.
std::pair<std::string, std::string> split_model(const std::string& model);

// Routes requests to providers by model prefix and retries transient failures
// with exponential backoff. Auth and other permanent errors surface at once.
class ProviderRouter {
public:
    explicit ProviderRouter(const Config& cfg);

    // Overrides or adds a provider (tests use scripted fakes).
    void register_provider(const std::string& name, std::shared_ptr<Provider> provider);

    // req.model carries the "provider:model" form. Throws ProviderError or CancelledError.
    ProviderResponse send(ProviderRequest req, const CancellationToken& token);

private:
    const Config& config_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Provider>> providers_;

    std::shared_ptr<Provider> resolve(const std::string& name);
};

} // namespace strata
