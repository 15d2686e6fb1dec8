#include "provider_router.hpp"
#include "utils.hpp"
#include <iostream>

namespace strata {

std::pair<std::string, std::string> split_model(const std::string& model) {
    size_t colon = model.find(':');
    if (colon == std::string::npos) return {"", model};
    return {model.substr(0, colon), model.substr(colon + 1)};
}

ProviderRouter::ProviderRouter(const Config& cfg) : config_(cfg) {}

void ProviderRouter::register_provider(const std::string& name, std::shared_ptr<Provider> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(provider);
}

std::shared_ptr<Provider> ProviderRouter::resolve(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(name);
    if (it != providers_.end()) return it->second;

    auto pc = config_.providers.find(name);
    if (pc == config_.providers.end()) {
        throw ProviderError(ProviderErrorKind::unknown, name.empty() ? "router" : name,
                            "unknown provider (expected provider:model)");
    }
    auto p = std::make_shared<OpenAICompatProvider>(name, pc->second);
    providers_[name] = p;
    return p;
}

ProviderResponse ProviderRouter::send(ProviderRequest req, const CancellationToken& token) {
    auto [provider_name, model] = split_model(req.model);
    auto provider = resolve(provider_name);
    req.model = model;

    auto shared_req = std::make_shared<const ProviderRequest>(std::move(req));

    for (int retry = 0;; retry++) {
        token.throw_if_cancelled();

        // The worker owns the provider and the request, so it can be abandoned on cancel
        auto fut = spawn_detached([provider, shared_req]() { return provider->chat(*shared_req); });
        if (wait_cancellable(fut, token, std::chrono::milliseconds(0)) == WaitResult::cancelled) {
            throw CancelledError();
        }

        try {
            return fut.get();
        } catch (const ProviderError& e) {
            if (!e.retryable() || retry >= config_.max_retries) throw;
            int delay_ms = config_.retry_backoff_ms * (1 << retry);
            std::cerr << "[provider] " << e.what() << " (" << to_string(e.kind())
                      << "), retrying in " << delay_ms << " ms\n";
            sleep_cancellable(std::chrono::milliseconds(delay_ms), token);
        }
    }
}

} // namespace strata
