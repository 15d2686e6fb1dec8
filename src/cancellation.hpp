#pragma once
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>

namespace strata {

// Cooperative cancellation. Copies share one flag; an optional external flag
// (set from a signal handler) is observed as well.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }

    bool cancelled() const {
        return flag_->load() || (linked_ && linked_->load());
    }

    void throw_if_cancelled() const {
        if (cancelled()) throw CancelledError();
    }

    void link(const std::atomic<bool>* external) { linked_ = external; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    const std::atomic<bool>* linked_ = nullptr;
};

enum class WaitResult { ready, cancelled, timed_out };

// Runs fn on a detached thread. The returned future does not block on
// destruction, so a caller may abandon it; fn must own everything it touches.
template <typename Fn>
std::future<std::invoke_result_t<Fn>> spawn_detached(Fn fn) {
    using R = std::invoke_result_t<Fn>;
    std::packaged_task<R()> task(std::move(fn));
    auto fut = task.get_future();
    std::thread(std::move(task)).detach();
    return fut;
}

// timeout of zero waits without a deadline.
template <typename R>
WaitResult wait_cancellable(std::future<R>& fut, const CancellationToken& token,
                            std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (fut.wait_for(std::chrono::milliseconds(20)) == std::future_status::ready)
            return WaitResult::ready;
        if (token.cancelled()) return WaitResult::cancelled;
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline)
            return WaitResult::timed_out;
    }
}

// Sleep that wakes early on cancellation.
inline void sleep_cancellable(std::chrono::milliseconds d, const CancellationToken& token) {
    auto deadline = std::chrono::steady_clock::now() + d;
    while (std::chrono::steady_clock::now() < deadline) {
        token.throw_if_cancelled();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    token.throw_if_cancelled();
}

} // namespace strata
