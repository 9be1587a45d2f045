#pragma once

#include "replistore/backend.hpp"
#include "replistore/constants.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace replistore {

// Shared cancellation flag. Waiters in wait_for() wake as soon as cancel()
// is called.
class CancellationToken {
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Sleep for up to `duration`. Returns false if cancelled before or during the wait.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

struct RetryPolicy {
    uint32_t max_retries = constants::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds initial_delay = constants::DEFAULT_RETRY_INITIAL_DELAY;
    std::chrono::milliseconds max_delay = constants::DEFAULT_RETRY_MAX_DELAY;
    double backoff_multiplier = constants::DEFAULT_RETRY_BACKOFF_MULTIPLIER;

    // Delay before retry number `attempt` (1-based), capped at max_delay
    std::chrono::milliseconds delay_for(uint32_t attempt) const;
};

void log_retry(const std::string& what,
               uint32_t attempt,
               uint32_t max_retries,
               const BackendResult& failure,
               std::chrono::milliseconds delay);

// Run `call` until it succeeds, fails with a permanent error, or the retry
// budget is spent. `call` returns any BackendResult-derived type. The backoff
// sleep is interrupted by cancellation, in which case the last failure is
// returned with ErrorKind::Cancelled.
template <typename Call>
auto retry_call(const RetryPolicy& policy,
                const CancellationToken* cancel,
                const std::string& what,
                Call&& call) -> decltype(call()) {
    using Result = decltype(call());

    for (uint32_t attempt = 0;; ++attempt) {
        if (cancel && cancel->cancelled()) {
            return failure_as<Result>(ErrorKind::Cancelled, what + " cancelled");
        }

        Result result = call();
        if (result.success || !is_transient(result.error) || attempt >= policy.max_retries) {
            return result;
        }

        auto delay = policy.delay_for(attempt + 1);
        log_retry(what, attempt + 1, policy.max_retries, result, delay);

        if (cancel) {
            if (!cancel->wait_for(delay)) {
                return failure_as<Result>(ErrorKind::Cancelled, what + " cancelled");
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace replistore
