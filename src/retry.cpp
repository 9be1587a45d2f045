#include "replistore/retry.hpp"
#include "replistore/log.hpp"

#include <algorithm>

namespace replistore {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled(); });
}

std::chrono::milliseconds RetryPolicy::delay_for(uint32_t attempt) const {
    double delay = static_cast<double>(initial_delay.count());
    for (uint32_t i = 1; i < attempt; ++i) {
        delay *= backoff_multiplier;
        if (delay >= static_cast<double>(max_delay.count())) {
            return max_delay;
        }
    }
    return std::min(std::chrono::milliseconds(static_cast<int64_t>(delay)), max_delay);
}

void log_retry(const std::string& what,
               uint32_t attempt,
               uint32_t max_retries,
               const BackendResult& failure,
               std::chrono::milliseconds delay) {
    log_warn("%s failed (%s: %s), retry %u/%u in %lld ms",
             what.c_str(), error_kind_name(failure.error), failure.error_message.c_str(),
             attempt, max_retries, static_cast<long long>(delay.count()));
}

} // namespace replistore
