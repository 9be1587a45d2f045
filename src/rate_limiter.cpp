#include "replistore/rate_limiter.hpp"

#include <algorithm>
#include <stdexcept>

namespace replistore {

RateLimiter::RateLimiter(const RateLimiterConfig& config, Clock clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    if (config_.limit == 0) {
        throw std::invalid_argument("Rate limit must be positive");
    }
    if (config_.period.count() <= 0) {
        throw std::invalid_argument("Rate period must be positive");
    }
    if (config_.reap_interval.count() <= 0) {
        config_.reap_interval = config_.period;
    }
    last_reap_ = clock_();
}

void RateLimiter::prune(std::deque<TimePoint>& window, TimePoint now) const {
    while (!window.empty() && now - window.front() >= config_.period) {
        window.pop_front();
    }
}

size_t RateLimiter::reap_locked(TimePoint now) {
    size_t removed = 0;
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (it->second.empty() || now - it->second.back() >= config_.period) {
            it = windows_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    last_reap_ = now;
    return removed;
}

bool RateLimiter::allow(const std::string& identity) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    if (now - last_reap_ >= config_.reap_interval) {
        reap_locked(now);
    }

    auto& window = windows_[identity];
    prune(window, now);

    if (window.size() >= config_.limit) {
        return false;
    }
    window.push_back(now);
    return true;
}

size_t RateLimiter::remaining(const std::string& identity) {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = windows_.find(identity);
    if (it == windows_.end()) {
        return config_.limit;
    }
    prune(it->second, now);
    return config_.limit - std::min(config_.limit, it->second.size());
}

size_t RateLimiter::reap_idle() {
    auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    return reap_locked(now);
}

size_t RateLimiter::window_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

} // namespace replistore
