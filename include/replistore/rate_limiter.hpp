#pragma once

#include "replistore/constants.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace replistore {

struct RateLimiterConfig {
    size_t limit = constants::DEFAULT_RATE_LIMIT;
    std::chrono::milliseconds period = constants::DEFAULT_RATE_PERIOD;
    std::chrono::milliseconds reap_interval{0};     ///< 0 = same as period
};

/// Sliding-window admission control keyed by caller identity.
///
/// Each identity owns a window of admission timestamps. A call is admitted
/// when fewer than `limit` timestamps fall within the trailing `period`.
/// Windows whose newest timestamp is older than `period` carry no state worth
/// keeping and are evicted lazily. State is in-memory only.
class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit RateLimiter(const RateLimiterConfig& config = {}, Clock clock = {});

    /// Admit or deny one call for `identity`, recording it when admitted.
    bool allow(const std::string& identity);

    /// Calls still available to `identity` in the current window.
    size_t remaining(const std::string& identity);

    /// Drop windows with no timestamp inside the trailing period.
    /// Returns the number of windows removed.
    size_t reap_idle();

    size_t window_count() const;

    const RateLimiterConfig& config() const { return config_; }

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    void prune(std::deque<TimePoint>& window, TimePoint now) const;
    size_t reap_locked(TimePoint now);

    RateLimiterConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<TimePoint>> windows_;
    TimePoint last_reap_;
};

} // namespace replistore
