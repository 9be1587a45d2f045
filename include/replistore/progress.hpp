#pragma once

#include "replistore/constants.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace replistore {

/// Immutable view of one transfer's progress. An empty `backend` denotes the
/// aggregate over every backend of the job.
struct ProgressSnapshot {
    std::string job_id;
    std::string backend;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    double percent = 0.0;
    std::chrono::milliseconds elapsed{0};
    double speed = 0.0;                             ///< bytes/s, EWMA
    std::optional<std::chrono::seconds> eta;        ///< unknown while speed is zero
    bool complete = false;

    bool is_aggregate() const { return backend.empty(); }
};

struct ProgressConfig {
    std::chrono::milliseconds min_interval = constants::DEFAULT_PROGRESS_MIN_INTERVAL;
    std::chrono::milliseconds sample_interval = constants::DEFAULT_PROGRESS_SAMPLE_INTERVAL;
    double min_percent_delta = constants::DEFAULT_PROGRESS_MIN_PERCENT_DELTA;
    double ewma_alpha = constants::DEFAULT_PROGRESS_EWMA_ALPHA;
};

/// Thread-safe byte accounting for running transfers.
///
/// Workers report raw byte deltas; the tracker turns them into throttled
/// ProgressSnapshot values and hands them to the publish hook. The hook is
/// always invoked after the internal lock is released, so it may block or
/// re-enter the tracker.
class ProgressTracker {
public:
    using PublishHook = std::function<void(const ProgressSnapshot&)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ProgressTracker(PublishHook hook = {},
                             const ProgressConfig& config = {},
                             Clock clock = {});

    void set_hook(PublishHook hook);

    /// Start tracking (job_id, backend). Adds `total` to the job's aggregate.
    void begin(const std::string& job_id, const std::string& backend, uint64_t total);

    /// Record `delta` more bytes for (job_id, backend) and its aggregate.
    void update(const std::string& job_id, const std::string& backend, uint64_t delta);

    /// Mark (job_id, backend) complete. The aggregate completes once all of
    /// its backends have. Completion snapshots are never throttled.
    void finish(const std::string& job_id, const std::string& backend);

    /// Forget (job_id, backend), removing its contribution from the aggregate.
    /// Used when an attempt is abandoned (failed backend, download failover).
    /// If that leaves no backend running but some finished, the aggregate
    /// completes and publishes like finish().
    void discard(const std::string& job_id, const std::string& backend);

    /// Current, unthrottled snapshot. std::nullopt for unknown keys.
    std::optional<ProgressSnapshot> snapshot(const std::string& job_id,
                                             const std::string& backend = "") const;

    /// Drop all state for a job.
    void end_job(const std::string& job_id);

    size_t active_keys() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Key = std::pair<std::string, std::string>;

    struct Entry {
        uint64_t total = 0;
        uint64_t bytes = 0;
        TimePoint started;
        TimePoint last_sample;
        uint64_t last_sample_bytes = 0;
        std::optional<double> speed;
        TimePoint last_publish;
        double last_publish_percent = 0.0;
        bool published = false;
        bool complete = false;
        int open_backends = 0;          // aggregate only
    };

    // Caller holds mutex_. True if any per-backend entry remains for the job.
    bool has_backends(const std::string& job_id) const;

    void sample(Entry& entry, TimePoint now) const;
    ProgressSnapshot make_snapshot(const Key& key, const Entry& entry, TimePoint now) const;
    bool should_publish(const Entry& entry, double percent, TimePoint now) const;
    void maybe_publish(const Key& key, Entry& entry, TimePoint now,
                       std::vector<ProgressSnapshot>& out);
    void emit(const std::vector<ProgressSnapshot>& snapshots) const;

    ProgressConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;
    PublishHook hook_;
};

/// Delivers snapshots to subscribers on a single consumer thread.
///
/// publish() only enqueues, so worker threads never run presentation code.
/// stop() delivers everything already queued before joining.
class ProgressDispatcher {
public:
    using Subscriber = std::function<void(const ProgressSnapshot&)>;

    ProgressDispatcher();
    ~ProgressDispatcher();

    ProgressDispatcher(const ProgressDispatcher&) = delete;
    ProgressDispatcher& operator=(const ProgressDispatcher&) = delete;

    /// Returns an id for unsubscribe().
    uint64_t subscribe(Subscriber subscriber);
    void unsubscribe(uint64_t id);

    void publish(const ProgressSnapshot& snapshot);

    /// Block until every snapshot published so far has been delivered.
    void flush();

    void stop();

    /// Hook suitable for ProgressTracker.
    ProgressTracker::PublishHook hook();

private:
    void consumer_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<ProgressSnapshot> queue_;
    std::map<uint64_t, Subscriber> subscribers_;
    uint64_t next_id_ = 1;
    uint64_t enqueued_ = 0;
    uint64_t delivered_ = 0;
    bool running_ = true;
    std::thread consumer_;
};

/// "12.50 MB" (1024-based, B through TB)
std::string format_bytes(uint64_t bytes);

/// "MM:SS", or "HH:MM:SS" from one hour up; "00:00" for non-positive input
std::string format_duration(std::chrono::seconds duration);

/// Fixed-width bar, e.g. "[#####...............]"
std::string progress_bar(double percent, int width = 20);

/// One-line human rendering of a snapshot
std::string format_progress(const ProgressSnapshot& snapshot);

}  // namespace replistore
