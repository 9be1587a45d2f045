#include "replistore/progress.hpp"
#include "replistore/log.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

namespace replistore {

// ============================================================================
// ProgressTracker
// ============================================================================

ProgressTracker::ProgressTracker(PublishHook hook, const ProgressConfig& config, Clock clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    , hook_(std::move(hook)) {}

void ProgressTracker::set_hook(PublishHook hook) {
    std::lock_guard lock(mutex_);
    hook_ = std::move(hook);
}

void ProgressTracker::begin(const std::string& job_id, const std::string& backend,
                            uint64_t total) {
    auto now = clock_();
    std::lock_guard lock(mutex_);

    auto [it, inserted] = entries_.try_emplace({job_id, backend});
    if (!inserted) return;
    it->second.total = total;
    it->second.started = now;
    it->second.last_sample = now;

    if (backend.empty()) return;

    auto [agg, agg_inserted] = entries_.try_emplace({job_id, ""});
    if (agg_inserted) {
        agg->second.started = now;
        agg->second.last_sample = now;
    }
    agg->second.total += total;
    agg->second.open_backends++;
    agg->second.complete = false;
}

void ProgressTracker::update(const std::string& job_id, const std::string& backend,
                             uint64_t delta) {
    auto now = clock_();
    std::vector<ProgressSnapshot> out;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find({job_id, backend});
        if (it == entries_.end() || it->second.complete) return;

        auto& entry = it->second;
        uint64_t applied = std::min(delta, entry.total - entry.bytes);
        entry.bytes += applied;
        maybe_publish(it->first, entry, now, out);

        if (!backend.empty()) {
            auto agg = entries_.find({job_id, ""});
            if (agg != entries_.end()) {
                agg->second.bytes += applied;
                maybe_publish(agg->first, agg->second, now, out);
            }
        }
    }
    emit(out);
}

void ProgressTracker::finish(const std::string& job_id, const std::string& backend) {
    auto now = clock_();
    std::vector<ProgressSnapshot> out;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find({job_id, backend});
        if (it == entries_.end() || it->second.complete) return;

        auto& entry = it->second;
        uint64_t remaining = entry.total - entry.bytes;
        entry.bytes = entry.total;
        entry.complete = true;
        sample(entry, now);
        out.push_back(make_snapshot(it->first, entry, now));

        if (!backend.empty()) {
            auto agg = entries_.find({job_id, ""});
            if (agg != entries_.end()) {
                agg->second.bytes += remaining;
                agg->second.open_backends--;
                if (agg->second.open_backends <= 0) {
                    agg->second.complete = true;
                    sample(agg->second, now);
                    out.push_back(make_snapshot(agg->first, agg->second, now));
                } else {
                    maybe_publish(agg->first, agg->second, now, out);
                }
            }
        }
    }
    emit(out);
}

void ProgressTracker::discard(const std::string& job_id, const std::string& backend) {
    auto now = clock_();
    std::vector<ProgressSnapshot> out;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find({job_id, backend});
        if (it == entries_.end()) return;

        bool was_open = !it->second.complete;
        uint64_t total = it->second.total;
        uint64_t bytes = it->second.bytes;
        entries_.erase(it);

        if (!backend.empty()) {
            auto agg = entries_.find({job_id, ""});
            if (agg != entries_.end()) {
                auto& entry = agg->second;
                entry.total -= std::min(entry.total, total);
                entry.bytes -= std::min(entry.bytes, bytes);
                if (was_open) entry.open_backends--;

                // The last running backend gave up; the job is over either way
                if (was_open && entry.open_backends <= 0 && !entry.complete &&
                    has_backends(job_id)) {
                    entry.complete = true;
                    sample(entry, now);
                    out.push_back(make_snapshot(agg->first, entry, now));
                }
            }
        }
    }
    emit(out);
}

std::optional<ProgressSnapshot> ProgressTracker::snapshot(const std::string& job_id,
                                                          const std::string& backend) const {
    auto now = clock_();
    std::lock_guard lock(mutex_);
    auto it = entries_.find({job_id, backend});
    if (it == entries_.end()) return std::nullopt;
    return make_snapshot(it->first, it->second, now);
}

void ProgressTracker::end_job(const std::string& job_id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.lower_bound({job_id, ""});
    while (it != entries_.end() && it->first.first == job_id) {
        it = entries_.erase(it);
    }
}

bool ProgressTracker::has_backends(const std::string& job_id) const {
    auto it = entries_.upper_bound({job_id, ""});
    return it != entries_.end() && it->first.first == job_id;
}

size_t ProgressTracker::active_keys() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void ProgressTracker::sample(Entry& entry, TimePoint now) const {
    auto dt = now - entry.last_sample;
    if (dt < config_.sample_interval || dt.count() <= 0) return;

    double secs = std::chrono::duration<double>(dt).count();
    double instant = static_cast<double>(entry.bytes - entry.last_sample_bytes) / secs;
    entry.speed = entry.speed
        ? config_.ewma_alpha * instant + (1.0 - config_.ewma_alpha) * *entry.speed
        : instant;
    entry.last_sample = now;
    entry.last_sample_bytes = entry.bytes;
}

ProgressSnapshot ProgressTracker::make_snapshot(const Key& key, const Entry& entry,
                                                TimePoint now) const {
    ProgressSnapshot snap;
    snap.job_id = key.first;
    snap.backend = key.second;
    snap.bytes_transferred = entry.bytes;
    snap.total_bytes = entry.total;
    snap.complete = entry.complete;
    snap.percent = entry.total > 0
        ? 100.0 * static_cast<double>(entry.bytes) / static_cast<double>(entry.total)
        : (entry.complete ? 100.0 : 0.0);
    snap.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.started);

    if (entry.speed) {
        snap.speed = *entry.speed;
    } else {
        // Average since start until the first full sample window
        double secs = std::chrono::duration<double>(now - entry.started).count();
        snap.speed = secs > 0.0 ? static_cast<double>(entry.bytes) / secs : 0.0;
    }

    if (entry.complete) {
        snap.eta = std::chrono::seconds(0);
    } else if (snap.speed > 0.0) {
        double remaining = static_cast<double>(entry.total - entry.bytes);
        snap.eta = std::chrono::seconds(static_cast<int64_t>(remaining / snap.speed + 0.5));
    }
    return snap;
}

bool ProgressTracker::should_publish(const Entry& entry, double percent, TimePoint now) const {
    if (entry.complete || !entry.published) return true;
    if (now - entry.last_publish >= config_.min_interval) return true;
    return percent - entry.last_publish_percent >= config_.min_percent_delta;
}

void ProgressTracker::maybe_publish(const Key& key, Entry& entry, TimePoint now,
                                    std::vector<ProgressSnapshot>& out) {
    sample(entry, now);
    auto snap = make_snapshot(key, entry, now);
    if (!should_publish(entry, snap.percent, now)) return;

    entry.published = true;
    entry.last_publish = now;
    entry.last_publish_percent = snap.percent;
    out.push_back(std::move(snap));
}

void ProgressTracker::emit(const std::vector<ProgressSnapshot>& snapshots) const {
    if (snapshots.empty()) return;
    PublishHook hook;
    {
        std::lock_guard lock(mutex_);
        hook = hook_;
    }
    if (!hook) return;
    for (const auto& snap : snapshots) {
        hook(snap);
    }
}

// ============================================================================
// ProgressDispatcher
// ============================================================================

ProgressDispatcher::ProgressDispatcher()
    : consumer_(&ProgressDispatcher::consumer_loop, this) {}

ProgressDispatcher::~ProgressDispatcher() {
    stop();
}

uint64_t ProgressDispatcher::subscribe(Subscriber subscriber) {
    std::lock_guard lock(mutex_);
    uint64_t id = next_id_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

void ProgressDispatcher::unsubscribe(uint64_t id) {
    std::lock_guard lock(mutex_);
    subscribers_.erase(id);
}

void ProgressDispatcher::publish(const ProgressSnapshot& snapshot) {
    {
        std::lock_guard lock(mutex_);
        if (!running_) return;
        queue_.push_back(snapshot);
        enqueued_++;
    }
    cv_.notify_one();
}

void ProgressDispatcher::flush() {
    std::unique_lock lock(mutex_);
    uint64_t target = enqueued_;
    idle_cv_.wait(lock, [this, target] { return delivered_ >= target; });
}

void ProgressDispatcher::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (consumer_.joinable()) {
        consumer_.join();
    }
    idle_cv_.notify_all();
}

ProgressTracker::PublishHook ProgressDispatcher::hook() {
    return [this](const ProgressSnapshot& snapshot) { publish(snapshot); };
}

void ProgressDispatcher::consumer_loop() {
    std::unique_lock lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
        if (queue_.empty() && !running_) break;

        auto snapshot = std::move(queue_.front());
        queue_.pop_front();
        auto subscribers = subscribers_;
        lock.unlock();

        for (const auto& [id, subscriber] : subscribers) {
            try {
                subscriber(snapshot);
            } catch (const std::exception& e) {
                log_warn("Progress subscriber %llu failed: %s",
                         static_cast<unsigned long long>(id), e.what());
            }
        }

        lock.lock();
        delivered_++;
        idle_cv_.notify_all();
    }
}

// ============================================================================
// Formatting
// ============================================================================

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    return buf;
}

std::string format_duration(std::chrono::seconds duration) {
    long long total = duration.count();
    if (total <= 0) return "00:00";

    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    char buf[32];
    if (hours > 0) {
        snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", hours, minutes, seconds);
    } else {
        snprintf(buf, sizeof(buf), "%02lld:%02lld", minutes, seconds);
    }
    return buf;
}

std::string progress_bar(double percent, int width) {
    double clamped = std::clamp(percent, 0.0, 100.0);
    int filled = static_cast<int>(width * clamped / 100.0);
    return "[" + std::string(filled, '#') + std::string(width - filled, '.') + "]";
}

std::string format_progress(const ProgressSnapshot& snapshot) {
    char pct[16];
    snprintf(pct, sizeof(pct), "%5.1f%%", snapshot.percent);

    std::string line = (snapshot.backend.empty() ? std::string("total") : snapshot.backend) +
                       " " + progress_bar(snapshot.percent) + " " + pct + " " +
                       format_bytes(snapshot.bytes_transferred) + " / " +
                       format_bytes(snapshot.total_bytes) + " @ " +
                       format_bytes(static_cast<uint64_t>(snapshot.speed)) + "/s";
    if (snapshot.complete) {
        line += " done in " + format_duration(
            std::chrono::duration_cast<std::chrono::seconds>(snapshot.elapsed));
    } else if (snapshot.eta) {
        line += " ETA " + format_duration(*snapshot.eta);
    }
    return line;
}

}  // namespace replistore
