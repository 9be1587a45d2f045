#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace replistore {

class ProgressTracker;
class RateLimiter;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports transfer metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread periodically serializes the registry to the
/// .prom file using atomic temp+rename. Counters are incremented directly by
/// the engine; gauges are sampled from the attached tracker and limiter on
/// each write.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Sources for gauge snapshots (not owned). Detaching (nullptr) waits
    /// for a sample in progress, so the source may be destroyed right after.
    void set_progress(const ProgressTracker* progress);
    void set_rate_limiter(const RateLimiter* limiter);

    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    /// Count one job by final status name ("fully_replicated", "degraded", ...)
    void record_job(const std::string& status);

    /// Count one backend pipeline outcome ("committed", "failed", "cancelled")
    void record_backend_upload(const std::string& backend, const std::string& result);

    // --- Counter accessors ---
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& failovers_total() { return *failovers_total_; }
    prometheus::Counter& rate_limited_total() { return *rate_limited_total_; }
    prometheus::Counter& tokens_issued_total() { return *tokens_issued_total_; }
    prometheus::Counter& token_rejections_total() { return *token_rejections_total_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Held while sampling gauges
    std::mutex sources_mutex_;
    const ProgressTracker* progress_ = nullptr;
    const RateLimiter* limiter_ = nullptr;

    // --- Labelled families ---
    prometheus::Family<prometheus::Counter>* jobs_family_;
    prometheus::Family<prometheus::Counter>* backend_uploads_family_;

    // --- Counters ---
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* failovers_total_;
    prometheus::Counter* rate_limited_total_;
    prometheus::Counter* tokens_issued_total_;
    prometheus::Counter* token_rejections_total_;

    // --- Gauges ---
    prometheus::Gauge* active_transfers_;
    prometheus::Gauge* rate_limit_windows_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace replistore
