#include "replistore/metrics.hpp"
#include "replistore/log.hpp"
#include "replistore/progress.hpp"
#include "replistore/rate_limiter.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace replistore {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    // --- Counters ---

    jobs_family_ = &prometheus::BuildCounter()
        .Name("replistore_jobs_total")
        .Help("Upload jobs by final status")
        .Labels(labels)
        .Register(*registry_);

    backend_uploads_family_ = &prometheus::BuildCounter()
        .Name("replistore_backend_uploads_total")
        .Help("Per-backend upload pipelines by outcome")
        .Labels(labels)
        .Register(*registry_);

    upload_bytes_total_ = &counter_reg("replistore_upload_bytes_total",
                                       "Total bytes committed to backends");

    auto& downloads_family = prometheus::BuildCounter()
        .Name("replistore_downloads_total")
        .Help("Downloads by result")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});

    download_bytes_total_ = &counter_reg("replistore_download_bytes_total",
                                         "Total bytes downloaded");
    failovers_total_ = &counter_reg("replistore_failovers_total",
                                    "Backends skipped before a download succeeded");
    rate_limited_total_ = &counter_reg("replistore_rate_limited_total",
                                       "Requests denied by the rate limiter");
    tokens_issued_total_ = &counter_reg("replistore_tokens_issued_total",
                                        "Access tokens issued");
    token_rejections_total_ = &counter_reg("replistore_token_rejections_total",
                                           "Access tokens rejected");

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    active_transfers_ = &gauge_reg("replistore_active_transfers",
                                   "Transfers currently tracked for progress");
    rate_limit_windows_ = &gauge_reg("replistore_rate_limit_windows",
                                     "Identities with a live rate-limit window");

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("replistore_upload_duration_seconds")
        .Help("Upload job duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600, 1800});

    download_duration_ = &prometheus::BuildHistogram()
        .Name("replistore_download_duration_seconds")
        .Help("Download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    update_gauges();
    write_file();
}

void MetricsExporter::record_job(const std::string& status) {
    jobs_family_->Add({{"status", status}}).Increment();
}

void MetricsExporter::record_backend_upload(const std::string& backend,
                                            const std::string& result) {
    backend_uploads_family_->Add({{"backend", backend}, {"result", result}}).Increment();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::set_progress(const ProgressTracker* progress) {
    std::lock_guard lock(sources_mutex_);
    progress_ = progress;
}

void MetricsExporter::set_rate_limiter(const RateLimiter* limiter) {
    std::lock_guard lock(sources_mutex_);
    limiter_ = limiter;
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(sources_mutex_);
    if (progress_) {
        active_transfers_->Set(static_cast<double>(progress_->active_keys()));
    }
    if (limiter_) {
        rate_limit_windows_->Set(static_cast<double>(limiter_->window_count()));
    }
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_warn("Failed writing metrics file %s", tmp_path.c_str());
        return;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename %s: %s", tmp_path.c_str(), ec.message().c_str());
    }
}

}  // namespace replistore
