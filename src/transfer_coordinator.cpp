#include "replistore/transfer_coordinator.hpp"
#include "replistore/log.hpp"
#include "replistore/progress.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <future>
#include <optional>
#include <stdexcept>

namespace replistore {

const char* outcome_state_name(OutcomeState state) {
    switch (state) {
        case OutcomeState::Committed: return "committed";
        case OutcomeState::Failed: return "failed";
        case OutcomeState::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::FullyReplicated: return "fully_replicated";
        case JobStatus::Degraded: return "degraded";
        case JobStatus::Failed: return "failed";
        case JobStatus::Rejected: return "rejected";
    }
    return "unknown";
}

size_t JobResult::committed_count() const {
    size_t count = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.committed()) count++;
    }
    return count;
}

std::vector<std::string> JobResult::failed_backends() const {
    std::vector<std::string> names;
    for (const auto& outcome : outcomes) {
        if (!outcome.committed()) names.push_back(outcome.backend);
    }
    return names;
}

/// Read-only source opened once per job. All reads are positioned, so the
/// backend pipelines share the descriptor without a shared cursor.
class TransferCoordinator::SourceFile {
public:
    explicit SourceFile(const std::filesystem::path& path) {
        fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ < 0) {
            error_ = std::strerror(errno);
        }
    }

    ~SourceFile() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;

    bool is_open() const { return fd_ >= 0; }
    const std::string& error() const { return error_; }

    /// Size of a regular file, std::nullopt otherwise
    std::optional<uint64_t> size() const {
        struct stat st;
        if (::fstat(fd_, &st) != 0 || !S_ISREG(st.st_mode)) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(st.st_size);
    }

    /// Read exactly [offset, offset + length) into buffer
    bool read_at(uint64_t offset, uint64_t length, std::vector<uint8_t>& buffer) const {
        buffer.resize(length);
        uint64_t done = 0;
        while (done < length) {
            ssize_t n = ::pread(fd_, buffer.data() + done, length - done,
                                static_cast<off_t>(offset + done));
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            if (n == 0) {
                return false;   // file shrank underneath us
            }
            done += static_cast<uint64_t>(n);
        }
        return true;
    }

private:
    int fd_ = -1;
    std::string error_;
};

TransferCoordinator::TransferCoordinator(ProgressTracker* progress)
    : progress_(progress) {}

std::string TransferCoordinator::validate(
    const TransferJob& job,
    const std::vector<std::shared_ptr<BackendClient>>& backends,
    const UploadOptions& options) const {
    if (backends.empty()) {
        return "No backends configured";
    }
    for (const auto& backend : backends) {
        if (!backend) return "Null backend in target list";
    }
    if (options.quorum < 1 || options.quorum > backends.size()) {
        return "Quorum " + std::to_string(options.quorum) + " outside [1, " +
               std::to_string(backends.size()) + "]";
    }
    if (job.object_name.empty() || job.key().empty()) {
        return "Object name is empty";
    }
    if (job.declared_size == 0) {
        return "Declared size must be positive";
    }
    if (options.max_object_size > 0 && job.declared_size > options.max_object_size) {
        return "Object of " + std::to_string(job.declared_size) +
               " bytes exceeds the maximum of " + std::to_string(options.max_object_size);
    }
    if (options.target_part_count == 0) {
        return "Target part count must be positive";
    }
    return "";
}

JobResult TransferCoordinator::upload(
    const TransferJob& job,
    const std::vector<std::shared_ptr<BackendClient>>& backends,
    const UploadOptions& options) const {
    JobResult result;
    result.job_id = job.job_id;
    result.object_key = job.key();
    result.quorum = options.quorum;
    result.started_at = std::chrono::system_clock::now();
    auto start = std::chrono::steady_clock::now();

    auto reject = [&](const std::string& reason) {
        log_warn("Job %s rejected: %s", job.job_id.c_str(), reason.c_str());
        result.status = JobStatus::Rejected;
        result.success = false;
        result.error_message = reason;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    };

    if (auto error = validate(job, backends, options); !error.empty()) {
        return reject(error);
    }

    SourceFile source(job.local_source_path);
    if (!source.is_open()) {
        return reject("Cannot open source " + job.local_source_path.string() + ": " +
                      source.error());
    }
    auto actual_size = source.size();
    if (!actual_size) {
        return reject("Source is not a regular file: " + job.local_source_path.string());
    }
    if (*actual_size != job.declared_size) {
        return reject("Source size " + std::to_string(*actual_size) +
                      " does not match declared size " + std::to_string(job.declared_size));
    }

    log_info("Job %s: uploading %s (%llu bytes) to %zu backend(s), quorum %zu",
             job.job_id.c_str(), job.key().c_str(),
             static_cast<unsigned long long>(job.declared_size),
             backends.size(), options.quorum);

    std::vector<std::future<BackendOutcome>> futures;
    futures.reserve(backends.size());
    for (const auto& backend : backends) {
        futures.push_back(std::async(std::launch::async,
            [this, &job, &source, &options, backend]() {
                return run_pipeline(job, *backend, source, options);
            }));
    }

    for (auto& future : futures) {
        result.outcomes.push_back(future.get());
    }

    size_t committed = result.committed_count();
    result.success = committed >= options.quorum;
    if (committed == backends.size()) {
        result.status = JobStatus::FullyReplicated;
    } else if (result.success) {
        result.status = JobStatus::Degraded;
        result.degraded = true;
    } else {
        result.status = JobStatus::Failed;
        result.error_message = "Only " + std::to_string(committed) + " of " +
                               std::to_string(backends.size()) +
                               " backends committed, quorum is " +
                               std::to_string(options.quorum);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (result.status == JobStatus::FullyReplicated) {
        log_info("Job %s: fully replicated in %lld ms", job.job_id.c_str(),
                 static_cast<long long>(result.duration.count()));
    } else {
        std::string failed;
        for (const auto& name : result.failed_backends()) {
            if (!failed.empty()) failed += ", ";
            failed += name;
        }
        if (result.success) {
            log_warn("Job %s: degraded, failed backends: %s", job.job_id.c_str(), failed.c_str());
        } else {
            log_error("Job %s: failed, %s", job.job_id.c_str(), result.error_message.c_str());
        }
    }

    return result;
}

BackendOutcome TransferCoordinator::run_pipeline(const TransferJob& job,
                                                 BackendClient& backend,
                                                 const SourceFile& source,
                                                 const UploadOptions& options) const {
    BackendOutcome outcome;
    outcome.backend = backend.name();
    auto start = std::chrono::steady_clock::now();
    const auto& target = backend.target();

    RetryPolicy retry = options.retry;
    retry.max_retries = target.max_retries;

    ChunkPlan plan;
    try {
        PlanLimits limits;
        limits.min_part_size = target.min_part_size;
        limits.max_part_size = target.max_part_size;
        limits.max_parts = target.max_parts;
        limits.target_part_count = options.target_part_count;
        plan = plan_chunks(job.declared_size, limits);
    } catch (const std::invalid_argument& e) {
        outcome.state = OutcomeState::Failed;
        outcome.error = ErrorKind::InvalidInput;
        outcome.error_message = e.what();
        log_error("Job %s [%s]: cannot plan upload: %s",
                  job.job_id.c_str(), outcome.backend.c_str(), e.what());
        return outcome;
    }

    if (progress_) {
        progress_->begin(job.job_id, outcome.backend, job.declared_size);
    }

    // A single PUT buffers the whole object, so it is capped at one part
    bool single = !plan.multipart ||
                  (job.declared_size < target.multipart_threshold &&
                   job.declared_size <= target.max_part_size);
    if (single) {
        upload_single(job, backend, source, retry, options, outcome);
    } else {
        upload_multipart(job, backend, source, plan, retry, options, outcome);
    }

    if (progress_) {
        if (outcome.committed()) {
            progress_->finish(job.job_id, outcome.backend);
        } else {
            progress_->discard(job.job_id, outcome.backend);
        }
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!outcome.committed()) {
        log_warn("Job %s [%s]: %s (%s: %s)", job.job_id.c_str(), outcome.backend.c_str(),
                 outcome_state_name(outcome.state), error_kind_name(outcome.error),
                 outcome.error_message.c_str());
    }
    return outcome;
}

namespace {

void record_failure(BackendOutcome& outcome, const BackendResult& failure) {
    outcome.state = failure.error == ErrorKind::Cancelled ? OutcomeState::Cancelled
                                                          : OutcomeState::Failed;
    outcome.error = failure.error;
    outcome.error_message = failure.error_message;
}

}  // namespace

void TransferCoordinator::upload_single(const TransferJob& job,
                                        BackendClient& backend,
                                        const SourceFile& source,
                                        const RetryPolicy& retry,
                                        const UploadOptions& options,
                                        BackendOutcome& outcome) const {
    outcome.multipart = false;
    outcome.parts_total = 1;

    std::vector<uint8_t> buffer;
    if (!source.read_at(0, job.declared_size, buffer)) {
        record_failure(outcome, BackendResult::failed(ErrorKind::Io,
            "Failed to read source " + job.local_source_path.string()));
        return;
    }

    const std::string& key = job.key();
    auto put = retry_call(retry, options.cancel, "put " + outcome.backend + ":" + key,
        [&] { return backend.put_object(key, buffer); });
    if (!put.success) {
        record_failure(outcome, put);
        return;
    }

    outcome.state = OutcomeState::Committed;
    outcome.etag = put.etag;
    outcome.parts_committed = 1;
    outcome.bytes_transferred = job.declared_size;
    if (progress_) {
        progress_->update(job.job_id, outcome.backend, job.declared_size);
    }
}

void TransferCoordinator::upload_multipart(const TransferJob& job,
                                           BackendClient& backend,
                                           const SourceFile& source,
                                           ChunkPlan& plan,
                                           const RetryPolicy& retry,
                                           const UploadOptions& options,
                                           BackendOutcome& outcome) const {
    const std::string& key = job.key();
    const std::string label = outcome.backend + ":" + key;
    outcome.multipart = true;
    outcome.parts_total = plan.parts.size();

    auto initiated = retry_call(retry, options.cancel, "initiate " + label,
        [&] { return backend.initiate_multipart(key); });
    if (!initiated.success) {
        record_failure(outcome, initiated);
        return;
    }
    outcome.upload_id = initiated.upload_id;
    log_debug("Job %s [%s]: upload %s, %zu parts of %llu bytes",
              job.job_id.c_str(), outcome.backend.c_str(), outcome.upload_id.c_str(),
              plan.parts.size(), static_cast<unsigned long long>(plan.part_size));

    std::vector<CompletedPart> completed;
    completed.reserve(plan.parts.size());
    std::vector<uint8_t> buffer;
    bool failed = false;

    for (auto& part : plan.parts) {
        if (options.cancel && options.cancel->cancelled()) {
            record_failure(outcome, BackendResult::failed(ErrorKind::Cancelled,
                "Upload cancelled before part " + std::to_string(part.part_number)));
            failed = true;
            break;
        }

        part.state = PartState::InFlight;
        if (!source.read_at(part.offset, part.length, buffer)) {
            part.state = PartState::Failed;
            record_failure(outcome, BackendResult::failed(ErrorKind::Io,
                "Failed to read source range for part " + std::to_string(part.part_number)));
            failed = true;
            break;
        }

        auto uploaded = retry_call(retry, options.cancel,
            "part " + std::to_string(part.part_number) + " " + label,
            [&] { return backend.upload_part(key, outcome.upload_id, part.part_number, buffer); });
        if (!uploaded.success) {
            part.state = PartState::Failed;
            record_failure(outcome, uploaded);
            failed = true;
            break;
        }

        part.state = PartState::Committed;
        completed.push_back({part.part_number, uploaded.etag});
        outcome.parts_committed++;
        outcome.bytes_transferred += part.length;
        if (progress_) {
            progress_->update(job.job_id, outcome.backend, part.length);
        }
    }
    buffer.clear();
    buffer.shrink_to_fit();

    if (!failed) {
        auto done = retry_call(retry, options.cancel, "complete " + label,
            [&] { return backend.complete_multipart(key, outcome.upload_id, completed); });
        if (done.success) {
            outcome.state = OutcomeState::Committed;
            outcome.etag = done.etag;
            return;
        }
        record_failure(outcome, done);
    }

    // Abort runs even after cancellation so no incomplete upload is left behind
    auto aborted = retry_call(retry, nullptr, "abort " + label,
        [&] { return backend.abort_multipart(key, outcome.upload_id); });
    outcome.aborted = aborted.success;
    if (!aborted.success) {
        log_error("Job %s [%s]: abort of upload %s failed: %s",
                  job.job_id.c_str(), outcome.backend.c_str(), outcome.upload_id.c_str(),
                  aborted.error_message.c_str());
    }
}

}  // namespace replistore
