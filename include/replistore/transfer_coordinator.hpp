#pragma once

#include "replistore/backend.hpp"
#include "replistore/chunk_planner.hpp"
#include "replistore/constants.hpp"
#include "replistore/retry.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace replistore {

class ProgressTracker;

/// One replicated upload request. Owned by the caller for the duration of
/// TransferCoordinator::upload(); never persisted.
struct TransferJob {
    std::string job_id;
    std::string object_name;            ///< Logical name within the owner's namespace
    std::string object_key;             ///< Storage key; object_name when empty
    std::filesystem::path local_source_path;
    uint64_t declared_size = 0;
    std::string owner_identity;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();

    const std::string& key() const { return object_key.empty() ? object_name : object_key; }
};

enum class OutcomeState {
    Committed,
    Failed,
    Cancelled
};

const char* outcome_state_name(OutcomeState state);

/// Result of one backend's upload pipeline.
struct BackendOutcome {
    std::string backend;
    OutcomeState state = OutcomeState::Failed;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    std::string upload_id;
    std::string etag;
    bool multipart = false;
    size_t parts_total = 0;
    size_t parts_committed = 0;
    uint64_t bytes_transferred = 0;
    bool aborted = false;
    std::chrono::milliseconds duration{0};

    bool committed() const { return state == OutcomeState::Committed; }
};

enum class JobStatus {
    FullyReplicated,
    Degraded,
    Failed,
    Rejected
};

const char* job_status_name(JobStatus status);

struct JobResult {
    std::string job_id;
    std::string object_key;
    JobStatus status = JobStatus::Failed;
    bool success = false;
    bool degraded = false;
    size_t quorum = 0;
    std::vector<BackendOutcome> outcomes;
    std::string token;                  ///< Set by TransferEngine on success
    std::string error_message;          ///< Input rejection or quorum failure summary
    std::chrono::system_clock::time_point started_at;
    std::chrono::milliseconds duration{0};

    size_t committed_count() const;
    std::vector<std::string> failed_backends() const;
};

struct UploadOptions {
    size_t quorum = constants::DEFAULT_QUORUM;
    const CancellationToken* cancel = nullptr;
    RetryPolicy retry;                  ///< max_retries is taken from each BackendTarget
    uint32_t target_part_count = constants::DEFAULT_TARGET_PART_COUNT;
    uint64_t max_object_size = constants::DEFAULT_MAX_OBJECT_SIZE;
};

/// Uploads one local file to N backends concurrently.
///
/// Each backend gets its own pipeline: a plan from its part-size limits,
/// then either a single put or a multipart sequence that always ends in
/// complete or abort. Pipelines never cancel one another; the job succeeds
/// when at least `quorum` backends commit.
class TransferCoordinator {
public:
    explicit TransferCoordinator(ProgressTracker* progress = nullptr);

    JobResult upload(const TransferJob& job,
                     const std::vector<std::shared_ptr<BackendClient>>& backends,
                     const UploadOptions& options = {}) const;

private:
    class SourceFile;

    std::string validate(const TransferJob& job,
                         const std::vector<std::shared_ptr<BackendClient>>& backends,
                         const UploadOptions& options) const;

    BackendOutcome run_pipeline(const TransferJob& job,
                                BackendClient& backend,
                                const SourceFile& source,
                                const UploadOptions& options) const;

    void upload_single(const TransferJob& job,
                       BackendClient& backend,
                       const SourceFile& source,
                       const RetryPolicy& retry,
                       const UploadOptions& options,
                       BackendOutcome& outcome) const;

    void upload_multipart(const TransferJob& job,
                          BackendClient& backend,
                          const SourceFile& source,
                          ChunkPlan& plan,
                          const RetryPolicy& retry,
                          const UploadOptions& options,
                          BackendOutcome& outcome) const;

    ProgressTracker* progress_;
};

}  // namespace replistore
