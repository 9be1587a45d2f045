#pragma once

#include "replistore/access_token.hpp"
#include "replistore/backend.hpp"
#include "replistore/engine_config.hpp"
#include "replistore/failover_resolver.hpp"
#include "replistore/progress.hpp"
#include "replistore/ranged_downloader.hpp"
#include "replistore/rate_limiter.hpp"
#include "replistore/retry.hpp"
#include "replistore/transfer_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace replistore {

class MetricsExporter;

/// Runtime settings of a TransferEngine, decoupled from how they were
/// configured.
struct EngineSettings {
    size_t quorum = constants::DEFAULT_QUORUM;
    uint32_t target_part_count = constants::DEFAULT_TARGET_PART_COUNT;
    uint64_t max_object_size = constants::DEFAULT_MAX_OBJECT_SIZE;
    uint64_t download_chunk_size = constants::DEFAULT_DOWNLOAD_CHUNK_SIZE;
    RetryPolicy retry;
    RateLimiterConfig rate_limit;
    std::string token_secret;
    std::chrono::seconds token_ttl = constants::DEFAULT_TOKEN_TTL;
    std::chrono::seconds share_link_ttl = constants::DEFAULT_SHARE_LINK_TTL;
    std::filesystem::path scratch_dir;
    ProgressConfig progress;

    static EngineSettings from_config(const EngineConfig& config);
};

struct ShareLinkResult : BackendResult {
    std::string url;
    std::string backend;
    std::chrono::system_clock::time_point expires_at;
};

struct ObjectListing : BackendResult {
    std::string backend;
    std::vector<ListEntry> entries;     ///< Keys relative to the owner's namespace
};

struct DeleteOutcome {
    std::string backend;
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

struct DeleteResult {
    bool success = false;               ///< Every backend deleted (or never had) the object
    std::string object_key;
    std::string error_message;
    std::vector<DeleteOutcome> outcomes;
};

/// Per-job scratch directory, removed with its contents on destruction.
/// Throws std::filesystem::filesystem_error if it cannot be created.
class ScratchDir {
public:
    ScratchDir(const std::filesystem::path& root, const std::string& job_id);
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// Move `from` onto `to`, copying when they sit on different filesystems.
/// On failure `to` is left as it was and `ec` holds the error.
void move_into_place(const std::filesystem::path& from, const std::filesystem::path& to,
                     std::error_code& ec);

/// Copy `from` to a temporary sibling of `to`, then rename it over `to`.
/// A failed copy never leaves a partial file behind.
void copy_into_place(const std::filesystem::path& from, const std::filesystem::path& to,
                     std::error_code& ec);

/// Caller-facing facade over the transfer components.
///
/// Objects live under "users/<owner>/<sanitized name>" on every backend.
/// Uploads replicate to all configured backends, downloads fail over by
/// priority, and successful uploads hand back a capability token for the
/// object. The engine owns its progress dispatcher; subscribers run on the
/// dispatcher thread, never on transfer workers.
class TransferEngine {
public:
    /// Throws std::invalid_argument when `backends` is empty or the token
    /// secret is missing.
    TransferEngine(std::vector<std::shared_ptr<BackendClient>> backends,
                   const EngineSettings& settings,
                   MetricsExporter* metrics = nullptr);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /// Build backends from a validated config. Throws std::invalid_argument.
    static std::vector<std::shared_ptr<BackendClient>> create_backends(const EngineConfig& config);

    // --- Uploads ---

    /// Replicate job.local_source_path to every configured backend.
    /// `quorum` 0 selects the configured quorum.
    JobResult upload(TransferJob job, size_t quorum = 0,
                     const CancellationToken* cancel = nullptr);

    /// Replicate to an explicit subset of backends.
    JobResult upload(TransferJob job,
                     const std::vector<std::shared_ptr<BackendClient>>& backends,
                     size_t quorum = 0,
                     const CancellationToken* cancel = nullptr);

    /// Spool `in` into a scratch file, then upload it. Exactly
    /// `declared_size` bytes must be readable from the stream.
    JobResult upload_stream(const std::string& owner,
                            const std::string& object_name,
                            uint64_t declared_size,
                            std::istream& in,
                            size_t quorum = 0,
                            const CancellationToken* cancel = nullptr);

    /// Job for a local file, with size and id filled in.
    TransferJob make_job(const std::string& owner,
                         const std::string& object_name,
                         const std::filesystem::path& source) const;

    // --- Downloads ---

    DownloadResult download(const std::string& owner,
                            const std::string& object_name,
                            const std::filesystem::path& destination,
                            const CancellationToken* cancel = nullptr);

    /// Any token that does not verify yields the same "invalid token" error.
    DownloadResult download_with_token(const std::string& token,
                                       const std::filesystem::path& destination,
                                       const CancellationToken* cancel = nullptr);

    // --- Sharing and object management ---

    /// `ttl` 0 selects the configured share link lifetime.
    ShareLinkResult issue_share_link(const std::string& owner,
                                     const std::string& object_name,
                                     std::chrono::seconds ttl = std::chrono::seconds{0});

    ObjectListing list_objects(const std::string& owner) const;

    DeleteResult delete_object(const std::string& owner, const std::string& object_name);

    std::optional<TokenClaims> verify_token(const std::string& token) const;

    // --- Admission and progress ---

    bool allow(const std::string& identity);

    uint64_t subscribe_progress(ProgressDispatcher::Subscriber callback);
    void unsubscribe_progress(uint64_t id);

    /// Block until all progress published so far reached subscribers.
    void flush_progress();

    // --- Naming ---

    /// Strip traversal sequences and unsafe characters, cap the length at
    /// 200 characters keeping the extension. Empty when nothing usable is left.
    static std::string sanitize_object_name(const std::string& name);

    /// Owner identities are non-empty and limited to [A-Za-z0-9._@-],
    /// not starting with a dot.
    static bool valid_owner(const std::string& owner);

    /// "users/<owner>/<name>" for an already sanitized name
    static std::string object_key(const std::string& owner, const std::string& name);

    std::string new_job_id();

    const std::vector<std::shared_ptr<BackendClient>>& backends() const { return backends_; }
    const EngineSettings& settings() const { return settings_; }
    ProgressTracker& progress() { return progress_; }
    RateLimiter& rate_limiter() { return limiter_; }

private:
    JobResult reject(const TransferJob& job, const std::string& reason) const;
    void record_upload(const JobResult& result);
    void record_download(const DownloadResult& result);

    std::vector<std::shared_ptr<BackendClient>> backends_;
    EngineSettings settings_;
    MetricsExporter* metrics_;

    ProgressDispatcher dispatcher_;
    ProgressTracker progress_;
    RateLimiter limiter_;
    AccessTokenIssuer tokens_;
    TransferCoordinator coordinator_;
    RangedDownloader downloader_;
    FailoverResolver resolver_;

    std::atomic<uint64_t> job_counter_{0};
};

}  // namespace replistore
