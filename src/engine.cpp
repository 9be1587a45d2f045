#include "replistore/engine.hpp"
#include "replistore/log.hpp"
#include "replistore/metrics.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace fs = std::filesystem;

namespace replistore {

// --- EngineSettings ---

EngineSettings EngineSettings::from_config(const EngineConfig& config) {
    EngineSettings settings;
    settings.quorum = config.quorum;
    settings.target_part_count = config.target_part_count;
    settings.max_object_size = config.max_object_size;
    settings.download_chunk_size = config.download_chunk_size;
    settings.retry.initial_delay = config.retry_initial_delay;
    settings.retry.max_delay = config.retry_max_delay;
    settings.retry.backoff_multiplier = config.retry_backoff_multiplier;
    settings.rate_limit.limit = config.rate_limit;
    settings.rate_limit.period = config.rate_period;
    settings.token_secret = config.token_secret;
    settings.token_ttl = config.token_ttl;
    settings.share_link_ttl = config.share_link_ttl;
    settings.scratch_dir = config.scratch_dir;
    settings.progress.min_interval = config.progress_interval;
    return settings;
}

// --- Placing downloads ---

void move_into_place(const fs::path& from, const fs::path& to, std::error_code& ec) {
    fs::rename(from, to, ec);
    if (ec == std::errc::cross_device_link) {
        copy_into_place(from, to, ec);
    }
}

void copy_into_place(const fs::path& from, const fs::path& to, std::error_code& ec) {
    auto temp = to;
    temp += ".part-" + std::to_string(::getpid());

    ec.clear();
    fs::copy_file(from, temp, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::rename(temp, to, ec);
    }
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
    }
}

// --- ScratchDir ---

ScratchDir::ScratchDir(const fs::path& root, const std::string& job_id)
    : path_(root / job_id) {
    fs::create_directories(path_);
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warn("Failed to remove scratch directory %s: %s",
                 path_.c_str(), ec.message().c_str());
    }
}

// --- TransferEngine ---

TransferEngine::TransferEngine(std::vector<std::shared_ptr<BackendClient>> backends,
                               const EngineSettings& settings,
                               MetricsExporter* metrics)
    : backends_(std::move(backends))
    , settings_(settings)
    , metrics_(metrics)
    , progress_(dispatcher_.hook(), settings_.progress)
    , limiter_(settings_.rate_limit)
    , tokens_(settings_.token_secret)
    , coordinator_(&progress_)
    , downloader_(&progress_, settings_.download_chunk_size, settings_.retry)
    , resolver_(downloader_) {
    if (backends_.empty()) {
        throw std::invalid_argument("TransferEngine requires at least one backend");
    }
    if (settings_.scratch_dir.empty()) {
        settings_.scratch_dir = fs::temp_directory_path() / "replistore";
    }
    if (metrics_) {
        metrics_->set_progress(&progress_);
        metrics_->set_rate_limiter(&limiter_);
    }
}

TransferEngine::~TransferEngine() {
    if (metrics_) {
        metrics_->set_progress(nullptr);
        metrics_->set_rate_limiter(nullptr);
    }
    dispatcher_.stop();
}

std::vector<std::shared_ptr<BackendClient>> TransferEngine::create_backends(const EngineConfig& config) {
    std::vector<std::shared_ptr<BackendClient>> backends;
    for (const auto& backend : config.backends) {
        auto target = backend.to_target();
        log_info("Backend %s: %s %s%s%s (priority %d)", target.name.c_str(), target.type.c_str(),
                 target.endpoint.empty() ? "aws" : target.endpoint.c_str(),
                 target.bucket.empty() ? "" : "/", target.bucket.c_str(), target.priority_rank);
        backends.push_back(BackendFactory::create(target));
    }
    return backends;
}

std::string TransferEngine::sanitize_object_name(const std::string& name) {
    std::string cleaned = name;
    for (const char* pattern : {"../", "./"}) {
        std::string needle(pattern);
        size_t pos;
        while ((pos = cleaned.find(needle)) != std::string::npos) {
            cleaned.erase(pos, needle.size());
        }
    }

    std::string safe;
    safe.reserve(cleaned.size());
    for (unsigned char c : cleaned) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == ' ') {
            safe.push_back(static_cast<char>(c));
        }
    }

    if (safe.size() > constants::MAX_OBJECT_NAME_LENGTH) {
        // Keep the extension; a leading-dot name has none
        std::string ext;
        auto dot = safe.rfind('.');
        auto first = safe.find_first_not_of('.');
        if (dot != std::string::npos && first != std::string::npos && dot > first &&
            safe.size() - dot < constants::MAX_OBJECT_NAME_LENGTH) {
            ext = safe.substr(dot);
        }
        safe = safe.substr(0, constants::MAX_OBJECT_NAME_LENGTH - ext.size()) + ext;
    }

    if (safe.find_first_not_of(". ") == std::string::npos) {
        return {};
    }
    return safe;
}

bool TransferEngine::valid_owner(const std::string& owner) {
    if (owner.empty() || owner[0] == '.') return false;
    for (unsigned char c : owner) {
        if (!std::isalnum(c) && c != '.' && c != '_' && c != '-' && c != '@') return false;
    }
    return true;
}

std::string TransferEngine::object_key(const std::string& owner, const std::string& name) {
    return std::string(constants::USER_NAMESPACE_PREFIX) + owner + "/" + name;
}

std::string TransferEngine::new_job_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "job-" + std::to_string(ms) + "-" + std::to_string(::getpid()) + "-" +
           std::to_string(++job_counter_);
}

TransferJob TransferEngine::make_job(const std::string& owner,
                                     const std::string& object_name,
                                     const fs::path& source) const {
    TransferJob job;
    job.owner_identity = owner;
    job.object_name = object_name;
    job.local_source_path = source;
    std::error_code ec;
    auto size = fs::file_size(source, ec);
    job.declared_size = ec ? 0 : size;
    return job;
}

JobResult TransferEngine::reject(const TransferJob& job, const std::string& reason) const {
    log_warn("Job %s rejected: %s", job.job_id.c_str(), reason.c_str());
    JobResult result;
    result.job_id = job.job_id;
    result.object_key = job.object_key;
    result.status = JobStatus::Rejected;
    result.error_message = reason;
    result.started_at = std::chrono::system_clock::now();
    return result;
}

JobResult TransferEngine::upload(TransferJob job, size_t quorum, const CancellationToken* cancel) {
    return upload(std::move(job), backends_, quorum, cancel);
}

JobResult TransferEngine::upload(TransferJob job,
                                 const std::vector<std::shared_ptr<BackendClient>>& backends,
                                 size_t quorum,
                                 const CancellationToken* cancel) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    if (job.job_id.empty()) job.job_id = new_job_id();

    if (!valid_owner(job.owner_identity)) {
        auto result = reject(job, "Invalid owner identity '" + job.owner_identity + "'");
        record_upload(result);
        return result;
    }
    auto name = sanitize_object_name(job.object_name);
    if (name.empty()) {
        auto result = reject(job, "Object name '" + job.object_name + "' has no usable characters");
        record_upload(result);
        return result;
    }
    job.object_name = name;
    job.object_key = object_key(job.owner_identity, name);

    UploadOptions options;
    options.quorum = quorum == 0 ? settings_.quorum : quorum;
    options.cancel = cancel;
    options.retry = settings_.retry;
    options.target_part_count = settings_.target_part_count;
    options.max_object_size = settings_.max_object_size;

    auto result = coordinator_.upload(job, backends, options);
    progress_.end_job(job.job_id);

    if (result.success) {
        try {
            result.token = tokens_.issue(job.owner_identity, name, settings_.token_ttl);
            if (metrics_) metrics_->tokens_issued_total().Increment();
        } catch (const std::invalid_argument& e) {
            log_error("Job %s: cannot issue token: %s", job.job_id.c_str(), e.what());
        }
    }

    record_upload(result);
    return result;
}

JobResult TransferEngine::upload_stream(const std::string& owner,
                                        const std::string& object_name,
                                        uint64_t declared_size,
                                        std::istream& in,
                                        size_t quorum,
                                        const CancellationToken* cancel) {
    TransferJob job;
    job.job_id = new_job_id();
    job.owner_identity = owner;
    job.object_name = object_name;
    job.declared_size = declared_size;

    if (declared_size == 0) {
        return reject(job, "Declared size must be positive");
    }
    if (declared_size > settings_.max_object_size) {
        return reject(job, "Object of " + std::to_string(declared_size) +
                           " bytes exceeds the maximum of " +
                           std::to_string(settings_.max_object_size));
    }

    std::optional<ScratchDir> scratch;
    try {
        scratch.emplace(settings_.scratch_dir, job.job_id);
    } catch (const fs::filesystem_error& e) {
        JobResult failed = reject(job, std::string("Cannot create scratch directory: ") + e.what());
        failed.status = JobStatus::Failed;
        return failed;
    }

    auto spool = scratch->path() / "source";
    {
        std::ofstream out(spool, std::ios::binary | std::ios::trunc);
        if (!out) {
            JobResult failed = reject(job, "Cannot create spool file " + spool.string());
            failed.status = JobStatus::Failed;
            return failed;
        }

        std::vector<char> buffer(1024 * 1024);
        uint64_t written = 0;
        // Read one byte past the declared size to detect oversized streams
        while (written <= declared_size) {
            if (cancel && cancel->cancelled()) {
                JobResult cancelled = reject(job, "Upload cancelled while spooling");
                cancelled.status = JobStatus::Failed;
                return cancelled;
            }
            uint64_t want = std::min<uint64_t>(buffer.size(), declared_size + 1 - written);
            in.read(buffer.data(), static_cast<std::streamsize>(want));
            auto got = in.gcount();
            if (got <= 0) break;
            out.write(buffer.data(), got);
            if (!out) {
                JobResult failed = reject(job, "Write to spool file failed");
                failed.status = JobStatus::Failed;
                return failed;
            }
            written += static_cast<uint64_t>(got);
        }

        if (in.bad()) {
            return reject(job, "Error reading upload stream");
        }
        if (written != declared_size) {
            return reject(job, "Stream length " +
                               std::string(written > declared_size ? "exceeds" : "is short of") +
                               " declared size " + std::to_string(declared_size));
        }
    }

    job.local_source_path = spool;
    return upload(std::move(job), quorum, cancel);
}

DownloadResult TransferEngine::download(const std::string& owner,
                                        const std::string& object_name,
                                        const fs::path& destination,
                                        const CancellationToken* cancel) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->download_duration());

    DownloadResult result;
    result.local_path = destination;

    auto name = sanitize_object_name(object_name);
    if (!valid_owner(owner) || name.empty()) {
        result.error = ErrorKind::InvalidInput;
        result.error_message = "Invalid owner or object name";
        record_download(result);
        return result;
    }
    auto key = object_key(owner, name);
    auto job_id = new_job_id();

    try {
        ScratchDir scratch(settings_.scratch_dir, job_id);
        auto staged = scratch.path() / "object";

        result = resolver_.resolve(key, backends_, staged, job_id, cancel);
        progress_.end_job(job_id);

        if (result.success) {
            std::error_code ec;
            move_into_place(staged, destination, ec);
            if (ec) {
                result.success = false;
                result.error = ErrorKind::Io;
                result.error_message = "Cannot move download into " + destination.string() +
                                       ": " + ec.message();
                log_error("%s", result.error_message.c_str());
            }
        }
    } catch (const fs::filesystem_error& e) {
        progress_.end_job(job_id);
        result.success = false;
        result.error = ErrorKind::Io;
        result.error_message = std::string("Scratch directory error: ") + e.what();
        log_error("%s", result.error_message.c_str());
    }
    result.local_path = destination;

    if (result.success) {
        log_info("Downloaded %s from %s (%llu bytes)", key.c_str(), result.backend.c_str(),
                 static_cast<unsigned long long>(result.bytes_written));
    }
    record_download(result);
    return result;
}

DownloadResult TransferEngine::download_with_token(const std::string& token,
                                                   const fs::path& destination,
                                                   const CancellationToken* cancel) {
    auto claims = tokens_.verify(token);
    if (!claims) {
        if (metrics_) metrics_->token_rejections_total().Increment();
        log_warn("Rejected access token");
        DownloadResult result;
        result.local_path = destination;
        result.error = ErrorKind::Unauthorized;
        result.error_message = "invalid token";
        return result;
    }
    return download(claims->identity, claims->object_name, destination, cancel);
}

std::optional<TokenClaims> TransferEngine::verify_token(const std::string& token) const {
    auto claims = tokens_.verify(token);
    if (!claims && metrics_) metrics_->token_rejections_total().Increment();
    return claims;
}

ShareLinkResult TransferEngine::issue_share_link(const std::string& owner,
                                                 const std::string& object_name,
                                                 std::chrono::seconds ttl) {
    if (ttl.count() == 0) ttl = settings_.share_link_ttl;

    auto name = sanitize_object_name(object_name);
    if (!valid_owner(owner) || name.empty()) {
        return failure_as<ShareLinkResult>(ErrorKind::InvalidInput, "Invalid owner or object name");
    }
    if (ttl.count() < 0 || ttl > constants::MAX_PRESIGN_TTL) {
        return failure_as<ShareLinkResult>(ErrorKind::InvalidInput,
            "Share link lifetime must be between 1 second and 7 days");
    }
    auto key = object_key(owner, name);

    std::string failures;
    ErrorKind error = ErrorKind::NotFound;
    for (const auto& backend : FailoverResolver::order_by_priority(backends_)) {
        auto policy = downloader_.policy_for(*backend);
        auto head = retry_call(policy, nullptr, "head " + backend->name() + ":" + key,
                               [&] { return backend->head_object(key); });
        if (!head.success) {
            if (head.error != ErrorKind::NotFound) error = head.error;
            failures += " [" + backend->name() + ": " + head.error_message + "]";
            continue;
        }

        auto link = backend->presign_get(key, ttl);
        if (!link.success) {
            error = link.error;
            failures += " [" + backend->name() + ": " + link.error_message + "]";
            continue;
        }

        ShareLinkResult result;
        result.success = true;
        result.url = link.url;
        result.backend = backend->name();
        result.expires_at = std::chrono::system_clock::now() + ttl;
        log_info("Issued share link for %s via %s, valid %llds", key.c_str(),
                 result.backend.c_str(), static_cast<long long>(ttl.count()));
        return result;
    }

    return failure_as<ShareLinkResult>(error, "No backend can share " + key + ":" + failures);
}

ObjectListing TransferEngine::list_objects(const std::string& owner) const {
    if (!valid_owner(owner)) {
        return failure_as<ObjectListing>(ErrorKind::InvalidInput, "Invalid owner identity");
    }
    auto prefix = object_key(owner, "");

    std::string failures;
    ErrorKind error = ErrorKind::Server;
    for (const auto& backend : FailoverResolver::order_by_priority(backends_)) {
        auto policy = downloader_.policy_for(*backend);
        ObjectListing listing;
        ListOptions options;
        options.prefix = prefix;

        bool ok = true;
        do {
            auto page = retry_call(policy, nullptr, "list " + backend->name() + ":" + prefix,
                                   [&] { return backend->list_objects(options); });
            if (!page.success) {
                error = page.error;
                failures += " [" + backend->name() + ": " + page.error_message + "]";
                ok = false;
                break;
            }
            for (auto& entry : page.entries) {
                if (entry.key.starts_with(prefix)) {
                    entry.key = entry.key.substr(prefix.size());
                }
                listing.entries.push_back(std::move(entry));
            }
            options.continuation_token = page.truncated ? page.continuation_token : "";
        } while (!options.continuation_token.empty());

        if (ok) {
            listing.success = true;
            listing.backend = backend->name();
            return listing;
        }
        log_warn("Listing %s on %s failed, trying next backend", prefix.c_str(),
                 backend->name().c_str());
    }

    return failure_as<ObjectListing>(error, "No backend could list " + prefix + ":" + failures);
}

DeleteResult TransferEngine::delete_object(const std::string& owner, const std::string& object_name) {
    DeleteResult result;
    auto name = sanitize_object_name(object_name);
    if (!valid_owner(owner) || name.empty()) {
        result.error_message = "Invalid owner or object name";
        return result;
    }
    result.object_key = object_key(owner, name);

    result.success = true;
    for (const auto& backend : backends_) {
        auto policy = downloader_.policy_for(*backend);
        auto deleted = retry_call(policy, nullptr, "delete " + backend->name() + ":" + result.object_key,
                                  [&] { return backend->delete_object(result.object_key); });
        DeleteOutcome outcome;
        outcome.backend = backend->name();
        outcome.success = deleted.success;
        outcome.error = deleted.error;
        outcome.error_message = deleted.error_message;
        if (!deleted.success) {
            result.success = false;
            log_error("Delete of %s on %s failed: %s", result.object_key.c_str(),
                      backend->name().c_str(), deleted.error_message.c_str());
        }
        result.outcomes.push_back(std::move(outcome));
    }
    if (!result.success) {
        result.error_message = "Delete failed on one or more backends";
    }
    return result;
}

bool TransferEngine::allow(const std::string& identity) {
    bool allowed = limiter_.allow(identity);
    if (!allowed) {
        log_warn("Rate limit exceeded for %s", identity.c_str());
        if (metrics_) metrics_->rate_limited_total().Increment();
    }
    return allowed;
}

uint64_t TransferEngine::subscribe_progress(ProgressDispatcher::Subscriber callback) {
    return dispatcher_.subscribe(std::move(callback));
}

void TransferEngine::unsubscribe_progress(uint64_t id) {
    dispatcher_.unsubscribe(id);
}

void TransferEngine::flush_progress() {
    dispatcher_.flush();
}

void TransferEngine::record_upload(const JobResult& result) {
    if (!metrics_) return;
    metrics_->record_job(job_status_name(result.status));
    for (const auto& outcome : result.outcomes) {
        metrics_->record_backend_upload(outcome.backend, outcome_state_name(outcome.state));
        if (outcome.committed()) {
            metrics_->upload_bytes_total().Increment(static_cast<double>(outcome.bytes_transferred));
        }
    }
}

void TransferEngine::record_download(const DownloadResult& result) {
    if (!metrics_) return;
    if (result.success) {
        metrics_->downloads_success().Increment();
        metrics_->download_bytes_total().Increment(static_cast<double>(result.bytes_written));
        metrics_->failovers_total().Increment(static_cast<double>(result.failovers()));
    } else {
        metrics_->downloads_failure().Increment();
    }
}

}  // namespace replistore
