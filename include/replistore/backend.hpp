#pragma once

#include "replistore/constants.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace replistore {

// Classification of a failed backend call. Transient kinds are retried by
// RetryPolicy, everything else fails the backend immediately.
enum class ErrorKind {
    None,
    InvalidInput,
    NotFound,
    Unauthorized,
    Forbidden,
    Timeout,
    Throttled,
    Network,
    Server,
    Cancelled,
    Io,
    Protocol
};

const char* error_kind_name(ErrorKind kind);
bool is_transient(ErrorKind kind);

// Map an HTTP status code to an error kind (ErrorKind::None for 2xx)
ErrorKind classify_http_status(int status);

// Common fields of every backend call result
struct BackendResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    bool ok() const { return success; }

    static BackendResult succeeded() { return {true, ErrorKind::None, {}}; }
    static BackendResult failed(ErrorKind kind, std::string message) {
        return {false, kind, std::move(message)};
    }
};

// Copy the failure of one call into another result type
template <typename R>
R failure_as(const BackendResult& from) {
    R result;
    result.success = false;
    result.error = from.error;
    result.error_message = from.error_message;
    return result;
}

template <typename R>
R failure_as(ErrorKind kind, std::string message) {
    R result;
    result.success = false;
    result.error = kind;
    result.error_message = std::move(message);
    return result;
}

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
};

struct InitiateResult : BackendResult {
    std::string upload_id;
};

struct PartResult : BackendResult {
    std::string etag;
};

// Result of put_object and complete_multipart
struct PutResult : BackendResult {
    std::string etag;
};

struct HeadResult : BackendResult {
    ObjectMetadata metadata;
};

struct RangeResult : BackendResult {
    std::vector<uint8_t> data;
};

struct PresignResult : BackendResult {
    std::string url;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string etag;
};

struct ListResult : BackendResult {
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
};

struct ListOptions {
    std::string prefix;
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

// A part acknowledged by the backend, as passed to complete_multipart
struct CompletedPart {
    int part_number = 0;
    std::string etag;
};

// Static description of one storage backend. Built once from configuration
// at process start and shared read-only afterwards.
struct BackendTarget {
    std::string name;
    std::string type = "s3";        // "s3" or "local"
    std::string endpoint;           // URL for s3 (empty = AWS), root directory for local
    std::string region = "us-east-1";
    std::string bucket;
    std::string path_prefix;        // Prepended to every object key

    // Credentials
    std::string access_key;
    std::string secret_key;
    std::string session_token;

    // Part-size constraints
    uint64_t min_part_size = constants::DEFAULT_MIN_PART_SIZE;
    uint64_t max_part_size = constants::DEFAULT_MAX_PART_SIZE;
    uint32_t max_parts = constants::DEFAULT_MAX_PARTS;
    uint64_t multipart_threshold = constants::DEFAULT_MULTIPART_THRESHOLD;

    // Lower rank is preferred for reads
    int priority_rank = 0;

    // Per-call limits
    std::chrono::seconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_SECS};
    std::chrono::seconds request_timeout{constants::DEFAULT_REQUEST_TIMEOUT_SECS};
    uint32_t max_retries = constants::DEFAULT_MAX_RETRIES;

    bool verify_ssl = true;
    bool use_path_style = false;    // For MinIO compatibility
};

// Abstract client for one storage backend. Implementations must be safe for
// concurrent use: several jobs may drive the same client at once.
class BackendClient {
public:
    virtual ~BackendClient() = default;

    // Backend type name (for logging)
    virtual std::string type_name() const = 0;

    virtual const BackendTarget& target() const = 0;

    const std::string& name() const { return target().name; }

    // --- Multipart upload ---

    virtual InitiateResult initiate_multipart(const std::string& key) = 0;

    virtual PartResult upload_part(const std::string& key,
                                   const std::string& upload_id,
                                   int part_number,
                                   std::span<const uint8_t> data) = 0;

    virtual PutResult complete_multipart(const std::string& key,
                                         const std::string& upload_id,
                                         const std::vector<CompletedPart>& parts) = 0;

    virtual BackendResult abort_multipart(const std::string& key,
                                          const std::string& upload_id) = 0;

    // --- Single objects ---

    // Atomic single-request write (small-object path)
    virtual PutResult put_object(const std::string& key,
                                 std::span<const uint8_t> data) = 0;

    // Object metadata without content. NotFound if absent.
    virtual HeadResult head_object(const std::string& key) const = 0;

    // Read bytes [start, end] (inclusive). A non-empty `if_match` pins the
    // read to that ETag; Protocol if the object has since changed.
    virtual RangeResult get_range(const std::string& key,
                                  uint64_t start,
                                  uint64_t end,
                                  const std::string& if_match) const = 0;

    virtual BackendResult delete_object(const std::string& key) = 0;

    virtual ListResult list_objects(const ListOptions& options = {}) const = 0;

    // Time-limited URL permitting direct retrieval without backend credentials
    virtual PresignResult presign_get(const std::string& key,
                                      std::chrono::seconds ttl) const = 0;
};

// Factory for creating backend clients from targets
class BackendFactory {
public:
    // Dispatch on target.type. Throws std::invalid_argument for unknown types
    // or targets missing required fields.
    static std::shared_ptr<BackendClient> create(const BackendTarget& target);

    // S3-compatible backend (AWS, Wasabi, MinIO)
    static std::shared_ptr<BackendClient> create_s3(const BackendTarget& target);

    // Directory-tree backend rooted at target.endpoint
    static std::shared_ptr<BackendClient> create_local(const BackendTarget& target);
};

} // namespace replistore
