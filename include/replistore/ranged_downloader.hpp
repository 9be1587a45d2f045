#pragma once

#include "replistore/backend.hpp"
#include "replistore/constants.hpp"
#include "replistore/retry.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace replistore {

class ProgressTracker;

struct FetchResult : BackendResult {
    uint64_t object_size = 0;
    uint64_t bytes_written = 0;
};

/// Streams one object from one backend into a local file using bounded
/// ranged reads. Memory use is one chunk regardless of object size.
class RangedDownloader {
public:
    explicit RangedDownloader(ProgressTracker* progress = nullptr,
                              uint64_t chunk_size = constants::DEFAULT_DOWNLOAD_CHUNK_SIZE,
                              const RetryPolicy& retry = {});

    /// Head the object for its size, then fetch it. On failure the
    /// destination does not exist afterwards.
    FetchResult fetch(const BackendClient& backend,
                      const std::string& key,
                      const std::filesystem::path& destination,
                      const std::string& progress_key = "",
                      const CancellationToken* cancel = nullptr) const;

    /// Fetch an object already described by a head call. Every range read
    /// is pinned to `metadata.etag` when the backend reported one, so an
    /// overwrite mid-download fails with Protocol instead of mixing versions.
    FetchResult fetch_sized(const BackendClient& backend,
                            const std::string& key,
                            const ObjectMetadata& metadata,
                            const std::filesystem::path& destination,
                            const std::string& progress_key = "",
                            const CancellationToken* cancel = nullptr) const;

    uint64_t chunk_size() const { return chunk_size_; }

    /// Retry policy for one backend's calls (max_retries from its target)
    RetryPolicy policy_for(const BackendClient& backend) const;

private:
    ProgressTracker* progress_;
    uint64_t chunk_size_;
    RetryPolicy retry_;
};

}  // namespace replistore
