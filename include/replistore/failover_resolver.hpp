#pragma once

#include "replistore/backend.hpp"
#include "replistore/ranged_downloader.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace replistore {

/// One failed read attempt against one backend
struct DownloadAttempt {
    std::string backend;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
};

struct DownloadResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;
    std::string backend;                        ///< Backend that served the object
    std::filesystem::path local_path;
    uint64_t bytes_written = 0;
    std::vector<DownloadAttempt> attempts;      ///< Failures, in the order tried

    /// Number of backends skipped before the serving one
    size_t failovers() const { return success ? attempts.size() : 0; }
};

/// Reads an object from the first healthy backend in priority order.
///
/// Each backend is checked with head_object and then fetched in full. Any
/// failure moves on to the next backend; only cancellation stops the walk.
class FailoverResolver {
public:
    explicit FailoverResolver(const RangedDownloader& downloader);

    DownloadResult resolve(const std::string& key,
                           const std::vector<std::shared_ptr<BackendClient>>& backends,
                           const std::filesystem::path& destination,
                           const std::string& progress_key = "",
                           const CancellationToken* cancel = nullptr) const;

    /// Stable sort by BackendTarget::priority_rank (lower first)
    static std::vector<std::shared_ptr<BackendClient>> order_by_priority(
        const std::vector<std::shared_ptr<BackendClient>>& backends);

private:
    const RangedDownloader& downloader_;
};

}  // namespace replistore
