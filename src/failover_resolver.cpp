#include "replistore/failover_resolver.hpp"
#include "replistore/log.hpp"

#include <algorithm>

namespace replistore {

FailoverResolver::FailoverResolver(const RangedDownloader& downloader)
    : downloader_(downloader) {}

std::vector<std::shared_ptr<BackendClient>> FailoverResolver::order_by_priority(
    const std::vector<std::shared_ptr<BackendClient>>& backends) {
    std::vector<std::shared_ptr<BackendClient>> ordered;
    ordered.reserve(backends.size());
    for (const auto& backend : backends) {
        if (backend) ordered.push_back(backend);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const auto& a, const auto& b) {
            return a->target().priority_rank < b->target().priority_rank;
        });
    return ordered;
}

DownloadResult FailoverResolver::resolve(const std::string& key,
                                         const std::vector<std::shared_ptr<BackendClient>>& backends,
                                         const std::filesystem::path& destination,
                                         const std::string& progress_key,
                                         const CancellationToken* cancel) const {
    DownloadResult result;
    result.local_path = destination;

    auto ordered = order_by_priority(backends);
    if (ordered.empty()) {
        result.error = ErrorKind::InvalidInput;
        result.error_message = "No backends configured";
        return result;
    }

    auto record = [&](const BackendClient& backend, const BackendResult& failure) {
        log_warn("Read of %s from %s failed (%s): %s", key.c_str(), backend.name().c_str(),
                 error_kind_name(failure.error), failure.error_message.c_str());
        result.attempts.push_back({backend.name(), failure.error, failure.error_message});
    };

    for (const auto& backend : ordered) {
        if (cancel && cancel->cancelled()) {
            result.error = ErrorKind::Cancelled;
            result.error_message = "Download of " + key + " cancelled";
            return result;
        }

        auto head = retry_call(downloader_.policy_for(*backend), cancel,
                               "head " + backend->name() + ":" + key,
                               [&] { return backend->head_object(key); });
        if (!head.success) {
            record(*backend, head);
            if (head.error == ErrorKind::Cancelled) break;
            continue;
        }

        auto fetched = downloader_.fetch_sized(*backend, key, head.metadata,
                                               destination, progress_key, cancel);
        if (!fetched.success) {
            record(*backend, fetched);
            if (fetched.error == ErrorKind::Cancelled) break;
            continue;
        }

        result.success = true;
        result.backend = backend->name();
        result.bytes_written = fetched.bytes_written;
        if (!result.attempts.empty()) {
            log_info("Served %s from %s after %zu failed backend(s)",
                     key.c_str(), result.backend.c_str(), result.attempts.size());
        }
        return result;
    }

    result.error = ErrorKind::NotFound;
    for (const auto& attempt : result.attempts) {
        if (attempt.error == ErrorKind::Cancelled) {
            result.error = ErrorKind::Cancelled;
            result.error_message = "Download of " + key + " cancelled";
            return result;
        }
    }
    // Report the first real failure; NotFound only if no backend had the object
    for (const auto& attempt : result.attempts) {
        if (attempt.error != ErrorKind::NotFound) {
            result.error = attempt.error;
            break;
        }
    }

    result.error_message = "All backends failed for " + key + ":";
    for (const auto& attempt : result.attempts) {
        result.error_message += " [" + attempt.backend + ": " + attempt.error_message + "]";
    }
    log_error("%s", result.error_message.c_str());
    return result;
}

}  // namespace replistore
