#include "replistore/ranged_downloader.hpp"
#include "replistore/log.hpp"
#include "replistore/progress.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace replistore {

RangedDownloader::RangedDownloader(ProgressTracker* progress,
                                   uint64_t chunk_size,
                                   const RetryPolicy& retry)
    : progress_(progress)
    , chunk_size_(chunk_size)
    , retry_(retry) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("Download chunk size must be positive");
    }
}

RetryPolicy RangedDownloader::policy_for(const BackendClient& backend) const {
    RetryPolicy policy = retry_;
    policy.max_retries = backend.target().max_retries;
    return policy;
}

FetchResult RangedDownloader::fetch(const BackendClient& backend,
                                    const std::string& key,
                                    const fs::path& destination,
                                    const std::string& progress_key,
                                    const CancellationToken* cancel) const {
    auto head = retry_call(policy_for(backend), cancel, "head " + backend.name() + ":" + key,
        [&] { return backend.head_object(key); });
    if (!head.success) {
        return failure_as<FetchResult>(head);
    }
    return fetch_sized(backend, key, head.metadata, destination, progress_key, cancel);
}

FetchResult RangedDownloader::fetch_sized(const BackendClient& backend,
                                          const std::string& key,
                                          const ObjectMetadata& metadata,
                                          const fs::path& destination,
                                          const std::string& progress_key,
                                          const CancellationToken* cancel) const {
    const uint64_t size = metadata.size;
    const std::string label = backend.name() + ":" + key;
    const bool track = progress_ && !progress_key.empty();
    RetryPolicy policy = policy_for(backend);

    FetchResult result;
    result.object_size = size;

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return failure_as<FetchResult>(ErrorKind::Io,
            "Cannot open " + destination.string() + " for writing");
    }

    if (track) {
        progress_->begin(progress_key, backend.name(), size);
    }

    auto fail = [&](const BackendResult& failure) {
        out.close();
        std::error_code ec;
        fs::remove(destination, ec);
        if (track) {
            progress_->discard(progress_key, backend.name());
        }
        auto failed = failure_as<FetchResult>(failure);
        failed.object_size = size;
        failed.bytes_written = 0;
        return failed;
    };

    uint64_t offset = 0;
    while (offset < size) {
        if (cancel && cancel->cancelled()) {
            return fail(BackendResult::failed(ErrorKind::Cancelled, "Download of " + label + " cancelled"));
        }

        uint64_t length = std::min(chunk_size_, size - offset);
        uint64_t end = offset + length - 1;

        auto range = retry_call(policy, cancel, "range " + label,
            [&] { return backend.get_range(key, offset, end, metadata.etag); });
        if (!range.success) {
            return fail(range);
        }
        if (range.data.size() != length) {
            return fail(BackendResult::failed(ErrorKind::Protocol,
                "Range " + std::to_string(offset) + "-" + std::to_string(end) + " of " + label +
                " returned " + std::to_string(range.data.size()) + " bytes, expected " +
                std::to_string(length)));
        }

        out.write(reinterpret_cast<const char*>(range.data.data()),
                  static_cast<std::streamsize>(range.data.size()));
        if (!out) {
            return fail(BackendResult::failed(ErrorKind::Io,
                "Write to " + destination.string() + " failed"));
        }

        offset += length;
        result.bytes_written += length;
        if (track) {
            progress_->update(progress_key, backend.name(), length);
        }
    }

    out.close();
    if (out.fail()) {
        return fail(BackendResult::failed(ErrorKind::Io,
            "Closing " + destination.string() + " failed"));
    }

    if (track) {
        progress_->finish(progress_key, backend.name());
    }

    log_debug("Fetched %s (%llu bytes) to %s", label.c_str(),
              static_cast<unsigned long long>(result.bytes_written), destination.c_str());
    result.success = true;
    return result;
}

}  // namespace replistore
