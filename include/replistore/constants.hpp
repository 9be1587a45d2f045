#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace replistore::constants {

// Multipart planning (S3 limits)
constexpr uint64_t DEFAULT_MIN_PART_SIZE = 5ULL * 1024 * 1024;          // 5MB (S3 minimum part size)
constexpr uint64_t DEFAULT_MAX_PART_SIZE = 5ULL * 1024 * 1024 * 1024;   // 5GB (S3 maximum part size)
constexpr uint32_t DEFAULT_MAX_PARTS = 10000;
constexpr uint32_t DEFAULT_TARGET_PART_COUNT = 50;
constexpr uint64_t DEFAULT_MULTIPART_THRESHOLD = 100ULL * 1024 * 1024;  // 100MB

// Ranged downloads
constexpr uint64_t DEFAULT_DOWNLOAD_CHUNK_SIZE = 8ULL * 1024 * 1024;    // 8MB

// Job limits
constexpr uint64_t DEFAULT_MAX_OBJECT_SIZE = 2ULL * 1024 * 1024 * 1024; // 2GB
constexpr size_t DEFAULT_QUORUM = 1;
constexpr size_t MAX_OBJECT_NAME_LENGTH = 200;

// Backend calls
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECS = 10;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_SECS = 60;
constexpr uint32_t DEFAULT_MAX_RETRIES = 3;
constexpr std::chrono::milliseconds DEFAULT_RETRY_INITIAL_DELAY{200};
constexpr std::chrono::milliseconds DEFAULT_RETRY_MAX_DELAY{5000};
constexpr double DEFAULT_RETRY_BACKOFF_MULTIPLIER = 2.0;

// Rate limiting
constexpr size_t DEFAULT_RATE_LIMIT = 10;
constexpr std::chrono::seconds DEFAULT_RATE_PERIOD{60};

// Access tokens / share links
constexpr std::chrono::seconds DEFAULT_TOKEN_TTL{3600};                 // 1 hour
constexpr std::chrono::seconds DEFAULT_SHARE_LINK_TTL{86400};           // 24 hours
constexpr std::chrono::seconds MAX_PRESIGN_TTL{7 * 86400};              // SigV4 limit: 7 days
constexpr char TOKEN_DELIMITER = ':';

// Progress publishing
constexpr std::chrono::milliseconds DEFAULT_PROGRESS_MIN_INTERVAL{1000};
constexpr std::chrono::milliseconds DEFAULT_PROGRESS_SAMPLE_INTERVAL{200};
constexpr double DEFAULT_PROGRESS_MIN_PERCENT_DELTA = 5.0;
constexpr double DEFAULT_PROGRESS_EWMA_ALPHA = 0.3;

// Object namespace
constexpr const char* USER_NAMESPACE_PREFIX = "users/";

} // namespace replistore::constants
