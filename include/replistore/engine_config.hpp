#pragma once

#include "replistore/backend.hpp"
#include "replistore/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace replistore {

/// Configuration for a single storage backend ("s3" or "local").
struct BackendConfig {
    std::string name;
    std::string type;
    std::map<std::string, std::string> params;  // Keys as in the JSON config

    bool empty() const { return type.empty(); }

    /// Validate required and numeric fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;

    /// Build the runtime target. Throws std::invalid_argument on bad values;
    /// call validate() first for a readable message.
    BackendTarget to_target() const;
};

/// Configuration for a transfer engine and its command-line front end.
struct EngineConfig {
    // Storage backends, in configuration order
    std::vector<BackendConfig> backends;

    // Replication
    size_t quorum = constants::DEFAULT_QUORUM;
    uint32_t target_part_count = constants::DEFAULT_TARGET_PART_COUNT;
    uint64_t max_object_size = constants::DEFAULT_MAX_OBJECT_SIZE;
    uint64_t download_chunk_size = constants::DEFAULT_DOWNLOAD_CHUNK_SIZE;

    // Retry delays (the retry count is per backend: params "max_retries")
    std::chrono::milliseconds retry_initial_delay = constants::DEFAULT_RETRY_INITIAL_DELAY;
    std::chrono::milliseconds retry_max_delay = constants::DEFAULT_RETRY_MAX_DELAY;
    double retry_backoff_multiplier = constants::DEFAULT_RETRY_BACKOFF_MULTIPLIER;

    // Admission control
    size_t rate_limit = constants::DEFAULT_RATE_LIMIT;
    std::chrono::seconds rate_period = constants::DEFAULT_RATE_PERIOD;

    // Tokens and share links
    std::string token_secret;                       // or REPLISTORE_TOKEN_SECRET env
    std::chrono::seconds token_ttl = constants::DEFAULT_TOKEN_TTL;
    std::chrono::seconds share_link_ttl = constants::DEFAULT_SHARE_LINK_TTL;

    // Per-job scratch space. Default: <tmp>/replistore
    std::filesystem::path scratch_dir;

    // Progress publishing
    std::chrono::milliseconds progress_interval = constants::DEFAULT_PROGRESS_MIN_INTERVAL;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // Command line
    std::string identity;                           // Owner for CLI operations
    std::vector<std::string> args;                  // Command and its positional arguments
    bool verbose = false;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (usage on stderr).
    static std::optional<EngineConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in backend names, scratch_dir and environment credentials.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Human-readable dump with secrets masked.
    void print(std::ostream& out) const;
};

/// "abcd****" style masking for logged secrets
std::string mask_secret(const std::string& secret);

}  // namespace replistore
