// Test suite for replistore.
//
// Tests:
//   1. Error classification and retry policy
//   2. Chunk planning
//   3. Local backend (single objects, multipart, listing, presign)
//   4. S3 presigned URLs
//   5. TransferCoordinator: replication, quorum, abort, cancellation
//   6. RangedDownloader and FailoverResolver
//   7. Progress tracking, dispatch and formatting
//   8. Access tokens
//   9. Rate limiting
//  10. EngineConfig: CLI, JSON, environment, validation
//  11. TransferEngine end to end with local backends
//  12. Metrics textfile export

#include "replistore/access_token.hpp"
#include "replistore/backend.hpp"
#include "replistore/chunk_planner.hpp"
#include "replistore/engine.hpp"
#include "replistore/engine_config.hpp"
#include "replistore/failover_resolver.hpp"
#include "replistore/http.hpp"
#include "replistore/metrics.hpp"
#include "replistore/progress.hpp"
#include "replistore/ranged_downloader.hpp"
#include "replistore/rate_limiter.hpp"
#include "replistore/retry.hpp"
#include "replistore/transfer_coordinator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace replistore;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Deterministic non-repeating-looking payload.
static std::string make_payload(size_t size, uint32_t seed = 1) {
    std::string data(size, '\0');
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        data[i] = static_cast<char>(state >> 16);
    }
    return data;
}

static std::span<const uint8_t> bytes_of(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

static bool dir_is_empty(const fs::path& dir) {
    std::error_code ec;
    return !fs::exists(dir, ec) || fs::is_empty(dir, ec);
}

/// BackendClient decorator that counts calls and injects failures.
class FaultyBackend : public BackendClient {
public:
    FaultyBackend(std::shared_ptr<BackendClient> inner, BackendTarget target)
        : inner_(std::move(inner))
        , target_(std::move(target)) {}

    /// Fail `op` with `kind`, `times` times (-1 = always).
    void fail(const std::string& op, ErrorKind kind, int times = -1) {
        std::lock_guard lock(mutex_);
        faults_[op] = {kind, times};
    }

    void fail_part(int part_number, ErrorKind kind) {
        std::lock_guard lock(mutex_);
        failing_part_ = part_number;
        part_kind_ = kind;
    }

    /// Drop the last byte of every ranged read.
    void short_ranges() { short_ranges_ = true; }

    /// Invoked with the part number before each upload_part.
    void on_part(std::function<void(int)> hook) { part_hook_ = std::move(hook); }

    /// Invoked with the key and start offset before each ranged read.
    void on_range(std::function<void(const std::string&, uint64_t)> hook) {
        range_hook_ = std::move(hook);
    }

    int calls(const std::string& op) const {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(op);
        return it == calls_.end() ? 0 : it->second;
    }

    std::vector<std::string> aborted_uploads() const {
        std::lock_guard lock(mutex_);
        return aborted_;
    }

    std::string type_name() const override { return "faulty"; }
    const BackendTarget& target() const override { return target_; }

    InitiateResult initiate_multipart(const std::string& key) override {
        if (auto f = inject("initiate")) return failure_as<InitiateResult>(*f);
        return inner_->initiate_multipart(key);
    }

    PartResult upload_part(const std::string& key, const std::string& upload_id,
                           int part_number, std::span<const uint8_t> data) override {
        if (part_hook_) part_hook_(part_number);
        if (auto f = inject("part", part_number)) return failure_as<PartResult>(*f);
        return inner_->upload_part(key, upload_id, part_number, data);
    }

    PutResult complete_multipart(const std::string& key, const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        if (auto f = inject("complete")) return failure_as<PutResult>(*f);
        return inner_->complete_multipart(key, upload_id, parts);
    }

    BackendResult abort_multipart(const std::string& key, const std::string& upload_id) override {
        {
            std::lock_guard lock(mutex_);
            aborted_.push_back(upload_id);
        }
        if (auto f = inject("abort")) return *f;
        return inner_->abort_multipart(key, upload_id);
    }

    PutResult put_object(const std::string& key, std::span<const uint8_t> data) override {
        if (auto f = inject("put")) return failure_as<PutResult>(*f);
        return inner_->put_object(key, data);
    }

    HeadResult head_object(const std::string& key) const override {
        if (auto f = inject("head")) return failure_as<HeadResult>(*f);
        return inner_->head_object(key);
    }

    RangeResult get_range(const std::string& key, uint64_t start, uint64_t end,
                          const std::string& if_match) const override {
        if (auto f = inject("range")) return failure_as<RangeResult>(*f);
        if (range_hook_) range_hook_(key, start);
        auto result = inner_->get_range(key, start, end, if_match);
        if (short_ranges_ && result.success && !result.data.empty()) {
            result.data.pop_back();
        }
        return result;
    }

    BackendResult delete_object(const std::string& key) override {
        if (auto f = inject("delete")) return *f;
        return inner_->delete_object(key);
    }

    ListResult list_objects(const ListOptions& options) const override {
        if (auto f = inject("list")) return failure_as<ListResult>(*f);
        return inner_->list_objects(options);
    }

    PresignResult presign_get(const std::string& key, std::chrono::seconds ttl) const override {
        if (auto f = inject("presign")) return failure_as<PresignResult>(*f);
        return inner_->presign_get(key, ttl);
    }

private:
    struct Fault {
        ErrorKind kind = ErrorKind::Server;
        int remaining = -1;
    };

    std::optional<BackendResult> inject(const std::string& op, int part = 0) const {
        std::lock_guard lock(mutex_);
        calls_[op]++;
        if (op == "part" && part == failing_part_) {
            return BackendResult::failed(part_kind_, "injected failure on part " + std::to_string(part));
        }
        auto it = faults_.find(op);
        if (it == faults_.end() || it->second.remaining == 0) return std::nullopt;
        if (it->second.remaining > 0) it->second.remaining--;
        return BackendResult::failed(it->second.kind, "injected " + op + " failure");
    }

    std::shared_ptr<BackendClient> inner_;
    BackendTarget target_;

    mutable std::mutex mutex_;
    mutable std::map<std::string, int> calls_;
    mutable std::map<std::string, Fault> faults_;
    std::vector<std::string> aborted_;
    int failing_part_ = 0;
    ErrorKind part_kind_ = ErrorKind::Server;
    bool short_ranges_ = false;
    std::function<void(int)> part_hook_;
    std::function<void(const std::string&, uint64_t)> range_hook_;
};

/// Local target with small part limits so multipart paths run on small files.
static BackendTarget small_target(const std::string& name, const fs::path& root, int priority = 0) {
    BackendTarget target;
    target.name = name;
    target.type = "local";
    target.endpoint = (root / name).string();
    target.min_part_size = 1024;
    target.max_part_size = 1024 * 1024;
    target.multipart_threshold = 4096;
    target.max_retries = 2;
    target.priority_rank = priority;
    return target;
}

static std::shared_ptr<FaultyBackend> faulty(const BackendTarget& target) {
    return std::make_shared<FaultyBackend>(BackendFactory::create_local(target), target);
}

static UploadOptions fast_options(size_t quorum) {
    UploadOptions options;
    options.quorum = quorum;
    options.retry.initial_delay = 1ms;
    options.retry.max_delay = 5ms;
    options.target_part_count = 4;
    return options;
}

static TransferJob make_test_job(const std::string& key, const fs::path& source, uint64_t size) {
    TransferJob job;
    job.job_id = "job-" + key;
    job.object_name = key;
    job.local_source_path = source;
    job.declared_size = size;
    job.owner_identity = "tester";
    return job;
}

static std::string read_object(const BackendClient& backend, const std::string& key) {
    auto head = backend.head_object(key);
    if (!head.success) return "<missing>";
    if (head.metadata.size == 0) return "";
    auto range = backend.get_range(key, 0, head.metadata.size - 1, "");
    return range.success ? std::string(range.data.begin(), range.data.end()) : "<error>";
}

// ---------------------------------------------------------------------------
// 1. Errors and retry
// ---------------------------------------------------------------------------

static void test_errors_and_retry() {
    std::cout << "\n=== Error classification and retry ===" << std::endl;

    {
        TEST(http_status_mapping);
        ASSERT_TRUE(classify_http_status(200) == ErrorKind::None, "200");
        ASSERT_TRUE(classify_http_status(206) == ErrorKind::None, "206");
        ASSERT_TRUE(classify_http_status(400) == ErrorKind::InvalidInput, "400");
        ASSERT_TRUE(classify_http_status(401) == ErrorKind::Unauthorized, "401");
        ASSERT_TRUE(classify_http_status(403) == ErrorKind::Forbidden, "403");
        ASSERT_TRUE(classify_http_status(404) == ErrorKind::NotFound, "404");
        ASSERT_TRUE(classify_http_status(408) == ErrorKind::Timeout, "408");
        ASSERT_TRUE(classify_http_status(429) == ErrorKind::Throttled, "429");
        ASSERT_TRUE(classify_http_status(500) == ErrorKind::Server, "500");
        ASSERT_TRUE(classify_http_status(503) == ErrorKind::Throttled, "503");
        ASSERT_TRUE(classify_http_status(504) == ErrorKind::Timeout, "504");
        PASS();
    }
    {
        TEST(transient_kinds);
        ASSERT_TRUE(is_transient(ErrorKind::Timeout), "timeout");
        ASSERT_TRUE(is_transient(ErrorKind::Throttled), "throttled");
        ASSERT_TRUE(is_transient(ErrorKind::Network), "network");
        ASSERT_TRUE(is_transient(ErrorKind::Server), "server");
        ASSERT_TRUE(!is_transient(ErrorKind::NotFound), "not found");
        ASSERT_TRUE(!is_transient(ErrorKind::Forbidden), "forbidden");
        ASSERT_TRUE(!is_transient(ErrorKind::Cancelled), "cancelled");
        ASSERT_TRUE(!is_transient(ErrorKind::Io), "io");
        PASS();
    }
    {
        TEST(backoff_delays);
        RetryPolicy policy;
        ASSERT_EQ(policy.delay_for(1).count(), 200, "first retry");
        ASSERT_EQ(policy.delay_for(2).count(), 400, "second retry");
        ASSERT_EQ(policy.delay_for(3).count(), 800, "third retry");
        ASSERT_EQ(policy.delay_for(10).count(), 5000, "capped");
        PASS();
    }

    RetryPolicy fast;
    fast.max_retries = 3;
    fast.initial_delay = 1ms;
    fast.max_delay = 2ms;

    {
        TEST(transient_then_success);
        int calls = 0;
        auto result = retry_call(fast, nullptr, "op", [&] {
            ++calls;
            return calls < 3 ? failure_as<PutResult>(ErrorKind::Network, "reset")
                             : PutResult{{true, ErrorKind::None, {}}, "\"etag\""};
        });
        ASSERT_TRUE(result.success, "should succeed on third call");
        ASSERT_EQ(calls, 3, "call count");
        ASSERT_EQ(result.etag, "\"etag\"", "etag from final call");
        PASS();
    }
    {
        TEST(permanent_not_retried);
        int calls = 0;
        auto result = retry_call(fast, nullptr, "op", [&] {
            ++calls;
            return failure_as<PutResult>(ErrorKind::Forbidden, "denied");
        });
        ASSERT_TRUE(!result.success, "should fail");
        ASSERT_EQ(calls, 1, "single call");
        ASSERT_TRUE(result.error == ErrorKind::Forbidden, "error kept");
        PASS();
    }
    {
        TEST(retry_budget_exhausted);
        int calls = 0;
        auto result = retry_call(fast, nullptr, "op", [&] {
            ++calls;
            return failure_as<PutResult>(ErrorKind::Server, "500");
        });
        ASSERT_TRUE(!result.success, "should fail");
        ASSERT_EQ(calls, 4, "one call plus three retries");
        ASSERT_TRUE(result.error == ErrorKind::Server, "last error");
        PASS();
    }
    {
        TEST(cancelled_before_call);
        CancellationToken cancel;
        cancel.cancel();
        int calls = 0;
        auto result = retry_call(fast, &cancel, "op", [&] {
            ++calls;
            return PutResult{{true, ErrorKind::None, {}}, ""};
        });
        ASSERT_TRUE(!result.success, "should not succeed");
        ASSERT_EQ(calls, 0, "no call made");
        ASSERT_TRUE(result.error == ErrorKind::Cancelled, "cancelled");
        PASS();
    }
    {
        TEST(cancel_interrupts_backoff);
        RetryPolicy slow;
        slow.max_retries = 5;
        slow.initial_delay = 10s;
        slow.max_delay = 10s;
        CancellationToken cancel;
        std::thread canceller([&] {
            std::this_thread::sleep_for(50ms);
            cancel.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        auto result = retry_call(slow, &cancel, "op", [&] {
            return failure_as<PutResult>(ErrorKind::Timeout, "slow");
        });
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();
        ASSERT_TRUE(result.error == ErrorKind::Cancelled, "cancelled during backoff");
        ASSERT_TRUE(elapsed < 5s, "backoff sleep interrupted");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Chunk planning
// ---------------------------------------------------------------------------

static bool contiguous(const ChunkPlan& plan, uint64_t total) {
    uint64_t offset = 0;
    int number = 1;
    for (const auto& part : plan.parts) {
        if (part.offset != offset || part.length == 0 || part.part_number != number) return false;
        if (part.state != PartState::Pending) return false;
        offset = part.end();
        ++number;
    }
    return offset == total && plan.total_size() == total;
}

static void test_chunk_planner() {
    std::cout << "\n=== Chunk planning ===" << std::endl;

    constexpr uint64_t MB = 1024 * 1024;

    {
        TEST(ranges_contiguous_for_many_sizes);
        PlanLimits limits;
        limits.min_part_size = 1024;
        limits.max_part_size = 64 * 1024;
        limits.max_parts = 100;
        limits.target_part_count = 7;
        for (uint64_t size : {1ULL, 1023ULL, 1024ULL, 1025ULL, 4096ULL, 10000ULL,
                              65536ULL, 99999ULL, 1000000ULL, 6553600ULL}) {
            auto plan = plan_chunks(size, limits);
            ASSERT_TRUE(contiguous(plan, size), "plan not contiguous for " + std::to_string(size));
            ASSERT_TRUE(plan.parts.size() <= limits.max_parts, "too many parts");
            for (const auto& part : plan.parts) {
                ASSERT_TRUE(part.length <= limits.max_part_size, "part exceeds max");
            }
            for (size_t i = 0; plan.multipart && i + 1 < plan.parts.size(); ++i) {
                ASSERT_TRUE(plan.parts[i].length >= limits.min_part_size, "non-final part below min");
            }
        }
        PASS();
    }
    {
        TEST(small_object_single_part);
        auto plan = plan_chunks(5 * MB);
        ASSERT_TRUE(!plan.multipart, "5MB is a single put");
        ASSERT_EQ(plan.parts.size(), 1u, "one part");
        ASSERT_EQ(plan.parts[0].length, 5 * MB, "whole object");
        PASS();
    }
    {
        TEST(default_target_part_count);
        auto plan = plan_chunks(1000 * MB);
        ASSERT_TRUE(plan.multipart, "multipart");
        ASSERT_EQ(plan.part_size, 20 * MB, "1000MB / 50");
        ASSERT_EQ(plan.parts.size(), 50u, "50 parts");
        PASS();
    }
    {
        TEST(min_part_size_clamps);
        auto plan = plan_chunks(12 * MB);
        ASSERT_EQ(plan.part_size, 5 * MB, "clamped to 5MB");
        ASSERT_EQ(plan.parts.size(), 2u, "remainder absorbed into second part");
        ASSERT_EQ(plan.parts[1].length, 7 * MB, "last part takes the remainder");
        PASS();
    }
    {
        TEST(fixed_50mb_parts_for_150mb);
        PlanLimits limits;
        limits.min_part_size = 50 * MB;
        limits.max_part_size = 50 * MB;
        auto plan = plan_chunks(150 * MB, limits);
        ASSERT_EQ(plan.parts.size(), 3u, "three parts");
        for (const auto& part : plan.parts) {
            ASSERT_EQ(part.length, 50 * MB, "each part 50MB");
        }
        PASS();
    }
    {
        TEST(remainder_becomes_trailing_part_at_max);
        PlanLimits limits;
        limits.min_part_size = 1000;
        limits.max_part_size = 1000;
        auto plan = plan_chunks(2500, limits);
        ASSERT_EQ(plan.parts.size(), 3u, "trailing short part");
        ASSERT_EQ(plan.parts[2].length, 500u, "remainder");
        ASSERT_TRUE(contiguous(plan, 2500), "contiguous");
        PASS();
    }
    {
        TEST(max_parts_raises_part_size);
        PlanLimits limits;
        limits.min_part_size = 10;
        limits.max_part_size = 10000;
        limits.max_parts = 4;
        limits.target_part_count = 100;
        auto plan = plan_chunks(1000, limits);
        ASSERT_TRUE(plan.parts.size() <= 4, "respects max_parts");
        ASSERT_EQ(plan.part_size, 250u, "ceil(1000 / 4)");
        ASSERT_TRUE(contiguous(plan, 1000), "contiguous");
        PASS();
    }
    {
        TEST(invalid_inputs_throw);
        bool threw = false;
        try { plan_chunks(0); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "zero size throws");

        threw = false;
        PlanLimits inverted;
        inverted.min_part_size = 100;
        inverted.max_part_size = 10;
        try { plan_chunks(1000, inverted); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "min > max throws");

        threw = false;
        PlanLimits tiny;
        tiny.min_part_size = 10;
        tiny.max_part_size = 10;
        tiny.max_parts = 2;
        try { plan_chunks(1000, tiny); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "object too large for max_parts throws");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Local backend
// ---------------------------------------------------------------------------

static void test_local_backend() {
    std::cout << "\n=== Local backend ===" << std::endl;

    auto tmpdir = make_temp_dir("replistore-local");
    auto target = small_target("disk", tmpdir);
    auto backend = BackendFactory::create_local(target);
    auto staging = tmpdir / "disk" / ".multipart";

    {
        TEST(factory_rejects_bad_targets);
        BackendTarget no_root;
        no_root.type = "local";
        bool threw = false;
        try { BackendFactory::create(no_root); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "local without root");

        BackendTarget unknown;
        unknown.type = "ftp";
        threw = false;
        try { BackendFactory::create(unknown); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "unknown type");

        BackendTarget s3;
        s3.type = "s3";
        s3.bucket = "b";
        threw = false;
        try { BackendFactory::create(s3); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "s3 without credentials");
        PASS();
    }
    {
        TEST(put_head_range);
        auto data = make_payload(3000);
        auto put = backend->put_object("users/a/file.bin", bytes_of(data));
        ASSERT_TRUE(put.success, "put: " + put.error_message);
        ASSERT_NOT_EMPTY(put.etag, "etag");

        auto head = backend->head_object("users/a/file.bin");
        ASSERT_TRUE(head.success, "head");
        ASSERT_EQ(head.metadata.size, 3000u, "size");

        auto range = backend->get_range("users/a/file.bin", 100, 199, "");
        ASSERT_TRUE(range.success, "range");
        ASSERT_EQ(range.data.size(), 100u, "range length");
        ASSERT_TRUE(std::equal(range.data.begin(), range.data.end(), data.begin() + 100),
                    "range content");
        PASS();
    }
    {
        TEST(missing_object_not_found);
        auto head = backend->head_object("users/a/missing.bin");
        ASSERT_TRUE(!head.success, "head of missing");
        ASSERT_TRUE(head.error == ErrorKind::NotFound, "NotFound");
        PASS();
    }
    {
        TEST(traversal_keys_rejected);
        auto put = backend->put_object("../escape.bin", bytes_of("x"));
        ASSERT_TRUE(!put.success, "parent traversal rejected");
        ASSERT_TRUE(put.error == ErrorKind::InvalidInput, "InvalidInput");
        auto abs = backend->put_object("/etc/passwd", bytes_of("x"));
        ASSERT_TRUE(!abs.success, "absolute key rejected");
        auto dots = backend->put_object("users/a/a..b.txt", bytes_of("x"));
        ASSERT_TRUE(dots.success, "dots inside a name are fine");
        PASS();
    }
    {
        TEST(multipart_complete);
        auto data = make_payload(5000, 7);
        auto init = backend->initiate_multipart("users/a/multi.bin");
        ASSERT_TRUE(init.success, "initiate");
        std::vector<CompletedPart> parts;
        for (int n = 1; n <= 3; ++n) {
            size_t offset = (n - 1) * 2000;
            size_t length = std::min<size_t>(2000, data.size() - offset);
            auto part = backend->upload_part("users/a/multi.bin", init.upload_id, n,
                                             bytes_of(data.substr(offset, length)));
            ASSERT_TRUE(part.success, "part " + std::to_string(n));
            parts.push_back({n, part.etag});
        }
        auto done = backend->complete_multipart("users/a/multi.bin", init.upload_id, parts);
        ASSERT_TRUE(done.success, "complete: " + done.error_message);
        ASSERT_EQ(read_object(*backend, "users/a/multi.bin"), data, "assembled content");
        ASSERT_TRUE(dir_is_empty(staging), "staging cleaned after complete");
        PASS();
    }
    {
        TEST(multipart_abort_removes_staging);
        auto init = backend->initiate_multipart("users/a/aborted.bin");
        ASSERT_TRUE(init.success, "initiate");
        auto part = backend->upload_part("users/a/aborted.bin", init.upload_id, 1, bytes_of("abc"));
        ASSERT_TRUE(part.success, "part");
        auto aborted = backend->abort_multipart("users/a/aborted.bin", init.upload_id);
        ASSERT_TRUE(aborted.success, "abort");
        ASSERT_TRUE(dir_is_empty(staging), "staging removed");
        ASSERT_TRUE(!backend->head_object("users/a/aborted.bin").success, "no object");
        auto again = backend->upload_part("users/a/aborted.bin", init.upload_id, 2, bytes_of("d"));
        ASSERT_TRUE(!again.success, "upload id gone after abort");
        PASS();
    }
    {
        TEST(list_with_prefix_and_pagination);
        backend->put_object("users/b/one.txt", bytes_of("1"));
        backend->put_object("users/b/two.txt", bytes_of("22"));
        backend->put_object("users/b/three.txt", bytes_of("333"));

        ListOptions options;
        options.prefix = "users/b/";
        auto all = backend->list_objects(options);
        ASSERT_TRUE(all.success, "list");
        ASSERT_EQ(all.entries.size(), 3u, "three objects");
        ASSERT_EQ(all.entries[0].key, "users/b/one.txt", "sorted");

        options.max_keys = 2;
        auto page1 = backend->list_objects(options);
        ASSERT_TRUE(page1.truncated, "first page truncated");
        ASSERT_EQ(page1.entries.size(), 2u, "page size");
        options.continuation_token = page1.continuation_token;
        auto page2 = backend->list_objects(options);
        ASSERT_TRUE(!page2.truncated, "last page");
        ASSERT_EQ(page2.entries.size(), 1u, "remaining entry");
        ASSERT_EQ(page2.entries[0].key, "users/b/two.txt", "continues after token");
        PASS();
    }
    {
        TEST(delete_is_idempotent);
        ASSERT_TRUE(backend->delete_object("users/b/one.txt").success, "delete existing");
        ASSERT_TRUE(!backend->head_object("users/b/one.txt").success, "gone");
        ASSERT_TRUE(backend->delete_object("users/b/one.txt").success, "delete missing succeeds");
        PASS();
    }
    {
        TEST(presign_file_url);
        auto link = backend->presign_get("users/b/two.txt", 3600s);
        ASSERT_TRUE(link.success, "presign");
        ASSERT_TRUE(link.url.starts_with("file://"), "file url");
        ASSERT_TRUE(link.url.find("expires=") != std::string::npos, "expiry in url");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 4. S3 presigned URLs
// ---------------------------------------------------------------------------

static void test_s3_presign() {
    std::cout << "\n=== S3 presigned URLs ===" << std::endl;

    BackendTarget target;
    target.name = "minio";
    target.type = "s3";
    target.endpoint = "https://s3.example.com";
    target.bucket = "media";
    target.access_key = "AKIDEXAMPLE";
    target.secret_key = "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY";
    target.use_path_style = true;
    auto backend = BackendFactory::create(target);

    {
        TEST(presign_contains_sigv4_query);
        auto link = backend->presign_get("users/alice/clip 1.mp4", 3600s);
        ASSERT_TRUE(link.success, "presign: " + link.error_message);
        ASSERT_TRUE(link.url.starts_with("https://s3.example.com/media/users/alice/"), "path-style url");
        ASSERT_TRUE(link.url.find("X-Amz-Algorithm=AWS4-HMAC-SHA256") != std::string::npos, "algorithm");
        ASSERT_TRUE(link.url.find("X-Amz-Expires=3600") != std::string::npos, "expires");
        ASSERT_TRUE(link.url.find("X-Amz-SignedHeaders=host") != std::string::npos, "signed headers");
        ASSERT_TRUE(link.url.find("X-Amz-Signature=") != std::string::npos, "signature");
        ASSERT_TRUE(link.url.find("clip%201.mp4") != std::string::npos, "key encoded");
        PASS();
    }
    {
        TEST(presign_ttl_bounds);
        auto too_long = backend->presign_get("users/alice/x", 8 * 86400s);
        ASSERT_TRUE(!too_long.success, "over 7 days rejected");
        ASSERT_TRUE(too_long.error == ErrorKind::InvalidInput, "InvalidInput");
        auto zero = backend->presign_get("users/alice/x", 0s);
        ASSERT_TRUE(!zero.success, "zero ttl rejected");
        PASS();
    }
    {
        TEST(url_encoding_helpers);
        ASSERT_EQ(net::url_encode("a b/c"), "a%20b%2Fc", "url_encode");
        ASSERT_EQ(net::url_encode_path("users/a b/c"), "users/a%20b/c", "path keeps slashes");
        auto parsed = net::ParsedUrl::parse("https://host.example:9000/bucket/key?x=1");
        ASSERT_TRUE(parsed.has_value(), "parse");
        ASSERT_EQ(parsed->host, "host.example", "host");
        ASSERT_EQ(parsed->port, 9000, "port");
        ASSERT_EQ(parsed->authority(), "host.example:9000", "authority keeps explicit port");
        auto v6 = net::ParsedUrl::parse("http://[::1]:8080/b");
        ASSERT_TRUE(v6.has_value(), "ipv6 parse");
        ASSERT_EQ(v6->host, "::1", "ipv6 host");
        ASSERT_EQ(v6->authority(), "[::1]:8080", "ipv6 authority");
        ASSERT_TRUE(!net::ParsedUrl::parse("no-scheme/path").has_value(), "missing scheme");
        ASSERT_TRUE(!net::ParsedUrl::parse("http://h:99999/").has_value(), "bad port");
        PASS();
    }
    {
        TEST(headers_sorted_case_insensitive);
        net::HttpHeaders headers;
        headers.set("X-Zeta", "1");
        headers.set("Content-Type", "text/plain");
        headers.add("x-zeta", "2");
        headers.set("CONTENT-TYPE", "application/json");
        ASSERT_EQ(headers.all().size(), 3u, "three entries");
        ASSERT_EQ(headers.all()[0].first, "content-type", "sorted lowercase");
        ASSERT_EQ(headers.get("Content-Type").value_or(""), "application/json", "set replaces");
        ASSERT_EQ(headers.all()[1].second, "1", "add keeps earlier value first");
        ASSERT_EQ(headers.all()[2].second, "2", "added value second");
        headers.remove("X-ZETA");
        ASSERT_EQ(headers.all().size(), 1u, "remove drops every value");
        PASS();
    }
    {
        TEST(sigv4_sign_sets_authorization);
        net::AwsSigV4Signer signer("AKIDEXAMPLE", "secret", "us-east-1");
        net::HttpRequest request;
        request.method = net::HttpMethod::PUT;
        request.url = "https://s3.example.com/media/k";
        request.headers.set("Authorization", "stale");
        signer.sign(request);
        auto auth = request.headers.get("Authorization").value_or("");
        ASSERT_TRUE(auth.starts_with("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/"), "credential");
        ASSERT_TRUE(auth.find("/us-east-1/s3/aws4_request") != std::string::npos, "scope");
        ASSERT_TRUE(auth.find("SignedHeaders=host;x-amz-content-sha256;x-amz-date,") !=
                    std::string::npos, "signed headers");
        ASSERT_EQ(request.headers.get("Host").value_or(""), "s3.example.com", "host header");
        ASSERT_EQ(request.headers.get("X-Amz-Content-Sha256").value_or(""),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                  "empty body hash");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. TransferCoordinator
// ---------------------------------------------------------------------------

static void test_coordinator() {
    std::cout << "\n=== TransferCoordinator ===" << std::endl;

    auto tmpdir = make_temp_dir("replistore-coord");
    auto source = tmpdir / "source.bin";
    auto data = make_payload(10000, 3);
    write_file(source, data);

    TransferCoordinator coordinator;

    {
        TEST(all_backends_commit);
        auto a = faulty(small_target("a1", tmpdir));
        auto b = faulty(small_target("b1", tmpdir));
        std::vector<std::shared_ptr<BackendClient>> backends{a, b};
        auto result = coordinator.upload(make_test_job("obj/all.bin", source, data.size()),
                                         backends, fast_options(2));
        ASSERT_TRUE(result.success, "success: " + result.error_message);
        ASSERT_TRUE(result.status == JobStatus::FullyReplicated, "fully replicated");
        ASSERT_TRUE(!result.degraded, "not degraded");
        ASSERT_EQ(result.outcomes.size(), 2u, "two outcomes");
        for (const auto& outcome : result.outcomes) {
            ASSERT_TRUE(outcome.committed(), outcome.backend + " committed");
            ASSERT_TRUE(outcome.multipart, "multipart path");
            ASSERT_EQ(outcome.parts_committed, 4u, "four parts");
            ASSERT_EQ(outcome.bytes_transferred, data.size(), "all bytes");
        }
        ASSERT_EQ(read_object(*a, "obj/all.bin"), data, "content on a");
        ASSERT_EQ(read_object(*b, "obj/all.bin"), data, "content on b");
        ASSERT_EQ(a->calls("complete"), 1, "one complete");
        ASSERT_EQ(a->calls("abort"), 0, "no abort");
        PASS();
    }
    {
        TEST(small_object_uses_single_put);
        auto small = tmpdir / "small.bin";
        auto small_data = make_payload(2000, 4);
        write_file(small, small_data);
        auto a = faulty(small_target("a2", tmpdir));
        std::vector<std::shared_ptr<BackendClient>> backends{a};
        auto result = coordinator.upload(make_test_job("obj/small.bin", small, small_data.size()),
                                         backends, fast_options(1));
        ASSERT_TRUE(result.success, "success");
        ASSERT_TRUE(!result.outcomes[0].multipart, "single put");
        ASSERT_EQ(a->calls("put"), 1, "one put");
        ASSERT_EQ(a->calls("initiate"), 0, "no multipart");
        ASSERT_EQ(read_object(*a, "obj/small.bin"), small_data, "content");
        PASS();
    }
    {
        TEST(failures_exceed_quorum_tolerance);
        auto a = faulty(small_target("a3", tmpdir));
        auto b = faulty(small_target("b3", tmpdir));
        auto c = faulty(small_target("c3", tmpdir));
        a->fail("initiate", ErrorKind::Forbidden);
        b->fail("initiate", ErrorKind::Unauthorized);
        std::vector<std::shared_ptr<BackendClient>> backends{a, b, c};
        auto result = coordinator.upload(make_test_job("obj/q.bin", source, data.size()),
                                         backends, fast_options(2));
        ASSERT_TRUE(!result.success, "2 failures with n=3, quorum 2 fails");
        ASSERT_TRUE(result.status == JobStatus::Failed, "Failed");
        ASSERT_EQ(result.committed_count(), 1u, "c committed");
        ASSERT_EQ(result.failed_backends().size(), 2u, "two failed backends named");
        ASSERT_EQ(a->calls("initiate"), 1, "permanent error not retried");
        PASS();
    }
    {
        TEST(quorum_met_is_degraded);
        auto a = faulty(small_target("a4", tmpdir));
        auto b = faulty(small_target("b4", tmpdir));
        b->fail("initiate", ErrorKind::Forbidden);
        std::vector<std::shared_ptr<BackendClient>> backends{a, b};
        auto result = coordinator.upload(make_test_job("obj/d.bin", source, data.size()),
                                         backends, fast_options(1));
        ASSERT_TRUE(result.success, "quorum 1 met");
        ASSERT_TRUE(result.degraded, "degraded");
        ASSERT_TRUE(result.status == JobStatus::Degraded, "Degraded status");
        ASSERT_EQ(result.failed_backends()[0], "b4", "b4 failed");
        PASS();
    }
    {
        TEST(part_failure_aborts_exactly_once);
        auto a = faulty(small_target("a5", tmpdir));
        a->fail_part(2, ErrorKind::Forbidden);
        std::vector<std::shared_ptr<BackendClient>> backends{a};
        auto result = coordinator.upload(make_test_job("obj/abort.bin", source, data.size()),
                                         backends, fast_options(1));
        ASSERT_TRUE(!result.success, "failed");
        const auto& outcome = result.outcomes[0];
        ASSERT_TRUE(outcome.state == OutcomeState::Failed, "outcome failed");
        ASSERT_TRUE(outcome.error == ErrorKind::Forbidden, "causing error kept");
        ASSERT_EQ(outcome.parts_committed, 1u, "one part committed before failure");
        ASSERT_TRUE(outcome.aborted, "aborted");
        ASSERT_EQ(a->calls("complete"), 0, "never completed");
        auto aborted = a->aborted_uploads();
        ASSERT_EQ(aborted.size(), 1u, "exactly one abort");
        ASSERT_EQ(aborted[0], outcome.upload_id, "abort for the same upload id");
        ASSERT_EQ(a->calls("part"), 2, "no parts after the failure");
        ASSERT_TRUE(dir_is_empty(tmpdir / "a5" / ".multipart"), "staged parts removed");
        ASSERT_EQ(read_object(*a, "obj/abort.bin"), "<missing>", "no object");
        PASS();
    }
    {
        TEST(complete_failure_aborts);
        auto a = faulty(small_target("a6", tmpdir));
        a->fail("complete", ErrorKind::InvalidInput);
        std::vector<std::shared_ptr<BackendClient>> backends{a};
        auto result = coordinator.upload(make_test_job("obj/complete.bin", source, data.size()),
                                         backends, fast_options(1));
        ASSERT_TRUE(!result.success, "failed");
        ASSERT_EQ(a->calls("complete"), 1, "complete attempted once");
        ASSERT_EQ(a->aborted_uploads().size(), 1u, "aborted once");
        PASS();
    }
    {
        TEST(transient_part_error_retried);
        auto a = faulty(small_target("a7", tmpdir));
        a->fail("part", ErrorKind::Throttled, 2);
        std::vector<std::shared_ptr<BackendClient>> backends{a};
        auto result = coordinator.upload(make_test_job("obj/retry.bin", source, data.size()),
                                         backends, fast_options(1));
        ASSERT_TRUE(result.success, "recovered by retry");
        ASSERT_EQ(a->calls("part"), 6, "four parts plus two retries");
        ASSERT_EQ(read_object(*a, "obj/retry.bin"), data, "content");
        PASS();
    }
    {
        TEST(timed_out_backend_degrades_job);
        auto a = faulty(small_target("a8", tmpdir));
        auto b = faulty(small_target("b8", tmpdir));
        a->fail("initiate", ErrorKind::Timeout);
        std::vector<std::shared_ptr<BackendClient>> backends{a, b};
        auto result = coordinator.upload(make_test_job("obj/timeout.bin", source, data.size()),
                                         backends, fast_options(1));
        ASSERT_TRUE(result.success, "quorum 1 met by b");
        ASSERT_TRUE(result.degraded, "degraded");
        ASSERT_TRUE(result.outcomes[0].state == OutcomeState::Failed, "a failed");
        ASSERT_TRUE(result.outcomes[0].error == ErrorKind::Timeout, "timeout");
        ASSERT_EQ(a->calls("initiate"), 3, "initial call plus max_retries");
        ASSERT_TRUE(result.outcomes[1].committed(), "b committed");
        PASS();
    }
    {
        TEST(cancellation_aborts_upload);
        auto a = faulty(small_target("a9", tmpdir));
        CancellationToken cancel;
        a->on_part([&](int n) { if (n == 2) cancel.cancel(); });
        auto options = fast_options(1);
        options.cancel = &cancel;
        std::vector<std::shared_ptr<BackendClient>> backends{a};
        auto result = coordinator.upload(make_test_job("obj/cancel.bin", source, data.size()),
                                         backends, options);
        ASSERT_TRUE(!result.success, "not successful");
        ASSERT_TRUE(result.outcomes[0].state == OutcomeState::Cancelled, "Cancelled outcome");
        ASSERT_TRUE(result.outcomes[0].error == ErrorKind::Cancelled, "Cancelled error");
        ASSERT_EQ(a->aborted_uploads().size(), 1u, "abort still executed");
        ASSERT_EQ(a->calls("complete"), 0, "never completed");
        ASSERT_TRUE(dir_is_empty(tmpdir / "a9" / ".multipart"), "staging removed");
        PASS();
    }
    {
        TEST(invalid_jobs_rejected_before_backend_calls);
        auto a = faulty(small_target("a10", tmpdir));
        std::vector<std::shared_ptr<BackendClient>> backends{a};

        auto mismatch = coordinator.upload(make_test_job("obj/x.bin", source, data.size() - 1),
                                           backends, fast_options(1));
        ASSERT_TRUE(mismatch.status == JobStatus::Rejected, "size mismatch rejected");

        auto zero_quorum = coordinator.upload(make_test_job("obj/x.bin", source, data.size()),
                                              backends, fast_options(0));
        ASSERT_TRUE(zero_quorum.status == JobStatus::Rejected, "quorum 0 rejected");

        auto big_quorum = coordinator.upload(make_test_job("obj/x.bin", source, data.size()),
                                             backends, fast_options(2));
        ASSERT_TRUE(big_quorum.status == JobStatus::Rejected, "quorum > n rejected");

        auto no_name = coordinator.upload(make_test_job("", source, data.size()),
                                          backends, fast_options(1));
        ASSERT_TRUE(no_name.status == JobStatus::Rejected, "empty name rejected");

        auto missing = coordinator.upload(make_test_job("obj/x.bin", tmpdir / "nope", 10),
                                          backends, fast_options(1));
        ASSERT_TRUE(missing.status == JobStatus::Rejected, "missing source rejected");

        auto too_big_options = fast_options(1);
        too_big_options.max_object_size = 5000;
        auto too_big = coordinator.upload(make_test_job("obj/x.bin", source, data.size()),
                                          backends, too_big_options);
        ASSERT_TRUE(too_big.status == JobStatus::Rejected, "oversized rejected");

        auto none = coordinator.upload(make_test_job("obj/x.bin", source, data.size()),
                                       {}, fast_options(1));
        ASSERT_TRUE(none.status == JobStatus::Rejected, "no backends rejected");

        ASSERT_EQ(a->calls("initiate") + a->calls("put") + a->calls("head"), 0,
                  "no backend call for rejected jobs");
        PASS();
    }
    {
        TEST(progress_reported_per_backend);
        std::mutex mutex;
        std::vector<ProgressSnapshot> seen;
        ProgressConfig config;
        config.min_interval = 0ms;
        ProgressTracker tracker([&](const ProgressSnapshot& s) {
            std::lock_guard lock(mutex);
            seen.push_back(s);
        }, config);
        TransferCoordinator tracked(&tracker);
        auto a = faulty(small_target("a11", tmpdir));
        auto b = faulty(small_target("b11", tmpdir));
        std::vector<std::shared_ptr<BackendClient>> backends{a, b};
        auto result = tracked.upload(make_test_job("obj/progress.bin", source, data.size()),
                                     backends, fast_options(2));
        ASSERT_TRUE(result.success, "success");

        auto aggregate = tracker.snapshot("job-obj/progress.bin");
        ASSERT_TRUE(aggregate.has_value(), "aggregate tracked");
        ASSERT_TRUE(aggregate->complete, "aggregate complete");
        ASSERT_EQ(aggregate->total_bytes, 2 * data.size(), "sum of backend totals");
        ASSERT_EQ(aggregate->bytes_transferred, 2 * data.size(), "all bytes");

        std::lock_guard lock(mutex);
        bool saw_a = false;
        bool saw_final = false;
        for (const auto& s : seen) {
            if (s.backend == "a11") saw_a = true;
            if (s.is_aggregate() && s.complete && s.percent == 100.0) saw_final = true;
        }
        ASSERT_TRUE(saw_a, "per-backend snapshot published");
        ASSERT_TRUE(saw_final, "final aggregate published");
        PASS();
    }

    fs::remove_all(tmpdir);
}

static void test_large_multipart_failure() {
    std::cout << "\n=== 150MB multipart failure ===" << std::endl;

    constexpr uint64_t MB = 1024 * 1024;
    auto tmpdir = make_temp_dir("replistore-large");
    auto source = tmpdir / "large.bin";
    {
        std::ofstream create(source, std::ios::binary);
    }
    fs::resize_file(source, 150 * MB);

    {
        TEST(part_two_failure_aborts_and_cleans_up);
        auto target = small_target("big", tmpdir);
        target.min_part_size = 50 * MB;
        target.max_part_size = 50 * MB;
        target.multipart_threshold = constants::DEFAULT_MULTIPART_THRESHOLD;
        target.max_retries = 0;
        auto backend = faulty(target);
        backend->fail_part(2, ErrorKind::Server);

        TransferCoordinator coordinator;
        std::vector<std::shared_ptr<BackendClient>> backends{backend};
        auto result = coordinator.upload(make_test_job("obj/large.bin", source, 150 * MB),
                                         backends, fast_options(1));
        ASSERT_TRUE(!result.success, "job failed");
        const auto& outcome = result.outcomes[0];
        ASSERT_TRUE(outcome.state == OutcomeState::Failed, "backend Failed");
        ASSERT_EQ(outcome.parts_total, 3u, "three 50MB parts planned");
        ASSERT_EQ(outcome.parts_committed, 1u, "part 1 committed");
        ASSERT_EQ(backend->calls("part"), 2, "part 3 never sent");
        ASSERT_EQ(backend->aborted_uploads().size(), 1u, "aborted once");
        ASSERT_EQ(backend->calls("complete"), 0, "no complete");
        ASSERT_TRUE(dir_is_empty(tmpdir / "big" / ".multipart"), "staged parts removed");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. Downloads and failover
// ---------------------------------------------------------------------------

static void test_download_and_failover() {
    std::cout << "\n=== RangedDownloader / FailoverResolver ===" << std::endl;

    auto tmpdir = make_temp_dir("replistore-dl");
    RangedDownloader downloader(nullptr, 1000);
    FailoverResolver resolver(downloader);

    auto a = faulty(small_target("a", tmpdir, 0));
    auto b = faulty(small_target("b", tmpdir, 1));
    auto big = make_payload(4500, 11);
    auto small = make_payload(600, 12);
    a->put_object("k/big.bin", bytes_of(big));
    b->put_object("k/big.bin", bytes_of(big));
    b->put_object("k/small.bin", bytes_of(small));
    a->put_object("k/empty.bin", {});

    {
        TEST(fetch_above_one_chunk);
        auto dest = tmpdir / "out" / "big.bin";
        fs::create_directories(dest.parent_path());
        int before = a->calls("range");
        auto result = downloader.fetch(*a, "k/big.bin", dest);
        ASSERT_TRUE(result.success, "fetch: " + result.error_message);
        ASSERT_EQ(result.bytes_written, big.size(), "bytes");
        ASSERT_EQ(read_file(dest), big, "byte-identical");
        ASSERT_EQ(a->calls("range") - before, 5, "ceil(4500 / 1000) ranged reads");
        PASS();
    }
    {
        TEST(fetch_below_one_chunk);
        auto dest = tmpdir / "out" / "small.bin";
        auto result = downloader.fetch(*b, "k/small.bin", dest);
        ASSERT_TRUE(result.success, "fetch");
        ASSERT_EQ(read_file(dest), small, "byte-identical");
        PASS();
    }
    {
        TEST(zero_length_object);
        auto dest = tmpdir / "out" / "empty.bin";
        auto result = downloader.fetch(*a, "k/empty.bin", dest);
        ASSERT_TRUE(result.success, "fetch");
        ASSERT_TRUE(fs::exists(dest), "file created");
        ASSERT_EQ(fs::file_size(dest), 0u, "empty");
        PASS();
    }
    {
        TEST(short_range_is_error_and_removes_partial);
        auto target = small_target("short", tmpdir);
        auto shorty = faulty(target);
        shorty->put_object("k/big.bin", bytes_of(big));
        shorty->short_ranges();
        auto dest = tmpdir / "out" / "short.bin";
        auto result = downloader.fetch(*shorty, "k/big.bin", dest);
        ASSERT_TRUE(!result.success, "short read fails");
        ASSERT_TRUE(result.error == ErrorKind::Protocol, "Protocol error");
        ASSERT_TRUE(!fs::exists(dest), "partial file removed");
        PASS();
    }
    {
        TEST(range_failure_removes_partial);
        auto target = small_target("flaky", tmpdir);
        auto flaky = faulty(target);
        flaky->put_object("k/big.bin", bytes_of(big));
        flaky->fail("range", ErrorKind::Forbidden);
        auto dest = tmpdir / "out" / "flaky.bin";
        auto result = downloader.fetch(*flaky, "k/big.bin", dest);
        ASSERT_TRUE(!result.success, "fails");
        ASSERT_TRUE(!fs::exists(dest), "partial file removed");
        PASS();
    }
    {
        TEST(overwrite_mid_download_is_detected);
        auto changing = faulty(small_target("changing", tmpdir, 0));
        changing->put_object("k/big.bin", bytes_of(big));
        auto replacement = make_payload(big.size(), 99);
        bool overwritten = false;
        changing->on_range([&](const std::string& key, uint64_t start) {
            if (start > 0 && !overwritten) {
                overwritten = true;
                changing->put_object(key, bytes_of(replacement));
            }
        });

        auto head = changing->head_object("k/big.bin");
        ASSERT_NOT_EMPTY(head.metadata.etag, "local head reports an etag");

        auto dest = tmpdir / "out" / "changing.bin";
        auto result = downloader.fetch(*changing, "k/big.bin", dest);
        ASSERT_TRUE(overwritten, "object replaced after the first chunk");
        ASSERT_TRUE(!result.success, "mixed versions rejected");
        ASSERT_TRUE(result.error == ErrorKind::Protocol, "Protocol error");
        ASSERT_TRUE(!fs::exists(dest), "partial file removed");

        // The resolver moves on to a replica that still holds one version
        overwritten = false;
        changing->put_object("k/big.bin", bytes_of(big));
        std::vector<std::shared_ptr<BackendClient>> backends{changing, b};
        auto resolved = resolver.resolve("k/big.bin", backends, dest);
        ASSERT_TRUE(resolved.success, "resolve: " + resolved.error_message);
        ASSERT_EQ(resolved.backend, "b", "served by the unchanged replica");
        ASSERT_EQ(read_file(dest), big, "byte-identical");
        PASS();
    }
    {
        TEST(round_trip_through_resolver);
        auto dest = tmpdir / "out" / "rt.bin";
        std::vector<std::shared_ptr<BackendClient>> backends{b, a};
        auto result = resolver.resolve("k/big.bin", backends, dest);
        ASSERT_TRUE(result.success, "resolve");
        ASSERT_EQ(result.backend, "a", "priority 0 served first");
        ASSERT_TRUE(result.attempts.empty(), "no failed attempts");
        ASSERT_EQ(read_file(dest), big, "byte-identical");
        PASS();
    }
    {
        TEST(failover_when_missing_on_primary);
        auto dest = tmpdir / "out" / "fo.bin";
        std::vector<std::shared_ptr<BackendClient>> backends{a, b};
        auto result = resolver.resolve("k/small.bin", backends, dest);
        ASSERT_TRUE(result.success, "served by b");
        ASSERT_EQ(result.backend, "b", "backend b");
        ASSERT_EQ(result.attempts.size(), 1u, "a recorded");
        ASSERT_TRUE(result.attempts[0].error == ErrorKind::NotFound, "a NotFound");
        ASSERT_EQ(result.failovers(), 1u, "one failover");
        ASSERT_EQ(read_file(dest), small, "content");
        PASS();
    }
    {
        TEST(failover_when_primary_read_fails);
        a->fail("range", ErrorKind::Server);
        auto dest = tmpdir / "out" / "fo2.bin";
        std::vector<std::shared_ptr<BackendClient>> backends{a, b};
        auto result = resolver.resolve("k/big.bin", backends, dest);
        ASSERT_TRUE(result.success, "served by b");
        ASSERT_EQ(result.backend, "b", "backend b");
        ASSERT_TRUE(result.attempts[0].error == ErrorKind::Server, "a server error");
        ASSERT_EQ(read_file(dest), big, "content");
        a->fail("range", ErrorKind::Server, 0);
        PASS();
    }
    {
        TEST(all_backends_fail);
        auto dest = tmpdir / "out" / "none.bin";
        std::vector<std::shared_ptr<BackendClient>> backends{a, b};
        auto result = resolver.resolve("k/absent.bin", backends, dest);
        ASSERT_TRUE(!result.success, "fails");
        ASSERT_TRUE(result.error == ErrorKind::NotFound, "NotFound everywhere");
        ASSERT_EQ(result.attempts.size(), 2u, "both attempts listed");
        ASSERT_TRUE(result.error_message.find("a:") != std::string::npos &&
                    result.error_message.find("b:") != std::string::npos, "reasons for each backend");
        ASSERT_TRUE(!fs::exists(dest), "no file");
        PASS();
    }
    {
        TEST(stable_priority_order);
        auto c = faulty(small_target("c", tmpdir, 1));
        std::vector<std::shared_ptr<BackendClient>> backends{b, c, a};
        auto ordered = FailoverResolver::order_by_priority(backends);
        ASSERT_EQ(ordered[0]->name(), "a", "rank 0 first");
        ASSERT_EQ(ordered[1]->name(), "b", "equal ranks keep order");
        ASSERT_EQ(ordered[2]->name(), "c", "equal ranks keep order");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 7. Progress
// ---------------------------------------------------------------------------

static void test_progress() {
    std::cout << "\n=== Progress ===" << std::endl;

    auto t0 = std::chrono::steady_clock::time_point{} + 1000s;
    auto now = t0;
    auto clock = [&now] { return now; };

    {
        TEST(throttled_publishing);
        std::vector<ProgressSnapshot> seen;
        ProgressTracker tracker([&](const ProgressSnapshot& s) { seen.push_back(s); }, {}, clock);
        now = t0;
        tracker.begin("j", "a", 1000);
        tracker.begin("j", "b", 1000);
        tracker.update("j", "a", 100);
        ASSERT_EQ(seen.size(), 2u, "first update publishes backend and aggregate");

        now += 100ms;
        tracker.update("j", "a", 10);
        ASSERT_EQ(seen.size(), 2u, "small change within interval is throttled");

        now += 100ms;
        tracker.update("j", "a", 100);
        ASSERT_EQ(seen.size(), 4u, "10 point jump publishes backend and aggregate");
        ASSERT_EQ(seen[2].backend, "a", "backend snapshot first");
        ASSERT_TRUE(seen[3].is_aggregate(), "aggregate moved 5.5 points");

        now += 2s;
        size_t before = seen.size();
        tracker.update("j", "b", 1);
        ASSERT_TRUE(seen.size() > before, "interval elapsed publishes");

        tracker.finish("j", "a");
        tracker.finish("j", "b");
        ASSERT_TRUE(seen.back().is_aggregate(), "aggregate last");
        ASSERT_TRUE(seen.back().complete, "aggregate complete");
        ASSERT_EQ(seen.back().bytes_transferred, 2000u, "all bytes");
        ASSERT_EQ(seen.back().percent, 100.0, "100 percent");
        PASS();
    }
    {
        TEST(speed_and_eta);
        ProgressTracker tracker({}, {}, clock);
        now = t0;
        tracker.begin("s", "a", 10000);
        now += 1s;
        tracker.update("s", "a", 1000);
        auto snap = tracker.snapshot("s", "a");
        ASSERT_TRUE(snap.has_value(), "tracked");
        ASSERT_EQ(snap->speed, 1000.0, "first sample");
        ASSERT_TRUE(snap->eta.has_value(), "eta known");
        ASSERT_EQ(snap->eta->count(), 9, "9000 bytes at 1000 B/s");

        now += 1s;
        tracker.update("s", "a", 3000);
        snap = tracker.snapshot("s", "a");
        ASSERT_TRUE(std::abs(snap->speed - 1600.0) < 1e-6, "EWMA 0.3*3000 + 0.7*1000");
        PASS();
    }
    {
        TEST(unknown_eta_without_progress);
        ProgressTracker tracker({}, {}, clock);
        now = t0;
        tracker.begin("z", "a", 100);
        auto snap = tracker.snapshot("z", "a");
        ASSERT_TRUE(!snap->eta.has_value(), "eta unknown at zero speed");
        ASSERT_TRUE(!tracker.snapshot("nope").has_value(), "unknown job");
        PASS();
    }
    {
        TEST(discard_and_end_job);
        ProgressTracker tracker({}, {}, clock);
        tracker.begin("d", "a", 100);
        tracker.begin("d", "b", 300);
        tracker.update("d", "b", 50);
        tracker.discard("d", "b");
        auto agg = tracker.snapshot("d");
        ASSERT_EQ(agg->total_bytes, 100u, "b's total removed");
        ASSERT_EQ(agg->bytes_transferred, 0u, "b's bytes removed");
        tracker.finish("d", "a");
        ASSERT_TRUE(tracker.snapshot("d")->complete, "completes with remaining backend");
        tracker.end_job("d");
        ASSERT_EQ(tracker.active_keys(), 0u, "job state dropped");
        PASS();
    }
    {
        TEST(discarding_last_running_backend_completes_aggregate);
        std::vector<ProgressSnapshot> seen;
        ProgressTracker tracker([&](const ProgressSnapshot& s) { seen.push_back(s); }, {}, clock);
        now = t0;
        tracker.begin("g", "a", 100);
        tracker.begin("g", "b", 100);
        tracker.update("g", "a", 100);
        tracker.finish("g", "a");
        tracker.update("g", "b", 50);
        ASSERT_TRUE(!tracker.snapshot("g")->complete, "b still running");
        tracker.discard("g", "b");
        ASSERT_TRUE(!seen.empty(), "published");
        ASSERT_TRUE(seen.back().is_aggregate(), "aggregate last");
        ASSERT_TRUE(seen.back().complete, "aggregate completes after the failed backend");
        ASSERT_EQ(seen.back().bytes_transferred, 100u, "only the finished backend counts");
        ASSERT_EQ(seen.back().total_bytes, 100u, "failed backend's total removed");

        // A lone abandoned attempt leaves nothing finished to report
        seen.clear();
        tracker.begin("f", "a", 100);
        tracker.discard("f", "a");
        for (const auto& s : seen) {
            ASSERT_TRUE(!(s.job_id == "f" && s.complete), "no completion without a finished backend");
        }
        PASS();
    }
    {
        TEST(dispatcher_delivers_in_order);
        ProgressDispatcher dispatcher;
        std::vector<uint64_t> got;
        dispatcher.subscribe([&](const ProgressSnapshot& s) { got.push_back(s.bytes_transferred); });
        dispatcher.subscribe([](const ProgressSnapshot&) {
            throw std::runtime_error("subscriber failure");
        });
        for (uint64_t i = 1; i <= 5; ++i) {
            ProgressSnapshot s;
            s.bytes_transferred = i;
            dispatcher.publish(s);
        }
        dispatcher.flush();
        ASSERT_EQ(got.size(), 5u, "all delivered despite failing subscriber");
        ASSERT_EQ(got[4], 5u, "in order");
        dispatcher.stop();
        PASS();
    }
    {
        TEST(dispatcher_unsubscribe);
        ProgressDispatcher dispatcher;
        int count = 0;
        auto id = dispatcher.subscribe([&](const ProgressSnapshot&) { ++count; });
        dispatcher.publish({});
        dispatcher.flush();
        dispatcher.unsubscribe(id);
        dispatcher.publish({});
        dispatcher.flush();
        ASSERT_EQ(count, 1, "no delivery after unsubscribe");
        PASS();
    }
    {
        TEST(formatting_helpers);
        ASSERT_EQ(format_bytes(512), "512.00 B", "bytes");
        ASSERT_EQ(format_bytes(1536), "1.50 KB", "kilobytes");
        ASSERT_EQ(format_bytes(13107200), "12.50 MB", "megabytes");
        ASSERT_EQ(format_duration(0s), "00:00", "zero");
        ASSERT_EQ(format_duration(75s), "01:15", "minutes");
        ASSERT_EQ(format_duration(3725s), "01:02:05", "hours");
        ASSERT_EQ(progress_bar(50.0, 10), "[#####.....]", "half bar");
        ASSERT_EQ(progress_bar(150.0, 4), "[####]", "clamped");
        ProgressSnapshot s;
        s.percent = 50.0;
        s.bytes_transferred = 1024;
        s.total_bytes = 2048;
        s.eta = 90s;
        auto line = format_progress(s);
        ASSERT_TRUE(line.starts_with("total"), "aggregate label");
        ASSERT_TRUE(line.find("ETA 01:30") != std::string::npos, "eta shown");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Access tokens
// ---------------------------------------------------------------------------

static void test_access_tokens() {
    std::cout << "\n=== Access tokens ===" << std::endl;

    auto now = std::chrono::system_clock::time_point{std::chrono::seconds(1700000000)};
    auto clock = [&now] { return now; };
    AccessTokenIssuer issuer("server-secret", clock);

    {
        TEST(issue_then_verify);
        auto token = issuer.issue("alice", "report.pdf", 60s);
        auto claims = issuer.verify(token);
        ASSERT_TRUE(claims.has_value(), "verifies");
        ASSERT_EQ(claims->identity, "alice", "identity");
        ASSERT_EQ(claims->object_name, "report.pdf", "object");
        ASSERT_TRUE(claims->expires_at == now + 60s, "expiry");
        PASS();
    }
    {
        TEST(expires_after_ttl);
        auto issued_at = now;
        auto token = issuer.issue("alice", "report.pdf", 60s);
        now = issued_at + 60s;
        ASSERT_TRUE(issuer.verify(token).has_value(), "valid through the expiry second");
        now = issued_at + 61s;
        ASSERT_TRUE(!issuer.verify(token).has_value(), "invalid after ttl");
        now = issued_at;
        PASS();
    }
    {
        TEST(expiry_checked_below_one_second);
        auto issued_at = now + 500ms;
        now = issued_at;
        auto token = issuer.issue("alice", "report.pdf", 10s);
        now = issued_at + 10s + 400ms;
        ASSERT_TRUE(!issuer.verify(token).has_value(), "invalid 0.4s past ttl");
        now = issued_at + 9s;
        ASSERT_TRUE(issuer.verify(token).has_value(), "valid before ttl");
        now = issued_at + 9s + 500ms;
        ASSERT_TRUE(issuer.verify(token).has_value(), "valid at the stamped expiry");
        now = issued_at + 9s + 501ms;
        ASSERT_TRUE(!issuer.verify(token).has_value(), "invalid just past the stamped expiry");
        now = std::chrono::system_clock::time_point{std::chrono::seconds(1700000000)};
        PASS();
    }
    {
        TEST(forged_and_malformed_rejected);
        auto token = issuer.issue("alice", "report.pdf", 60s);
        auto tampered = token;
        tampered.back() = tampered.back() == '0' ? '1' : '0';
        ASSERT_TRUE(!issuer.verify(tampered).has_value(), "bad signature");

        auto swapped = "mallory" + token.substr(token.find(':'));
        ASSERT_TRUE(!issuer.verify(swapped).has_value(), "identity swap");

        AccessTokenIssuer other("other-secret", clock);
        ASSERT_TRUE(!other.verify(token).has_value(), "different secret");

        ASSERT_TRUE(!issuer.verify("").has_value(), "empty");
        ASSERT_TRUE(!issuer.verify("a:b:c").has_value(), "too few parts");
        ASSERT_TRUE(!issuer.verify("a:b:notanumber:sig").has_value(), "bad expiry");
        ASSERT_TRUE(!issuer.verify("a:b:1:2:3").has_value(), "too many parts");
        PASS();
    }
    {
        TEST(input_errors_throw);
        bool threw = false;
        try { issuer.issue("al:ice", "x", 60s); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "delimiter in identity");
        threw = false;
        try { issuer.issue("alice", "a:b", 60s); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "delimiter in object name");
        threw = false;
        try { issuer.issue("alice", "x", 0s); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "zero ttl");
        threw = false;
        try { AccessTokenIssuer empty(""); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "empty secret");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. Rate limiting
// ---------------------------------------------------------------------------

static void test_rate_limiter() {
    std::cout << "\n=== Rate limiting ===" << std::endl;

    auto t0 = std::chrono::steady_clock::time_point{} + 1000s;
    auto now = t0;
    auto clock = [&now] { return now; };

    RateLimiterConfig config;
    config.limit = 3;
    config.period = 10s;

    {
        TEST(limit_then_deny);
        now = t0;
        RateLimiter limiter(config, clock);
        ASSERT_TRUE(limiter.allow("alice"), "1");
        now += 1s;
        ASSERT_TRUE(limiter.allow("alice"), "2");
        ASSERT_TRUE(limiter.allow("alice"), "3");
        ASSERT_TRUE(!limiter.allow("alice"), "4th within period denied");
        ASSERT_EQ(limiter.remaining("alice"), 0u, "none remaining");
        ASSERT_TRUE(limiter.allow("bob"), "identities independent");
        PASS();
    }
    {
        TEST(window_slides);
        now = t0;
        RateLimiter limiter(config, clock);
        limiter.allow("alice");
        now = t0 + 5s;
        limiter.allow("alice");
        limiter.allow("alice");
        ASSERT_TRUE(!limiter.allow("alice"), "full");
        now = t0 + 10s;
        ASSERT_TRUE(limiter.allow("alice"), "first call aged out after period");
        ASSERT_TRUE(!limiter.allow("alice"), "full again");
        PASS();
    }
    {
        TEST(idle_windows_reaped);
        now = t0;
        RateLimiter limiter(config, clock);
        limiter.allow("a");
        limiter.allow("b");
        ASSERT_EQ(limiter.window_count(), 2u, "two windows");
        now = t0 + 11s;
        limiter.allow("c");
        ASSERT_EQ(limiter.window_count(), 1u, "lazy reap dropped idle windows");
        now = t0 + 30s;
        ASSERT_EQ(limiter.reap_idle(), 1u, "explicit reap");
        ASSERT_EQ(limiter.window_count(), 0u, "empty");
        PASS();
    }
    {
        TEST(invalid_config_throws);
        RateLimiterConfig bad;
        bad.limit = 0;
        bool threw = false;
        try { RateLimiter limiter(bad); } catch (const std::invalid_argument&) { threw = true; }
        ASSERT_TRUE(threw, "zero limit");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 10. Configuration
// ---------------------------------------------------------------------------

static void test_config() {
    std::cout << "\n=== EngineConfig ===" << std::endl;

    unsetenv("AWS_ACCESS_KEY_ID");
    unsetenv("AWS_SECRET_ACCESS_KEY");
    unsetenv("REPLISTORE_TOKEN_SECRET");

    auto tmpdir = make_temp_dir("replistore-config");

    {
        TEST(backend_validation);
        BackendConfig bc;
        ASSERT_NOT_EMPTY(bc.validate(), "empty type fails");
        bc.type = "ftp";
        ASSERT_TRUE(bc.validate().find("unknown") != std::string::npos, "unknown type");
        bc.type = "s3";
        ASSERT_TRUE(bc.validate().find("bucket") != std::string::npos, "s3 needs bucket");
        bc.params["bucket"] = "media";
        ASSERT_TRUE(bc.validate().find("access_key") != std::string::npos, "s3 needs credentials");
        bc.params["access_key"] = "AK";
        bc.params["secret_key"] = "SK";
        ASSERT_EMPTY(bc.validate(), "complete s3 backend");
        bc.params["min_part_size"] = "abc";
        ASSERT_TRUE(bc.validate().find("min_part_size") != std::string::npos, "numeric check");
        bc.params["min_part_size"] = "100";
        bc.params["max_part_size"] = "10";
        ASSERT_TRUE(bc.validate().find("max_part_size") != std::string::npos, "min <= max");
        bc.params["min_part_size"] = "1024";
        bc.params["max_part_size"] = "4096";
        bc.params["multipart_threshold"] = "8192";
        ASSERT_TRUE(bc.validate().find("multipart_threshold") != std::string::npos,
                    "threshold above max part size");
        bc.params["multipart_threshold"] = "4096";
        ASSERT_EMPTY(bc.validate(), "threshold at max part size");

        BackendConfig local;
        local.type = "local";
        ASSERT_TRUE(local.validate().find("path") != std::string::npos, "local needs path");
        local.params["path"] = tmpdir.string();
        ASSERT_EMPTY(local.validate(), "local with path");
        PASS();
    }
    {
        TEST(backend_to_target);
        BackendConfig bc;
        bc.name = "wasabi";
        bc.type = "s3";
        bc.params = {{"bucket", "media"}, {"endpoint", "https://s3.wasabisys.com"},
                     {"region", "eu-central-1"}, {"priority", "-1"}, {"max_retries", "5"},
                     {"verify_ssl", "false"}, {"use_path_style", "true"},
                     {"connect_timeout", "3"}, {"path_prefix", "prod/"}};
        auto target = bc.to_target();
        ASSERT_EQ(target.name, "wasabi", "name");
        ASSERT_EQ(target.region, "eu-central-1", "region");
        ASSERT_EQ(target.priority_rank, -1, "priority");
        ASSERT_EQ(target.max_retries, 5u, "max_retries");
        ASSERT_TRUE(!target.verify_ssl, "verify_ssl");
        ASSERT_TRUE(target.use_path_style, "path style");
        ASSERT_EQ(target.connect_timeout.count(), 3, "connect timeout");
        ASSERT_EQ(target.path_prefix, "prod/", "prefix");
        PASS();
    }
    {
        TEST(cli_backend_groups);
        const char* args[] = {
            "replistore", "upload", "file.bin",
            "--identity", "alice",
            "--backend-type", "s3",
            "--backend-name", "aws",
            "--backend-bucket", "media",
            "--backend-access-key", "AK",
            "--backend-secret-key", "SK",
            "--backend-path-style",
            "--backend-type", "local",
            "--backend-path", "/srv/replica",
            "--backend-priority", "2",
            "--quorum", "2",
            "--token-secret", "s3cret",
        };
        int argc = sizeof(args) / sizeof(args[0]);
        auto cfg = EngineConfig::from_args(argc, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->args.size(), 2u, "command and argument");
        ASSERT_EQ(cfg->args[0], "upload", "command");
        ASSERT_EQ(cfg->identity, "alice", "identity");
        ASSERT_EQ(cfg->backends.size(), 2u, "two backends");
        ASSERT_EQ(cfg->backends[0].name, "aws", "explicit name");
        ASSERT_EQ(cfg->backends[0].params["use_path_style"], "true", "bool flag");
        ASSERT_EQ(cfg->backends[1].name, "local2", "default name");
        ASSERT_EQ(cfg->backends[1].params["path"], "/srv/replica", "path");
        ASSERT_EQ(cfg->backends[1].params["priority"], "2", "priority");
        ASSERT_EQ(cfg->quorum, 2u, "quorum");
        ASSERT_EMPTY(cfg->validate(), "valid config");
        PASS();
    }
    {
        TEST(cli_errors);
        const char* orphan[] = {"replistore", "--backend-bucket", "x"};
        ASSERT_TRUE(!EngineConfig::from_args(3, const_cast<char**>(orphan)).has_value(),
                    "backend flag before --backend-type");
        const char* unknown[] = {"replistore", "--bogus"};
        ASSERT_TRUE(!EngineConfig::from_args(2, const_cast<char**>(unknown)).has_value(),
                    "unknown option");
        const char* missing[] = {"replistore", "--quorum"};
        ASSERT_TRUE(!EngineConfig::from_args(2, const_cast<char**>(missing)).has_value(),
                    "missing value");
        const char* bad_number[] = {"replistore", "--quorum", "two"};
        ASSERT_TRUE(!EngineConfig::from_args(3, const_cast<char**>(bad_number)).has_value(),
                    "non-numeric value");
        PASS();
    }
    {
        TEST(json_config);
        auto path = tmpdir / "config.json";
        write_file(path, R"({
            "quorum": 2,
            "token_secret": "from-json",
            "token_ttl": 120,
            "download_chunk_size": 4096,
            "scratch_dir": "/var/tmp/rs",
            "backends": [
                {"name": "primary", "type": "local", "path": "/srv/a", "priority": 0},
                {"name": "replica", "type": "local", "path": "/srv/b", "priority": 1,
                 "verify_ssl": false, "min_part_size": 1024}
            ]
        })");
        EngineConfig cfg;
        ASSERT_TRUE(cfg.load_json(path), "loads");
        ASSERT_EQ(cfg.quorum, 2u, "quorum");
        ASSERT_EQ(cfg.token_secret, "from-json", "secret");
        ASSERT_EQ(cfg.token_ttl.count(), 120, "ttl");
        ASSERT_EQ(cfg.download_chunk_size, 4096u, "chunk size");
        ASSERT_EQ(cfg.scratch_dir.string(), "/var/tmp/rs", "scratch");
        ASSERT_EQ(cfg.backends.size(), 2u, "backends");
        ASSERT_EQ(cfg.backends[1].params["priority"], "1", "numbers become strings");
        ASSERT_EQ(cfg.backends[1].params["verify_ssl"], "false", "booleans become strings");
        ASSERT_EQ(cfg.backends[1].params["min_part_size"], "1024", "part size");
        ASSERT_EMPTY(cfg.validate(), "valid");
        PASS();
    }
    {
        TEST(json_errors);
        auto path = tmpdir / "bad.json";
        write_file(path, "{ not json");
        EngineConfig cfg;
        ASSERT_TRUE(!cfg.load_json(path), "parse error");
        ASSERT_TRUE(!cfg.load_json(tmpdir / "missing.json"), "missing file");
        write_file(path, R"({"backends": {"type": "local"}})");
        ASSERT_TRUE(!cfg.load_json(path), "backends must be an array");
        PASS();
    }
    {
        TEST(environment_fallbacks);
        setenv("AWS_ACCESS_KEY_ID", "ENVKEY", 1);
        setenv("AWS_SECRET_ACCESS_KEY", "ENVSECRET", 1);
        setenv("REPLISTORE_TOKEN_SECRET", "env-token-secret", 1);
        EngineConfig cfg;
        BackendConfig bc;
        bc.type = "s3";
        bc.params["bucket"] = "media";
        cfg.backends.push_back(bc);
        cfg.apply_defaults();
        unsetenv("AWS_ACCESS_KEY_ID");
        unsetenv("AWS_SECRET_ACCESS_KEY");
        unsetenv("REPLISTORE_TOKEN_SECRET");
        ASSERT_EQ(cfg.backends[0].params["access_key"], "ENVKEY", "access key from env");
        ASSERT_EQ(cfg.backends[0].params["secret_key"], "ENVSECRET", "secret key from env");
        ASSERT_EQ(cfg.token_secret, "env-token-secret", "token secret from env");
        ASSERT_EQ(cfg.backends[0].name, "s31", "default name");
        ASSERT_TRUE(!cfg.scratch_dir.empty(), "scratch default");
        PASS();
    }
    {
        TEST(engine_validation);
        EngineConfig cfg;
        ASSERT_TRUE(cfg.validate().find("backend") != std::string::npos, "needs a backend");
        BackendConfig bc;
        bc.name = "disk";
        bc.type = "local";
        bc.params["path"] = tmpdir.string();
        cfg.backends.push_back(bc);
        ASSERT_TRUE(cfg.validate().find("secret") != std::string::npos, "needs token secret");
        cfg.token_secret = "x";
        ASSERT_EMPTY(cfg.validate(), "valid");
        cfg.quorum = 2;
        ASSERT_TRUE(cfg.validate().find("quorum") != std::string::npos, "quorum > backends");
        cfg.quorum = 1;
        cfg.backends.push_back(bc);
        ASSERT_TRUE(cfg.validate().find("duplicate") != std::string::npos, "duplicate names");
        cfg.backends.pop_back();
        cfg.share_link_ttl = 8 * 86400s;
        ASSERT_TRUE(cfg.validate().find("share_link_ttl") != std::string::npos, "share ttl bound");
        PASS();
    }
    {
        TEST(secrets_masked);
        EngineConfig cfg;
        cfg.token_secret = "supersecretvalue";
        BackendConfig bc;
        bc.name = "aws";
        bc.type = "s3";
        bc.params["secret_key"] = "wJalrXUtnFEMI";
        cfg.backends.push_back(bc);
        std::ostringstream out;
        cfg.print(out);
        auto text = out.str();
        ASSERT_TRUE(text.find("supersecretvalue") == std::string::npos, "token secret hidden");
        ASSERT_TRUE(text.find("wJalrXUtnFEMI") == std::string::npos, "backend secret hidden");
        ASSERT_EQ(mask_secret("abcdefgh"), "abcd****", "mask");
        ASSERT_EQ(mask_secret(""), "(unset)", "unset");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 11. TransferEngine
// ---------------------------------------------------------------------------

static EngineSettings test_settings(const fs::path& tmpdir) {
    EngineSettings settings;
    settings.token_secret = "engine-secret";
    settings.scratch_dir = tmpdir / "scratch";
    settings.retry.initial_delay = 1ms;
    settings.retry.max_delay = 5ms;
    settings.download_chunk_size = 1000;
    settings.rate_limit.limit = 2;
    settings.rate_limit.period = 60s;
    return settings;
}

static void test_engine() {
    std::cout << "\n=== TransferEngine ===" << std::endl;

    auto tmpdir = make_temp_dir("replistore-engine");
    auto primary = faulty(small_target("primary", tmpdir, 0));
    auto replica = faulty(small_target("replica", tmpdir, 1));
    TransferEngine engine({primary, replica}, test_settings(tmpdir));

    auto source = tmpdir / "in" / "holiday video.mp4";
    auto data = make_payload(10000, 21);
    write_file(source, data);

    {
        TEST(copy_into_place_leaves_no_partial_file);
        auto dir = tmpdir / "place";
        fs::create_directories(dir);
        auto dest = dir / "out.bin";

        std::error_code ec;
        copy_into_place(dir / "missing", dest, ec);
        ASSERT_TRUE(static_cast<bool>(ec), "missing source fails");
        ASSERT_TRUE(!fs::exists(dest), "no destination after failed copy");
        ASSERT_TRUE(dir_is_empty(dir), "temporary copy removed");

        write_file(dest, "previous");
        copy_into_place(dir / "missing", dest, ec);
        ASSERT_TRUE(static_cast<bool>(ec), "fails again");
        ASSERT_EQ(read_file(dest), "previous", "existing destination untouched");

        write_file(dir / "staged", "fresh bytes");
        copy_into_place(dir / "staged", dest, ec);
        ASSERT_TRUE(!ec, "copy succeeds");
        ASSERT_EQ(read_file(dest), "fresh bytes", "destination replaced");
        ASSERT_TRUE(fs::exists(dir / "staged"), "copy keeps the source");

        move_into_place(dir / "staged", dest, ec);
        ASSERT_TRUE(!ec, "same-filesystem move");
        ASSERT_TRUE(!fs::exists(dir / "staged"), "source moved");
        fs::remove_all(dir);
        PASS();
    }
    {
        TEST(sanitize_object_names);
        ASSERT_EQ(TransferEngine::sanitize_object_name("../../etc/passwd"), "etcpasswd", "traversal");
        ASSERT_EQ(TransferEngine::sanitize_object_name("my file (1).txt"), "my file 1.txt", "unsafe chars");
        ASSERT_EQ(TransferEngine::sanitize_object_name("./a.b"), "a.b", "dot slash");
        ASSERT_EQ(TransferEngine::sanitize_object_name("///"), "", "nothing left");
        ASSERT_EQ(TransferEngine::sanitize_object_name(".."), "", "dots only");
        auto long_name = std::string(250, 'x') + ".pdf";
        auto cut = TransferEngine::sanitize_object_name(long_name);
        ASSERT_EQ(cut.size(), 200u, "capped at 200");
        ASSERT_TRUE(cut.ends_with(".pdf"), "extension kept");
        ASSERT_EQ(TransferEngine::object_key("alice", "a.txt"), "users/alice/a.txt", "namespace");
        ASSERT_TRUE(TransferEngine::valid_owner("alice@example.com"), "email owner");
        ASSERT_TRUE(!TransferEngine::valid_owner("../root"), "traversal owner");
        ASSERT_TRUE(!TransferEngine::valid_owner("a:b"), "delimiter owner");
        PASS();
    }

    std::string token;
    {
        TEST(upload_issues_token);
        std::mutex mutex;
        std::vector<ProgressSnapshot> seen;
        auto id = engine.subscribe_progress([&](const ProgressSnapshot& s) {
            std::lock_guard lock(mutex);
            seen.push_back(s);
        });
        auto job = engine.make_job("alice", "holiday video.mp4", source);
        ASSERT_EQ(job.declared_size, data.size(), "size from file");
        auto result = engine.upload(job);
        engine.flush_progress();
        engine.unsubscribe_progress(id);
        ASSERT_TRUE(result.success, "upload: " + result.error_message);
        ASSERT_TRUE(result.status == JobStatus::FullyReplicated, "both backends");
        ASSERT_EQ(result.object_key, "users/alice/holiday video.mp4", "key");
        ASSERT_NOT_EMPTY(result.token, "token issued");
        token = result.token;
        ASSERT_EQ(read_object(*primary, result.object_key), data, "primary content");
        ASSERT_EQ(read_object(*replica, result.object_key), data, "replica content");

        std::lock_guard lock(mutex);
        bool complete = false;
        for (const auto& s : seen) {
            if (s.job_id == result.job_id && s.is_aggregate() && s.complete) complete = true;
        }
        ASSERT_TRUE(complete, "subscriber saw completion");
        ASSERT_EQ(engine.progress().active_keys(), 0u, "progress state released");
        PASS();
    }
    {
        TEST(download_with_token_round_trip);
        auto dest = tmpdir / "out" / "via-token.mp4";
        fs::create_directories(dest.parent_path());
        auto result = engine.download_with_token(token, dest);
        ASSERT_TRUE(result.success, "download: " + result.error_message);
        ASSERT_EQ(result.backend, "primary", "highest priority");
        ASSERT_EQ(read_file(dest), data, "byte-identical");
        ASSERT_TRUE(dir_is_empty(tmpdir / "scratch"), "scratch removed");
        PASS();
    }
    {
        TEST(invalid_token_opaque);
        auto dest = tmpdir / "out" / "bad.mp4";
        auto forged = token;
        forged.back() = forged.back() == 'a' ? 'b' : 'a';
        auto result = engine.download_with_token(forged, dest);
        ASSERT_TRUE(!result.success, "rejected");
        ASSERT_EQ(result.error_message, "invalid token", "opaque error");
        auto garbage = engine.download_with_token("garbage", dest);
        ASSERT_EQ(garbage.error_message, "invalid token", "same error for garbage");
        ASSERT_TRUE(!fs::exists(dest), "no file");
        PASS();
    }
    {
        TEST(download_fails_over);
        primary->fail("head", ErrorKind::Network);
        auto dest = tmpdir / "out" / "failover.mp4";
        auto result = engine.download("alice", "holiday video.mp4", dest);
        primary->fail("head", ErrorKind::Network, 0);
        ASSERT_TRUE(result.success, "served");
        ASSERT_EQ(result.backend, "replica", "replica served");
        ASSERT_EQ(result.failovers(), 1u, "one failover");
        ASSERT_EQ(read_file(dest), data, "content");
        PASS();
    }
    {
        TEST(upload_stream_spools_and_cleans_up);
        auto payload = make_payload(6000, 22);
        std::istringstream in(payload);
        auto result = engine.upload_stream("bob", "notes.txt", payload.size(), in);
        ASSERT_TRUE(result.success, "upload: " + result.error_message);
        ASSERT_EQ(read_object(*replica, "users/bob/notes.txt"), payload, "content");
        ASSERT_TRUE(dir_is_empty(tmpdir / "scratch"), "scratch removed");

        std::istringstream short_in(payload.substr(0, 100));
        auto short_result = engine.upload_stream("bob", "short.txt", payload.size(), short_in);
        ASSERT_TRUE(short_result.status == JobStatus::Rejected, "short stream rejected");

        std::istringstream long_in(payload);
        auto long_result = engine.upload_stream("bob", "long.txt", 100, long_in);
        ASSERT_TRUE(long_result.status == JobStatus::Rejected, "long stream rejected");
        ASSERT_TRUE(dir_is_empty(tmpdir / "scratch"), "scratch removed after rejection");
        PASS();
    }
    {
        TEST(invalid_names_rejected);
        auto job = engine.make_job("alice", "///", source);
        auto result = engine.upload(job);
        ASSERT_TRUE(result.status == JobStatus::Rejected, "empty sanitized name");
        auto bad_owner = engine.upload(engine.make_job("../x", "a.txt", source));
        ASSERT_TRUE(bad_owner.status == JobStatus::Rejected, "bad owner");
        PASS();
    }
    {
        TEST(share_link_from_holder);
        auto link = engine.issue_share_link("bob", "notes.txt");
        ASSERT_TRUE(link.success, "share: " + link.error_message);
        ASSERT_EQ(link.backend, "primary", "highest priority holder");
        ASSERT_TRUE(link.url.starts_with("file://"), "presigned url");
        auto missing = engine.issue_share_link("bob", "nothing.txt");
        ASSERT_TRUE(!missing.success, "missing object");
        ASSERT_TRUE(missing.error == ErrorKind::NotFound, "NotFound");
        auto too_long = engine.issue_share_link("bob", "notes.txt", 30 * 86400s);
        ASSERT_TRUE(too_long.error == ErrorKind::InvalidInput, "ttl bound");
        PASS();
    }
    {
        TEST(list_owner_namespace);
        auto listing = engine.list_objects("alice");
        ASSERT_TRUE(listing.success, "list");
        ASSERT_EQ(listing.entries.size(), 1u, "one object");
        ASSERT_EQ(listing.entries[0].key, "holiday video.mp4", "relative key");
        ASSERT_EQ(listing.entries[0].size, data.size(), "size");

        primary->fail("list", ErrorKind::Forbidden);
        auto fallback = engine.list_objects("bob");
        primary->fail("list", ErrorKind::Forbidden, 0);
        ASSERT_TRUE(fallback.success, "listed from replica");
        ASSERT_EQ(fallback.backend, "replica", "next backend answered");
        PASS();
    }
    {
        TEST(delete_everywhere);
        auto result = engine.delete_object("alice", "holiday video.mp4");
        ASSERT_TRUE(result.success, "deleted");
        ASSERT_EQ(result.outcomes.size(), 2u, "per-backend outcomes");
        auto dest = tmpdir / "out" / "deleted.mp4";
        auto download = engine.download("alice", "holiday video.mp4", dest);
        ASSERT_TRUE(!download.success, "gone");
        ASSERT_TRUE(download.error == ErrorKind::NotFound, "NotFound");
        PASS();
    }
    {
        TEST(admission_gate);
        ASSERT_TRUE(engine.allow("carol"), "1");
        ASSERT_TRUE(engine.allow("carol"), "2");
        ASSERT_TRUE(!engine.allow("carol"), "limit 2 reached");
        ASSERT_TRUE(engine.allow("dave"), "other identity");
        PASS();
    }
    {
        TEST(engine_requires_backends);
        bool threw = false;
        try {
            TransferEngine empty({}, test_settings(tmpdir));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "no backends");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 12. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("replistore-metrics");
    auto prom_path = tmpdir / "replistore.prom";

    {
        TEST(engine_activity_exported);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {{"service", "test"}});
        {
            auto a = faulty(small_target("m1", tmpdir));
            auto b = faulty(small_target("m2", tmpdir));
            b->fail("put", ErrorKind::Forbidden);
            TransferEngine engine({a, b}, test_settings(tmpdir), &exporter);

            auto source = tmpdir / "small.txt";
            write_file(source, "hello metrics");
            auto result = engine.upload(engine.make_job("erin", "small.txt", source));
            if (!result.success) { FAIL("upload failed: " + result.error_message); return; }
            engine.download("erin", "small.txt", tmpdir / "copy.txt");
            engine.download_with_token("bogus", tmpdir / "bogus.txt");
            engine.allow("erin");
            engine.allow("erin");
            engine.allow("erin");
        }
        exporter.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("replistore_jobs_total") != std::string::npos, "jobs counter");
        ASSERT_TRUE(content.find("status=\"degraded\"") != std::string::npos, "degraded job");
        ASSERT_TRUE(content.find("backend=\"m2\"") != std::string::npos, "per-backend outcome");
        ASSERT_TRUE(content.find("result=\"failed\"") != std::string::npos, "failed outcome");
        ASSERT_TRUE(content.find("replistore_tokens_issued_total") != std::string::npos, "tokens");
        ASSERT_TRUE(content.find("replistore_token_rejections_total") != std::string::npos, "rejections");
        ASSERT_TRUE(content.find("replistore_rate_limited_total") != std::string::npos, "rate limit");
        ASSERT_TRUE(content.find("replistore_download_duration_seconds") != std::string::npos,
                    "download histogram");
        ASSERT_TRUE(content.find("service=\"test\"") != std::string::npos, "constant label");

        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }
    {
        TEST(gauges_sampled_while_engines_come_and_go);
        auto churn_path = tmpdir / "churn.prom";
        MetricsExporter exporter(churn_path, std::chrono::seconds(60), {});
        std::atomic<bool> done{false};
        std::thread sampler([&] {
            while (!done.load()) {
                exporter.stop();    // samples gauges and writes one snapshot
            }
        });
        for (int i = 0; i < 50; ++i) {
            auto a = faulty(small_target("churn", tmpdir));
            TransferEngine engine({a}, test_settings(tmpdir), &exporter);
            engine.allow("erin");
        }
        done = true;
        sampler.join();
        exporter.stop();
        ASSERT_TRUE(fs::exists(churn_path), "snapshot written");
        auto churn = read_file(churn_path);
        ASSERT_TRUE(churn.find("replistore_active_transfers") != std::string::npos, "progress gauge");
        ASSERT_TRUE(churn.find("replistore_rate_limit_windows") != std::string::npos, "limiter gauge");
        PASS();
    }
    {
        TEST(periodic_writer);
        fs::remove(prom_path);
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), {});
        exporter.start();
        bool written = false;
        for (int i = 0; i < 60 && !written; ++i) {
            std::this_thread::sleep_for(50ms);
            written = fs::exists(prom_path);
        }
        exporter.stop();
        ASSERT_TRUE(written, "file written by background thread");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "replistore test suite" << std::endl;
    std::cout << "=====================" << std::endl;

    test_errors_and_retry();
    test_chunk_planner();
    test_local_backend();
    test_s3_presign();
    test_coordinator();
    test_large_multipart_failure();
    test_download_and_failover();
    test_progress();
    test_access_tokens();
    test_rate_limiter();
    test_config();
    test_engine();
    test_metrics();

    std::cout << "\n=====================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
