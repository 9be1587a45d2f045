#include "replistore/engine.hpp"
#include "replistore/engine_config.hpp"
#include "replistore/log.hpp"
#include "replistore/metrics.hpp"
#include "replistore/progress.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

// Forwards SIGINT/SIGTERM to the cancellation token outside signal context.
class SignalWatcher {
public:
    explicit SignalWatcher(replistore::CancellationToken& cancel)
        : thread_([this, &cancel] {
            while (!done_.load()) {
                if (g_shutdown_requested) {
                    replistore::log_warn("Interrupted, cancelling transfer");
                    cancel.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }) {}

    ~SignalWatcher() {
        done_ = true;
        thread_.join();
    }

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

bool need_args(const replistore::EngineConfig& config, size_t count, const char* usage) {
    if (config.args.size() < count + 1) {
        std::cerr << "Usage: replistore " << usage << "\n";
        return false;
    }
    return true;
}

void print_job(const replistore::JobResult& result) {
    using namespace replistore;
    std::cout << "job " << result.job_id << ": " << job_status_name(result.status)
              << " (" << result.committed_count() << "/" << result.outcomes.size()
              << " committed, quorum " << result.quorum << ", "
              << format_duration(std::chrono::duration_cast<std::chrono::seconds>(result.duration))
              << ")\n";
    std::cout << "  key: " << result.object_key << "\n";
    for (const auto& outcome : result.outcomes) {
        std::cout << "  " << outcome.backend << ": " << outcome_state_name(outcome.state);
        if (outcome.committed()) {
            std::cout << " " << format_bytes(outcome.bytes_transferred)
                      << (outcome.multipart ? " in " + std::to_string(outcome.parts_committed) + " parts" : "");
        } else {
            std::cout << " [" << error_kind_name(outcome.error) << "] " << outcome.error_message;
            if (outcome.multipart && !outcome.upload_id.empty()) {
                std::cout << (outcome.aborted ? " (aborted)" : " (abort failed)");
            }
        }
        std::cout << "\n";
    }
    if (!result.error_message.empty()) {
        std::cout << "  error: " << result.error_message << "\n";
    }
    if (!result.token.empty()) {
        std::cout << "  token: " << result.token << "\n";
    }
}

int print_download(const replistore::DownloadResult& result) {
    using namespace replistore;
    if (result.success) {
        std::cout << "Downloaded " << format_bytes(result.bytes_written) << " from "
                  << result.backend << " to " << result.local_path.string() << "\n";
        return 0;
    }
    std::cerr << "Download failed [" << error_kind_name(result.error) << "]: "
              << result.error_message << "\n";
    return 1;
}

int run_command(replistore::TransferEngine& engine,
                const replistore::EngineConfig& config,
                const replistore::CancellationToken& cancel) {
    using namespace replistore;
    const std::string& command = config.args[0];

    if (command == "verify-token") {
        if (!need_args(config, 1, "verify-token <token>")) return 1;
        auto claims = engine.verify_token(config.args[1]);
        if (!claims) {
            std::cerr << "invalid token\n";
            return 1;
        }
        auto expires = std::chrono::system_clock::to_time_t(claims->expires_at);
        std::cout << "identity: " << claims->identity << "\n"
                  << "object: " << claims->object_name << "\n"
                  << "expires: " << expires << "\n";
        return 0;
    }

    if (command == "fetch") {
        if (!need_args(config, 2, "fetch <token> <dest>")) return 1;
        return print_download(engine.download_with_token(config.args[1], config.args[2], &cancel));
    }

    if (config.identity.empty()) {
        std::cerr << "Error: " << command << " requires --identity\n";
        return 1;
    }
    if (!engine.allow(config.identity)) {
        std::cerr << "Rate limit exceeded for " << config.identity << "\n";
        return 1;
    }

    if (command == "upload") {
        if (!need_args(config, 1, "upload <file> [name]")) return 1;
        std::filesystem::path source = config.args[1];
        std::string name = config.args.size() > 2 ? config.args[2] : source.filename().string();
        auto result = engine.upload(engine.make_job(config.identity, name, source), 0, &cancel);
        engine.flush_progress();
        print_job(result);
        return result.success ? 0 : 1;
    }

    if (command == "download") {
        if (!need_args(config, 2, "download <name> <dest>")) return 1;
        auto result = engine.download(config.identity, config.args[1], config.args[2], &cancel);
        engine.flush_progress();
        return print_download(result);
    }

    if (command == "share") {
        if (!need_args(config, 1, "share <name> [ttl-secs]")) return 1;
        std::chrono::seconds ttl{0};
        if (config.args.size() > 2) {
            try {
                ttl = std::chrono::seconds(std::stoll(config.args[2]));
            } catch (const std::exception&) {
                std::cerr << "Invalid ttl: " << config.args[2] << "\n";
                return 1;
            }
        }
        auto link = engine.issue_share_link(config.identity, config.args[1], ttl);
        if (!link.success) {
            std::cerr << "Share failed [" << error_kind_name(link.error) << "]: "
                      << link.error_message << "\n";
            return 1;
        }
        std::cout << link.url << "\n";
        return 0;
    }

    if (command == "list") {
        auto listing = engine.list_objects(config.identity);
        if (!listing.success) {
            std::cerr << "List failed [" << error_kind_name(listing.error) << "]: "
                      << listing.error_message << "\n";
            return 1;
        }
        for (const auto& entry : listing.entries) {
            std::cout << format_bytes(entry.size) << "\t" << entry.key << "\n";
        }
        std::cout << listing.entries.size() << " object(s) on " << listing.backend << "\n";
        return 0;
    }

    if (command == "delete") {
        if (!need_args(config, 1, "delete <name>")) return 1;
        auto result = engine.delete_object(config.identity, config.args[1]);
        for (const auto& outcome : result.outcomes) {
            std::cout << "  " << outcome.backend << ": "
                      << (outcome.success ? "deleted" : outcome.error_message) << "\n";
        }
        if (!result.success) {
            std::cerr << "Delete failed: " << result.error_message << "\n";
            return 1;
        }
        return 0;
    }

    std::cerr << "Error: unknown command: " << command << " (see --help)\n";
    return 1;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = replistore::EngineConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    if (config.args.empty()) {
        std::cerr << "Error: no command given (see --help)\n";
        return 1;
    }

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    replistore::set_verbose(config.verbose);
    if (config.verbose) {
        config.print(std::cout);
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::unique_ptr<replistore::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<replistore::MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"service", "replistore"}});
        metrics->start();
    }

    int rc = 1;
    try {
        auto engine = std::make_unique<replistore::TransferEngine>(
            replistore::TransferEngine::create_backends(config),
            replistore::EngineSettings::from_config(config),
            metrics.get());

        engine->subscribe_progress([](const replistore::ProgressSnapshot& snapshot) {
            if (snapshot.is_aggregate()) {
                std::cout << replistore::format_progress(snapshot) << std::endl;
            }
        });

        replistore::CancellationToken cancel;
        {
            SignalWatcher watcher(cancel);
            rc = run_command(*engine, config, cancel);
        }
        engine.reset();
    } catch (const std::exception& e) {
        std::cerr << "Failed to start: " << e.what() << std::endl;
        rc = 1;
    }

    if (metrics) {
        metrics->stop();
    }
    return rc;
}
