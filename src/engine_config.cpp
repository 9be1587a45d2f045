#include "replistore/engine_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace replistore {

namespace {

uint64_t parse_u64(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        if (value.empty() || value[0] == '-') throw std::invalid_argument(value);
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("'" + key + "' is not a non-negative integer: " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("'" + key + "' is not a non-negative integer: " + value);
    }
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw std::invalid_argument("'" + key + "' is not a boolean: " + value);
}

std::string param_or(const std::map<std::string, std::string>& params,
                     const std::string& key, const std::string& fallback = {}) {
    auto it = params.find(key);
    return it == params.end() ? fallback : it->second;
}

// JSON scalars become parameter strings; nested values are rejected
std::string json_param(const std::string& key, const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    if (value.is_number()) return value.dump();
    throw std::invalid_argument("backend parameter '" + key + "' must be a scalar");
}

// Map a --backend-X flag with a value onto the current backend's params
bool parse_backend_flag(const std::string& suffix, const char* value, BackendConfig& backend) {
    static const std::map<std::string, std::string> keys = {
        {"endpoint", "endpoint"},
        {"path", "path"},
        {"region", "region"},
        {"bucket", "bucket"},
        {"prefix", "path_prefix"},
        {"access-key", "access_key"},
        {"secret-key", "secret_key"},
        {"session-token", "session_token"},
        {"priority", "priority"},
        {"min-part-size", "min_part_size"},
        {"max-part-size", "max_part_size"},
        {"max-parts", "max_parts"},
        {"multipart-threshold", "multipart_threshold"},
        {"connect-timeout", "connect_timeout"},
        {"request-timeout", "request_timeout"},
        {"max-retries", "max_retries"},
    };

    if (suffix == "name") {
        backend.name = value;
        return true;
    }
    auto it = keys.find(suffix);
    if (it == keys.end()) return false;
    backend.params[it->second] = value;
    return true;
}

bool parse_backend_bool_flag(const std::string& suffix, BackendConfig& backend) {
    if (suffix == "no-verify-ssl") {
        backend.params["verify_ssl"] = "false";
    } else if (suffix == "path-style") {
        backend.params["use_path_style"] = "true";
    } else {
        return false;
    }
    return true;
}

constexpr const char* USAGE =
    "Usage: replistore <command> [arguments] [options]\n"
    "\n"
    "Commands:\n"
    "  upload <file> [name]             Replicate a local file to every backend\n"
    "  download <name> <dest>           Fetch an object, failing over by priority\n"
    "  fetch <token> <dest>             Fetch the object bound to an access token\n"
    "  share <name> [ttl-secs]          Print a presigned URL for an object\n"
    "  list                             List the identity's objects\n"
    "  delete <name>                    Delete an object from every backend\n"
    "  verify-token <token>             Check a token and print its claims\n"
    "\n"
    "Backends (repeat the group for each backend; --backend-type starts a group):\n"
    "  --backend-type <s3|local>        Backend type\n"
    "  --backend-name <name>            Name used in logs and results\n"
    "  --backend-endpoint <url>         S3 endpoint URL (default: AWS)\n"
    "  --backend-path <dir>             Root directory (local)\n"
    "  --backend-bucket <name>          Bucket name\n"
    "  --backend-region <region>        Region (default: us-east-1)\n"
    "  --backend-prefix <prefix>        Key prefix\n"
    "  --backend-access-key <key>       Access key (or AWS_ACCESS_KEY_ID env)\n"
    "  --backend-secret-key <key>       Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
    "  --backend-session-token <tok>    Session token\n"
    "  --backend-priority <N>           Read priority, lower first (default: 0)\n"
    "  --backend-min-part-size <bytes>  Minimum multipart part size\n"
    "  --backend-max-part-size <bytes>  Maximum multipart part size\n"
    "  --backend-max-parts <N>          Maximum number of parts\n"
    "  --backend-multipart-threshold <bytes>\n"
    "                                   Smaller objects use a single put\n"
    "  --backend-connect-timeout <secs> Connect timeout (default: 10)\n"
    "  --backend-request-timeout <secs> Request timeout (default: 60)\n"
    "  --backend-max-retries <N>        Retries for transient errors (default: 3)\n"
    "  --backend-no-verify-ssl          Skip SSL verification\n"
    "  --backend-path-style             Path-style addressing (MinIO)\n"
    "\n"
    "Options:\n"
    "  --config <path>                  JSON config file\n"
    "  --identity <id>                  Owner identity for the command\n"
    "  --quorum <N>                     Backends that must commit (default: 1)\n"
    "  --target-parts <N>               Target multipart part count (default: 50)\n"
    "  --max-object-size <bytes>        Largest accepted object (default: 2GiB)\n"
    "  --chunk-size <bytes>             Download range size (default: 8MiB)\n"
    "  --rate-limit <N>                 Requests per identity per period (default: 10)\n"
    "  --rate-period <secs>             Rate limit period (default: 60)\n"
    "  --token-secret <secret>          Token HMAC secret (or REPLISTORE_TOKEN_SECRET env)\n"
    "  --token-ttl <secs>               Access token lifetime (default: 3600)\n"
    "  --share-ttl <secs>               Share link lifetime (default: 86400)\n"
    "  --scratch-dir <path>             Per-job scratch root (default: <tmp>/replistore)\n"
    "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
    "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
    "  --verbose                        Verbose output\n"
    "  --help                           Show this help\n";

}  // namespace

std::string mask_secret(const std::string& secret) {
    if (secret.empty()) return "(unset)";
    if (secret.size() <= 4) return "****";
    return secret.substr(0, 4) + "****";
}

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "s3") {
        if (param_or(params, "bucket").empty())
            return "s3 backend requires 'bucket'";
        if (param_or(params, "access_key").empty() || param_or(params, "secret_key").empty())
            return "s3 backend requires 'access_key' and 'secret_key'";
    } else if (type == "local") {
        if (param_or(params, "path").empty() && param_or(params, "endpoint").empty())
            return "local backend requires 'path'";
    } else {
        return "unknown backend type: " + type;
    }

    BackendTarget target;
    try {
        target = to_target();
    } catch (const std::invalid_argument& e) {
        return e.what();
    }
    if (target.min_part_size == 0) return "min_part_size must be > 0";
    if (target.min_part_size > target.max_part_size) return "min_part_size must be <= max_part_size";
    if (target.multipart_threshold > target.max_part_size)
        return "multipart_threshold must be <= max_part_size";
    if (target.max_parts == 0) return "max_parts must be > 0";
    if (target.request_timeout.count() == 0) return "request_timeout must be > 0";
    return {};
}

BackendTarget BackendConfig::to_target() const {
    BackendTarget target;
    target.name = name.empty() ? type : name;
    target.type = type;
    target.endpoint = param_or(params, "endpoint");
    if (type == "local" && !param_or(params, "path").empty()) {
        target.endpoint = param_or(params, "path");
    }
    target.region = param_or(params, "region", target.region);
    target.bucket = param_or(params, "bucket");
    target.path_prefix = param_or(params, "path_prefix");
    target.access_key = param_or(params, "access_key");
    target.secret_key = param_or(params, "secret_key");
    target.session_token = param_or(params, "session_token");

    for (const auto& [key, value] : params) {
        if (key == "priority") {
            size_t consumed = 0;
            try {
                target.priority_rank = std::stoi(value, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != value.size()) {
                throw std::invalid_argument("'priority' is not an integer: " + value);
            }
        } else if (key == "min_part_size") {
            target.min_part_size = parse_u64(key, value);
        } else if (key == "max_part_size") {
            target.max_part_size = parse_u64(key, value);
        } else if (key == "max_parts") {
            target.max_parts = static_cast<uint32_t>(parse_u64(key, value));
        } else if (key == "multipart_threshold") {
            target.multipart_threshold = parse_u64(key, value);
        } else if (key == "connect_timeout") {
            target.connect_timeout = std::chrono::seconds(parse_u64(key, value));
        } else if (key == "request_timeout") {
            target.request_timeout = std::chrono::seconds(parse_u64(key, value));
        } else if (key == "max_retries") {
            target.max_retries = static_cast<uint32_t>(parse_u64(key, value));
        } else if (key == "verify_ssl") {
            target.verify_ssl = parse_bool(key, value);
        } else if (key == "use_path_style") {
            target.use_path_style = parse_bool(key, value);
        }
    }
    return target;
}

// --- EngineConfig ---

std::optional<EngineConfig> EngineConfig::from_args(int argc, char* argv[]) {
    EngineConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg.compare(0, 10, "--backend-") == 0) {
                std::string suffix = arg.substr(10);
                if (suffix == "type") {
                    auto* v = next_arg(i, "--backend-type");
                    if (!v) return std::nullopt;
                    config.backends.push_back({});
                    config.backends.back().type = v;
                    continue;
                }
                if (config.backends.empty()) {
                    std::cerr << "Error: " << arg << " must follow --backend-type\n";
                    return std::nullopt;
                }
                auto& backend = config.backends.back();
                if (parse_backend_bool_flag(suffix, backend)) continue;

                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                if (!parse_backend_flag(suffix, v, backend)) {
                    std::cerr << "Error: unknown option: " << arg << "\n";
                    return std::nullopt;
                }
                continue;
            }

            if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--identity") {
                auto* v = next_arg(i, "--identity");
                if (!v) return std::nullopt;
                config.identity = v;
            } else if (arg == "--quorum") {
                auto* v = next_arg(i, "--quorum");
                if (!v) return std::nullopt;
                config.quorum = parse_u64(arg, v);
            } else if (arg == "--target-parts") {
                auto* v = next_arg(i, "--target-parts");
                if (!v) return std::nullopt;
                config.target_part_count = static_cast<uint32_t>(parse_u64(arg, v));
            } else if (arg == "--max-object-size") {
                auto* v = next_arg(i, "--max-object-size");
                if (!v) return std::nullopt;
                config.max_object_size = parse_u64(arg, v);
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.download_chunk_size = parse_u64(arg, v);
            } else if (arg == "--rate-limit") {
                auto* v = next_arg(i, "--rate-limit");
                if (!v) return std::nullopt;
                config.rate_limit = parse_u64(arg, v);
            } else if (arg == "--rate-period") {
                auto* v = next_arg(i, "--rate-period");
                if (!v) return std::nullopt;
                config.rate_period = std::chrono::seconds(parse_u64(arg, v));
            } else if (arg == "--token-secret") {
                auto* v = next_arg(i, "--token-secret");
                if (!v) return std::nullopt;
                config.token_secret = v;
            } else if (arg == "--token-ttl") {
                auto* v = next_arg(i, "--token-ttl");
                if (!v) return std::nullopt;
                config.token_ttl = std::chrono::seconds(parse_u64(arg, v));
            } else if (arg == "--share-ttl") {
                auto* v = next_arg(i, "--share-ttl");
                if (!v) return std::nullopt;
                config.share_link_ttl = std::chrono::seconds(parse_u64(arg, v));
            } else if (arg == "--scratch-dir") {
                auto* v = next_arg(i, "--scratch-dir");
                if (!v) return std::nullopt;
                config.scratch_dir = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = parse_u64(arg, v);
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cerr << USAGE;
                return std::nullopt;
            } else if (arg.compare(0, 2, "--") == 0) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else {
                config.args.push_back(arg);
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool EngineConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("quorum")) quorum = j["quorum"].get<size_t>();
        if (j.contains("target_part_count")) target_part_count = j["target_part_count"].get<uint32_t>();
        if (j.contains("max_object_size")) max_object_size = j["max_object_size"].get<uint64_t>();
        if (j.contains("download_chunk_size"))
            download_chunk_size = j["download_chunk_size"].get<uint64_t>();
        if (j.contains("retry_initial_delay_ms"))
            retry_initial_delay = std::chrono::milliseconds(j["retry_initial_delay_ms"].get<int64_t>());
        if (j.contains("retry_max_delay_ms"))
            retry_max_delay = std::chrono::milliseconds(j["retry_max_delay_ms"].get<int64_t>());
        if (j.contains("retry_backoff_multiplier"))
            retry_backoff_multiplier = j["retry_backoff_multiplier"].get<double>();
        if (j.contains("rate_limit")) rate_limit = j["rate_limit"].get<size_t>();
        if (j.contains("rate_period"))
            rate_period = std::chrono::seconds(j["rate_period"].get<int64_t>());
        if (j.contains("token_secret")) token_secret = j["token_secret"].get<std::string>();
        if (j.contains("token_ttl")) token_ttl = std::chrono::seconds(j["token_ttl"].get<int64_t>());
        if (j.contains("share_link_ttl"))
            share_link_ttl = std::chrono::seconds(j["share_link_ttl"].get<int64_t>());
        if (j.contains("scratch_dir")) scratch_dir = j["scratch_dir"].get<std::string>();
        if (j.contains("progress_interval_ms"))
            progress_interval = std::chrono::milliseconds(j["progress_interval_ms"].get<int64_t>());
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("identity")) identity = j["identity"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        if (j.contains("backends")) {
            if (!j["backends"].is_array()) {
                std::cerr << "Error parsing config: 'backends' must be an array\n";
                return false;
            }
            backends.clear();
            for (auto& jb : j["backends"]) {
                if (!jb.is_object()) {
                    std::cerr << "Error parsing config: each backend must be an object\n";
                    return false;
                }
                BackendConfig backend;
                if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
                if (jb.contains("name")) backend.name = jb["name"].get<std::string>();
                for (auto& [key, val] : jb.items()) {
                    if (key != "type" && key != "name") {
                        backend.params[key] = json_param(key, val);
                    }
                }
                backends.push_back(std::move(backend));
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void EngineConfig::apply_defaults() {
    if (scratch_dir.empty()) {
        std::error_code ec;
        auto tmp = std::filesystem::temp_directory_path(ec);
        scratch_dir = (ec ? std::filesystem::path("/tmp") : tmp) / "replistore";
    }

    if (token_secret.empty()) {
        if (const char* v = std::getenv("REPLISTORE_TOKEN_SECRET")) {
            token_secret = v;
        }
    }

    for (size_t i = 0; i < backends.size(); ++i) {
        auto& backend = backends[i];
        if (backend.name.empty()) {
            backend.name = backend.type + std::to_string(i + 1);
        }
        // S3 credentials from the environment when not given explicitly
        if (backend.type == "s3") {
            if (param_or(backend.params, "access_key").empty()) {
                if (const char* v = std::getenv("AWS_ACCESS_KEY_ID")) {
                    backend.params["access_key"] = v;
                }
            }
            if (param_or(backend.params, "secret_key").empty()) {
                if (const char* v = std::getenv("AWS_SECRET_ACCESS_KEY")) {
                    backend.params["secret_key"] = v;
                }
            }
        }
    }
}

std::string EngineConfig::validate() const {
    if (backends.empty()) return "at least one backend is required (--backend-type)";

    std::set<std::string> names;
    for (const auto& backend : backends) {
        auto err = backend.validate();
        if (!err.empty()) return "backend '" + backend.name + "': " + err;
        if (!names.insert(backend.name).second) return "duplicate backend name: " + backend.name;
    }

    if (quorum < 1 || quorum > backends.size())
        return "quorum must be between 1 and " + std::to_string(backends.size());
    if (target_part_count == 0) return "target_part_count must be > 0";
    if (max_object_size == 0) return "max_object_size must be > 0";
    if (download_chunk_size == 0) return "download_chunk_size must be > 0";
    if (retry_backoff_multiplier < 1.0) return "retry_backoff_multiplier must be >= 1";
    if (rate_limit == 0) return "rate_limit must be > 0";
    if (rate_period.count() <= 0) return "rate_period must be > 0";
    if (token_secret.empty()) return "token secret is required (--token-secret or REPLISTORE_TOKEN_SECRET)";
    if (token_ttl.count() <= 0) return "token_ttl must be > 0";
    if (share_link_ttl.count() <= 0 || share_link_ttl > constants::MAX_PRESIGN_TTL)
        return "share_link_ttl must be between 1 second and 7 days";
    return {};
}

void EngineConfig::print(std::ostream& out) const {
    out << "backends:\n";
    for (const auto& backend : backends) {
        out << "  " << backend.name << " (" << backend.type << ")";
        for (const auto& [key, value] : backend.params) {
            bool secret = key == "secret_key" || key == "session_token" || key == "access_key";
            out << " " << key << "=" << (secret ? mask_secret(value) : value);
        }
        out << "\n";
    }
    out << "quorum: " << quorum << "\n"
        << "target_part_count: " << target_part_count << "\n"
        << "max_object_size: " << max_object_size << "\n"
        << "download_chunk_size: " << download_chunk_size << "\n"
        << "rate_limit: " << rate_limit << " per " << rate_period.count() << "s\n"
        << "token_secret: " << mask_secret(token_secret) << "\n"
        << "token_ttl: " << token_ttl.count() << "s\n"
        << "share_link_ttl: " << share_link_ttl.count() << "s\n"
        << "scratch_dir: " << scratch_dir.string() << "\n";
    if (!metrics_file.empty()) {
        out << "metrics_file: " << metrics_file.string()
            << " every " << metrics_interval_secs << "s\n";
    }
}

}  // namespace replistore
