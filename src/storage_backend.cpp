#include "replistore/backend.hpp"
#include "replistore/http.hpp"
#include "replistore/log.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>
#include <sys/stat.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace replistore {

namespace fs = std::filesystem;

// ============================================================================
// Error classification
// ============================================================================

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Unauthorized: return "unauthorized";
        case ErrorKind::Forbidden: return "forbidden";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Throttled: return "throttled";
        case ErrorKind::Network: return "network";
        case ErrorKind::Server: return "server";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Io: return "io";
        case ErrorKind::Protocol: return "protocol";
    }
    return "unknown";
}

bool is_transient(ErrorKind kind) {
    return kind == ErrorKind::Timeout || kind == ErrorKind::Throttled ||
           kind == ErrorKind::Network || kind == ErrorKind::Server;
}

ErrorKind classify_http_status(int status) {
    if (status >= 200 && status < 300) return ErrorKind::None;
    switch (status) {
        case 401: return ErrorKind::Unauthorized;
        case 403: return ErrorKind::Forbidden;
        case 404: return ErrorKind::NotFound;
        case 408:
        case 504: return ErrorKind::Timeout;
        case 429:
        case 503: return ErrorKind::Throttled;
        default: break;
    }
    if (status >= 500) return ErrorKind::Server;
    if (status >= 400) return ErrorKind::InvalidInput;
    return ErrorKind::Protocol;
}

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Value between <tag> and </tag>, empty if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Contents of every <tag>...</tag> in document order
std::vector<std::string> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        results.push_back(xml.substr(content_start, end - content_start));
        pos = end + close_tag.length();
    }

    return results;
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

} // namespace xml

namespace {

// ISO 8601 (2023-12-15T14:30:00.000Z) to time_point, epoch on parse failure
std::chrono::system_clock::time_point parse_iso8601(const std::string& date_str) {
    std::tm tm = {};
    int year, month, day, hour, min, sec;
    int millis = 0;
    if (sscanf(date_str.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
               &year, &month, &day, &hour, &min, &sec, &millis) < 6) {
        return {};
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t tt = timegm(&tm);
    if (tt == -1) return {};
    return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
}

// Empty string if the RNG fails
std::string random_hex(size_t bytes) {
    std::vector<uint8_t> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return "";
    }
    return net::to_hex(buf.data(), buf.size());
}

// Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.back() != '"') result += "\"";
    return result;
}

// Version tag of a stored local object. A rewrite lands as a new inode
// (temp file + rename), so the tag changes on every overwrite.
std::string local_etag(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return "";
    std::string stamp = std::to_string(st.st_ino) + ":" + std::to_string(st.st_size) + ":" +
                        std::to_string(st.st_mtim.tv_sec) + "." +
                        std::to_string(st.st_mtim.tv_nsec);
    return ensure_etag_quotes(
        net::sha256_hex(reinterpret_cast<const uint8_t*>(stamp.data()), stamp.size())
            .substr(0, 32));
}

} // namespace

// ============================================================================
// Local filesystem backend
// ============================================================================

// Objects are plain files under <endpoint>/<bucket>/<path_prefix><key>.
// Multipart uploads stage parts in <root>/.multipart/<upload_id>/ and are
// assembled with a temp-write + rename on completion.
class LocalBackendClient : public BackendClient {
public:
    explicit LocalBackendClient(const BackendTarget& target)
        : target_(target) {
        root_ = fs::absolute(fs::path(target_.endpoint));
        if (!target_.bucket.empty()) {
            root_ /= target_.bucket;
        }
        fs::create_directories(root_);
        fs::create_directories(staging_root());
        log_debug("LocalBackendClient %s rooted at %s",
                  target_.name.c_str(), root_.string().c_str());
    }

    std::string type_name() const override { return "local"; }

    const BackendTarget& target() const override { return target_; }

    InitiateResult initiate_multipart(const std::string& key) override {
        fs::path path;
        if (auto check = key_to_path(key, path); !check.ok()) {
            return failure_as<InitiateResult>(check);
        }

        InitiateResult result;
        result.upload_id = random_hex(16);
        if (result.upload_id.empty()) {
            return failure_as<InitiateResult>(ErrorKind::Io, "Failed to generate upload id");
        }

        std::error_code ec;
        fs::create_directories(staging_root() / result.upload_id, ec);
        if (ec) {
            return failure_as<InitiateResult>(ErrorKind::Io,
                "Failed to create staging directory: " + ec.message());
        }

        // Remember the key so complete/abort can reject mismatches
        if (!write_file_atomic(staging_root() / result.upload_id / "key",
                               {reinterpret_cast<const uint8_t*>(key.data()), key.size()})) {
            return failure_as<InitiateResult>(ErrorKind::Io, "Failed to record upload key");
        }

        result.success = true;
        return result;
    }

    PartResult upload_part(const std::string& key,
                           const std::string& upload_id,
                           int part_number,
                           std::span<const uint8_t> data) override {
        fs::path dir;
        if (auto check = staging_dir(key, upload_id, dir); !check.ok()) {
            return failure_as<PartResult>(check);
        }
        if (part_number < 1 || part_number > static_cast<int>(target_.max_parts)) {
            return failure_as<PartResult>(ErrorKind::InvalidInput,
                "Part number out of range: " + std::to_string(part_number));
        }

        if (!write_file_atomic(dir / (std::to_string(part_number) + ".part"), data)) {
            return failure_as<PartResult>(ErrorKind::Io,
                "Failed to write part " + std::to_string(part_number));
        }

        PartResult result;
        result.success = true;
        result.etag = ensure_etag_quotes(net::sha256_hex(data.data(), data.size()));
        return result;
    }

    PutResult complete_multipart(const std::string& key,
                                 const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        fs::path dir;
        if (auto check = staging_dir(key, upload_id, dir); !check.ok()) {
            return failure_as<PutResult>(check);
        }
        if (parts.empty()) {
            return failure_as<PutResult>(ErrorKind::InvalidInput, "No parts to complete");
        }

        fs::path path;
        if (auto check = key_to_path(key, path); !check.ok()) {
            return failure_as<PutResult>(check);
        }

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return failure_as<PutResult>(ErrorKind::Io,
                "Failed to create directory: " + ec.message());
        }

        auto temp_path = temp_path_for(path);
        {
            std::ofstream out(temp_path, std::ios::binary);
            if (!out) {
                return failure_as<PutResult>(ErrorKind::Io, "Failed to create file");
            }

            int previous = 0;
            std::vector<char> buffer(1024 * 1024);
            for (const auto& part : parts) {
                if (part.part_number <= previous) {
                    out.close();
                    fs::remove(temp_path, ec);
                    return failure_as<PutResult>(ErrorKind::InvalidInput,
                        "Parts must be in ascending order");
                }
                previous = part.part_number;

                std::ifstream in(dir / (std::to_string(part.part_number) + ".part"),
                                 std::ios::binary);
                if (!in) {
                    out.close();
                    fs::remove(temp_path, ec);
                    return failure_as<PutResult>(ErrorKind::InvalidInput,
                        "Missing part " + std::to_string(part.part_number));
                }
                while (in) {
                    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    out.write(buffer.data(), in.gcount());
                }
            }

            if (!out.flush()) {
                out.close();
                fs::remove(temp_path, ec);
                return failure_as<PutResult>(ErrorKind::Io, "Failed to write object");
            }
        }

        fs::rename(temp_path, path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            return failure_as<PutResult>(ErrorKind::Io, "Failed to commit object");
        }

        fs::remove_all(dir, ec);

        PutResult result;
        result.etag = local_etag(path);
        if (result.etag.empty()) {
            return failure_as<PutResult>(ErrorKind::Io, "Cannot stat committed object: " + key);
        }
        result.success = true;
        return result;
    }

    BackendResult abort_multipart(const std::string& key,
                                  const std::string& upload_id) override {
        fs::path dir;
        if (auto check = staging_dir(key, upload_id, dir); !check.ok()) {
            return check;
        }

        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            return BackendResult::failed(ErrorKind::Io,
                "Failed to remove staged parts: " + ec.message());
        }
        return BackendResult::succeeded();
    }

    PutResult put_object(const std::string& key,
                         std::span<const uint8_t> data) override {
        fs::path path;
        if (auto check = key_to_path(key, path); !check.ok()) {
            return failure_as<PutResult>(check);
        }

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return failure_as<PutResult>(ErrorKind::Io,
                "Failed to create directory: " + ec.message());
        }

        if (!write_file_atomic(path, data)) {
            return failure_as<PutResult>(ErrorKind::Io, "Failed to write object: " + key);
        }

        PutResult result;
        result.etag = local_etag(path);
        if (result.etag.empty()) {
            return failure_as<PutResult>(ErrorKind::Io, "Cannot stat written object: " + key);
        }
        result.success = true;
        return result;
    }

    HeadResult head_object(const std::string& key) const override {
        fs::path path;
        if (auto check = key_to_path(key, path); !check.ok()) {
            return failure_as<HeadResult>(check);
        }

        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return failure_as<HeadResult>(ErrorKind::NotFound, "Object not found: " + key);
        }

        HeadResult result;
        result.metadata.size = fs::file_size(path, ec);
        if (ec) {
            return failure_as<HeadResult>(ErrorKind::Io, "Cannot stat object: " + key);
        }

        auto ftime = fs::last_write_time(path, ec);
        if (!ec) {
            result.metadata.last_modified =
                std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    std::chrono::file_clock::to_sys(ftime));
        }
        result.metadata.content_type = "application/octet-stream";
        result.metadata.etag = local_etag(path);
        result.success = true;
        return result;
    }

    RangeResult get_range(const std::string& key,
                          uint64_t start,
                          uint64_t end,
                          const std::string& if_match) const override {
        fs::path path;
        if (auto check = key_to_path(key, path); !check.ok()) {
            return failure_as<RangeResult>(check);
        }
        if (end < start) {
            return failure_as<RangeResult>(ErrorKind::InvalidInput, "Invalid byte range");
        }
        if (!if_match.empty() && fs::exists(path) && local_etag(path) != if_match) {
            return failure_as<RangeResult>(ErrorKind::Protocol,
                "Object changed during read: " + key);
        }

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            return failure_as<RangeResult>(ErrorKind::NotFound, "Object not found: " + key);
        }

        auto tellg_val = file.tellg();
        if (tellg_val < 0) {
            return failure_as<RangeResult>(ErrorKind::Io, "Cannot determine file size: " + key);
        }
        uint64_t file_size = static_cast<uint64_t>(tellg_val);
        if (start >= file_size) {
            return failure_as<RangeResult>(ErrorKind::InvalidInput,
                "Range start beyond object size");
        }

        uint64_t length = std::min(end, file_size - 1) - start + 1;

        RangeResult result;
        result.data.resize(length);
        file.seekg(static_cast<std::streamoff>(start));
        file.read(reinterpret_cast<char*>(result.data.data()),
                  static_cast<std::streamsize>(length));
        if (!file) {
            return failure_as<RangeResult>(ErrorKind::Io, "Failed to read object: " + key);
        }

        result.success = true;
        return result;
    }

    BackendResult delete_object(const std::string& key) override {
        fs::path path;
        if (auto check = key_to_path(key, path); !check.ok()) {
            return check;
        }

        // Deleting a missing object succeeds, as on S3
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            return BackendResult::failed(ErrorKind::Io, "Failed to delete: " + ec.message());
        }
        return BackendResult::succeeded();
    }

    ListResult list_objects(const ListOptions& options) const override {
        ListResult result;
        std::error_code ec;

        fs::path base = root_;
        if (!target_.path_prefix.empty()) {
            base /= target_.path_prefix;
        }
        if (!fs::exists(base, ec)) {
            result.success = true;
            return result;
        }

        std::vector<ListEntry> all;
        for (auto it = fs::recursive_directory_iterator(base, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->path() == staging_root()) {
                it.disable_recursion_pending();
                continue;
            }
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec)) continue;

            std::string key = fs::relative(it->path(), base, entry_ec).generic_string();
            if (entry_ec || key.find(".tmp.") != std::string::npos) continue;
            if (!key.starts_with(options.prefix)) continue;
            if (!options.continuation_token.empty() && key <= options.continuation_token) continue;

            ListEntry entry;
            entry.key = key;
            entry.size = it->file_size(entry_ec);
            auto ftime = it->last_write_time(entry_ec);
            if (!entry_ec) {
                entry.last_modified =
                    std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                        std::chrono::file_clock::to_sys(ftime));
            }
            all.push_back(std::move(entry));
        }
        if (ec) {
            return failure_as<ListResult>(ErrorKind::Io, "Failed to list: " + ec.message());
        }

        std::sort(all.begin(), all.end(),
                  [](const ListEntry& a, const ListEntry& b) { return a.key < b.key; });

        if (options.max_keys > 0 && all.size() > options.max_keys) {
            all.resize(options.max_keys);
            result.truncated = true;
            result.continuation_token = all.back().key;
        }

        result.entries = std::move(all);
        result.success = true;
        return result;
    }

    PresignResult presign_get(const std::string& key,
                              std::chrono::seconds ttl) const override {
        fs::path path;
        if (auto check = key_to_path(key, path); !check.ok()) {
            return failure_as<PresignResult>(check);
        }

        auto expires = std::chrono::system_clock::to_time_t(
            std::chrono::system_clock::now() + ttl);

        PresignResult result;
        result.url = "file://" + path.string() + "?expires=" + std::to_string(expires);
        result.success = true;
        return result;
    }

private:
    fs::path staging_root() const { return root_ / ".multipart"; }

    BackendResult key_to_path(const std::string& key, fs::path& out) const {
        std::string full = target_.path_prefix + key;

        // Reject absolute paths and "." or ".." components
        bool valid = !key.empty() && full[0] != '/' && !full.starts_with(".multipart");
        for (size_t pos = 0; valid && pos <= full.size();) {
            size_t slash = full.find('/', pos);
            if (slash == std::string::npos) slash = full.size();
            std::string_view part(full.data() + pos, slash - pos);
            valid = !part.empty() && part != "." && part != "..";
            pos = slash + 1;
        }
        if (!valid) {
            return BackendResult::failed(ErrorKind::InvalidInput, "Invalid storage key: " + key);
        }

        out = root_ / full;
        return BackendResult::succeeded();
    }

    BackendResult staging_dir(const std::string& key,
                              const std::string& upload_id,
                              fs::path& out) const {
        bool well_formed = !upload_id.empty() &&
            std::all_of(upload_id.begin(), upload_id.end(),
                        [](unsigned char c) { return std::isxdigit(c); });
        if (!well_formed) {
            return BackendResult::failed(ErrorKind::InvalidInput, "Malformed upload id");
        }

        out = staging_root() / upload_id;
        std::ifstream key_file(out / "key", std::ios::binary);
        if (!key_file) {
            return BackendResult::failed(ErrorKind::NotFound, "No such upload: " + upload_id);
        }
        std::string recorded((std::istreambuf_iterator<char>(key_file)),
                             std::istreambuf_iterator<char>());
        if (recorded != key) {
            return BackendResult::failed(ErrorKind::InvalidInput,
                "Upload " + upload_id + " belongs to a different key");
        }
        return BackendResult::succeeded();
    }

    fs::path temp_path_for(const fs::path& path) const {
        return path.string() + ".tmp." + std::to_string(temp_counter_.fetch_add(1)) + "." +
               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    }

    // Write to temp file then rename
    bool write_file_atomic(const fs::path& path, std::span<const uint8_t> data) const {
        auto temp_path = temp_path_for(path);
        std::error_code ec;
        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                return false;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            if (!file.flush()) {
                file.close();
                fs::remove(temp_path, ec);
                return false;
            }
        }
        fs::rename(temp_path, path, ec);
        if (ec) {
            fs::remove(temp_path, ec);
            return false;
        }
        return true;
    }

    BackendTarget target_;
    fs::path root_;
    mutable std::atomic<uint64_t> temp_counter_{0};
};

// ============================================================================
// S3-compatible backend
// ============================================================================

class S3BackendClient : public BackendClient {
public:
    explicit S3BackendClient(const BackendTarget& target)
        : target_(target)
        , signer_(target.access_key, target.secret_key, target.region, "s3") {
        net::HttpClientConfig http_config;
        http_config.user_agent = "replistore-s3/1.0";
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    const BackendTarget& target() const override { return target_; }

    InitiateResult initiate_multipart(const std::string& key) override {
        auto request = make_request(net::HttpMethod::POST, build_url(key) + "?uploads");
        request.headers.set("Content-Type", "application/octet-stream");

        auto response = send(request);
        if (auto failure = check_response(response); !failure.ok()) {
            return failure_as<InitiateResult>(failure);
        }

        InitiateResult result;
        result.upload_id = xml::get_element(response.body_string(), "UploadId");
        if (result.upload_id.empty()) {
            return failure_as<InitiateResult>(ErrorKind::Protocol,
                "InitiateMultipartUpload response carried no UploadId");
        }
        result.success = true;
        return result;
    }

    PartResult upload_part(const std::string& key,
                           const std::string& upload_id,
                           int part_number,
                           std::span<const uint8_t> data) override {
        std::string url = build_url(key) +
            "?partNumber=" + std::to_string(part_number) +
            "&uploadId=" + net::url_encode(upload_id);

        auto request = make_request(net::HttpMethod::PUT, url);
        request.body = data;

        auto response = send(request);
        if (auto failure = check_response(response); !failure.ok()) {
            return failure_as<PartResult>(failure);
        }

        PartResult result;
        result.etag = ensure_etag_quotes(response.headers.get("ETag").value_or(""));
        if (result.etag.empty()) {
            return failure_as<PartResult>(ErrorKind::Protocol,
                "UploadPart response carried no ETag");
        }
        result.success = true;
        return result;
    }

    PutResult complete_multipart(const std::string& key,
                                 const std::string& upload_id,
                                 const std::vector<CompletedPart>& parts) override {
        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& part : parts) {
            body << "  <Part>\n";
            body << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
            body << "    <ETag>" << xml::escape(ensure_etag_quotes(part.etag)) << "</ETag>\n";
            body << "  </Part>\n";
        }
        body << "</CompleteMultipartUpload>";
        std::string payload = body.str();

        auto request = make_request(net::HttpMethod::POST, url);
        request.headers.set("Content-Type", "application/xml");
        request.body = {reinterpret_cast<const uint8_t*>(payload.data()), payload.size()};

        auto response = send(request);
        if (auto failure = check_response(response); !failure.ok()) {
            return failure_as<PutResult>(failure);
        }

        // S3 may report a failed completion inside a 200 response
        std::string text = response.body_string();
        if (text.find("<Error>") != std::string::npos) {
            return failure_as<PutResult>(ErrorKind::Server,
                "CompleteMultipartUpload failed: " + xml::get_element(text, "Code") +
                " " + xml::get_element(text, "Message"));
        }

        PutResult result;
        result.etag = ensure_etag_quotes(xml::decode_entities(xml::get_element(text, "ETag")));
        result.success = true;
        return result;
    }

    BackendResult abort_multipart(const std::string& key,
                                  const std::string& upload_id) override {
        std::string url = build_url(key) + "?uploadId=" + net::url_encode(upload_id);
        auto request = make_request(net::HttpMethod::DELETE, url);
        return check_response(send(request));
    }

    PutResult put_object(const std::string& key,
                         std::span<const uint8_t> data) override {
        auto request = make_request(net::HttpMethod::PUT, build_url(key));
        request.headers.set("Content-Type", "application/octet-stream");
        request.body = data;

        auto response = send(request);
        if (auto failure = check_response(response); !failure.ok()) {
            return failure_as<PutResult>(failure);
        }

        PutResult result;
        result.etag = response.headers.get("ETag").value_or("");
        result.success = true;
        return result;
    }

    HeadResult head_object(const std::string& key) const override {
        auto request = make_request(net::HttpMethod::HEAD, build_url(key));

        auto response = send(request);
        if (auto failure = check_response(response); !failure.ok()) {
            return failure_as<HeadResult>(failure);
        }

        HeadResult result;
        auto length = response.headers.get("Content-Length");
        if (!length) {
            return failure_as<HeadResult>(ErrorKind::Protocol,
                "HEAD response carried no Content-Length");
        }
        try {
            result.metadata.size = std::stoull(*length);
        } catch (const std::exception&) {
            return failure_as<HeadResult>(ErrorKind::Protocol,
                "Malformed Content-Length: " + *length);
        }
        result.metadata.etag = response.headers.get("ETag").value_or("");
        result.metadata.content_type =
            response.headers.get("Content-Type").value_or("application/octet-stream");
        result.success = true;
        return result;
    }

    RangeResult get_range(const std::string& key,
                          uint64_t start,
                          uint64_t end,
                          const std::string& if_match) const override {
        if (end < start) {
            return failure_as<RangeResult>(ErrorKind::InvalidInput, "Invalid byte range");
        }

        auto request = make_request(net::HttpMethod::GET, build_url(key));
        request.byte_range = {start, end};
        if (!if_match.empty()) {
            request.headers.set("If-Match", if_match);
        }

        auto response = send(request);
        if (response.status_code == 416) {
            return failure_as<RangeResult>(ErrorKind::InvalidInput,
                "Range not satisfiable");
        }
        if (response.status_code == 412) {
            return failure_as<RangeResult>(ErrorKind::Protocol,
                "Object changed during read: " + key);
        }
        if (auto failure = check_response(response); !failure.ok()) {
            return failure_as<RangeResult>(failure);
        }

        RangeResult result;
        result.data = std::move(response.body);
        result.success = true;
        return result;
    }

    BackendResult delete_object(const std::string& key) override {
        auto request = make_request(net::HttpMethod::DELETE, build_url(key));
        return check_response(send(request));
    }

    ListResult list_objects(const ListOptions& options) const override {
        std::string url = build_url("") + "?list-type=2";
        url += "&prefix=" + net::url_encode(target_.path_prefix + options.prefix);
        if (options.max_keys > 0) {
            url += "&max-keys=" + std::to_string(options.max_keys);
        }
        if (!options.continuation_token.empty()) {
            url += "&continuation-token=" + net::url_encode(options.continuation_token);
        }

        auto request = make_request(net::HttpMethod::GET, url);
        auto response = send(request);
        if (auto failure = check_response(response); !failure.ok()) {
            return failure_as<ListResult>(failure);
        }

        return parse_list_response(response.body_string());
    }

    PresignResult presign_get(const std::string& key,
                              std::chrono::seconds ttl) const override {
        if (ttl.count() <= 0 || ttl > constants::MAX_PRESIGN_TTL) {
            return failure_as<PresignResult>(ErrorKind::InvalidInput,
                "Presign TTL must be between 1s and 7 days");
        }

        PresignResult result;
        result.url = signer_.presign_url(build_url(key), ttl, target_.session_token);
        if (result.url.empty()) {
            return failure_as<PresignResult>(ErrorKind::InvalidInput,
                "Cannot presign malformed URL for " + key);
        }
        result.success = true;
        return result;
    }

private:
    net::HttpRequest make_request(net::HttpMethod method, const std::string& url) const {
        net::HttpRequest request;
        request.method = method;
        request.url = url;
        request.connect_timeout = target_.connect_timeout;
        request.total_timeout = target_.request_timeout;
        request.verify_ssl = target_.verify_ssl;
        return request;
    }

    // Sign with session token if present (STS credentials), then execute
    net::HttpResponse send(net::HttpRequest& request) const {
        if (!target_.session_token.empty()) {
            signer_.sign_with_token(request, target_.session_token);
        } else {
            signer_.sign(request);
        }

        auto response = http_client_->execute(request);
        log_debug("s3 %s %s %s -> %d (%lld ms)",
                  target_.name.c_str(), net::http_method_to_string(request.method),
                  request.url.c_str(), response.status_code,
                  static_cast<long long>(response.total_time.count()));
        return response;
    }

    static BackendResult check_response(const net::HttpResponse& response) {
        if (response.is_network_error) {
            return BackendResult::failed(
                response.timed_out ? ErrorKind::Timeout : ErrorKind::Network,
                response.error);
        }

        ErrorKind kind = classify_http_status(response.status_code);
        if (kind == ErrorKind::None) {
            return BackendResult::succeeded();
        }

        std::string message = "HTTP " + std::to_string(response.status_code);
        std::string body = response.body_string();
        std::string code = xml::get_element(body, "Code");
        if (!code.empty()) {
            message += " " + code;
            std::string detail = xml::get_element(body, "Message");
            if (!detail.empty()) message += ": " + xml::decode_entities(detail);
        }
        if (code == "SlowDown") {
            kind = ErrorKind::Throttled;
        }
        return BackendResult::failed(kind, message);
    }

    std::string build_url(const std::string& key) const {
        std::string url;
        if (!target_.endpoint.empty()) {
            url = target_.endpoint;
            while (!url.empty() && url.back() == '/') url.pop_back();
            if (target_.use_path_style && !target_.bucket.empty()) {
                url += "/" + target_.bucket;
            }
        } else if (target_.use_path_style) {
            url = "https://s3." + target_.region + ".amazonaws.com/" + target_.bucket;
        } else {
            url = "https://" + target_.bucket + ".s3." + target_.region + ".amazonaws.com";
        }

        if (!key.empty()) {
            url += "/" + net::url_encode_path(target_.path_prefix + key);
        } else {
            url += "/";
        }
        return url;
    }

    ListResult parse_list_response(const std::string& body) const {
        ListResult result;
        result.truncated = xml::get_element(body, "IsTruncated") == "true";
        result.continuation_token = xml::get_element(body, "NextContinuationToken");

        for (const auto& content : xml::find_elements(body, "Contents")) {
            ListEntry entry;
            entry.key = xml::decode_entities(xml::get_element(content, "Key"));
            if (!target_.path_prefix.empty() && entry.key.starts_with(target_.path_prefix)) {
                entry.key = entry.key.substr(target_.path_prefix.size());
            }

            std::string size_str = xml::get_element(content, "Size");
            if (!size_str.empty()) {
                try {
                    entry.size = std::stoull(size_str);
                } catch (const std::exception&) {
                    return failure_as<ListResult>(ErrorKind::Protocol,
                        "Malformed Size in listing: " + size_str);
                }
            }

            entry.last_modified = parse_iso8601(xml::get_element(content, "LastModified"));
            entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
            result.entries.push_back(std::move(entry));
        }

        result.success = true;
        return result;
    }

    BackendTarget target_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

// ============================================================================
// Factory
// ============================================================================

std::shared_ptr<BackendClient> BackendFactory::create(const BackendTarget& target) {
    if (target.type == "local") {
        return create_local(target);
    }
    if (target.type == "s3") {
        return create_s3(target);
    }
    throw std::invalid_argument("Unknown backend type: " + target.type);
}

std::shared_ptr<BackendClient> BackendFactory::create_s3(const BackendTarget& target) {
    if (target.bucket.empty()) {
        throw std::invalid_argument("S3 backend '" + target.name + "' requires a bucket");
    }
    if (target.access_key.empty() || target.secret_key.empty()) {
        throw std::invalid_argument("S3 backend '" + target.name + "' requires credentials");
    }
    return std::make_shared<S3BackendClient>(target);
}

std::shared_ptr<BackendClient> BackendFactory::create_local(const BackendTarget& target) {
    if (target.endpoint.empty()) {
        throw std::invalid_argument("Local backend '" + target.name + "' requires a root path");
    }
    return std::make_shared<LocalBackendClient>(target);
}

} // namespace replistore
