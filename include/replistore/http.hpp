#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace replistore::net {

enum class HttpMethod {
    GET,
    PUT,
    POST,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

// RFC 3986 unreserved-set encoding (as required by SigV4)
std::string url_encode(const std::string& str);

// Encode every path segment but keep the separators
std::string url_encode_path(const std::string& path);

// Header list with case-insensitive names. Names are stored lowercased and
// kept sorted, which is the order SigV4 canonicalization needs.
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    // Replace every value of `name`
    void set(const std::string& name, const std::string& value);

    // Append a value, keeping earlier values of the same name
    void add(const std::string& name, const std::string& value);

    void remove(const std::string& name);

    // First value of `name`
    std::optional<std::string> get(const std::string& name) const;

    const std::vector<HeaderPair>& all() const { return entries_; }

    void clear() { entries_.clear(); }

private:
    std::vector<HeaderPair> entries_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Caller-owned body; must outlive execute()
    std::span<const uint8_t> body;

    // Inclusive byte range for GET
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{60000};
    bool verify_ssl = true;
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Transport-level failure (no HTTP status)
    std::string error;
    bool is_network_error = false;
    bool timed_out = false;

    std::chrono::milliseconds total_time{0};

    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);

    // host[:port], port omitted when it is the scheme default
    std::string authority() const;
};

struct HttpClientConfig {
    std::string user_agent = "replistore/1.0";
    size_t max_idle_handles = 16;
    size_t max_response_size = 0;    // 0 = unbounded
    bool tcp_keepalive = true;
    bool verbose = false;
};

// Blocking libcurl client. Easy handles are pooled and reused, so one client
// may be shared by concurrent callers.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS Signature Version 4 for S3-compatible services
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service = "s3");

    // Add Host, X-Amz-Date, X-Amz-Content-Sha256 and Authorization headers
    void sign(HttpRequest& request) const;
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

    // Query-string presigned GET URL valid for `expires` from `now`
    std::string presign_url(const std::string& url,
                            std::chrono::seconds expires,
                            const std::string& session_token = "",
                            std::chrono::system_clock::time_point now =
                                std::chrono::system_clock::now()) const;

private:
    // "<date>/<region>/<service>/aws4_request"
    std::string scope(const std::string& date) const;

    // Hex signature over a canonical request made at `amz_date` (yyyymmddThhmmssZ)
    std::string sign_canonical(const std::string& amz_date, const std::string& canonical) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

// Hex helpers shared by the S3 client and the token issuer
std::string sha256_hex(const uint8_t* data, size_t size);
std::string to_hex(const uint8_t* data, size_t size);

} // namespace replistore::net
