#include "replistore/http.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string_view>

namespace replistore::net {

namespace {

constexpr char HEX_LOWER[] = "0123456789abcdef";
constexpr char HEX_UPPER[] = "0123456789ABCDEF";

std::string lowercase(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                          s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::POST: return "POST";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

std::string url_encode(const std::string& str) {
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(HEX_UPPER[c >> 4]);
            out.push_back(HEX_UPPER[c & 0x0f]);
        }
    }
    return out;
}

std::string url_encode_path(const std::string& path) {
    std::string out;
    std::string_view rest(path);
    while (true) {
        auto slash = rest.find('/');
        out += url_encode(std::string(rest.substr(0, slash)));
        if (slash == std::string_view::npos) break;
        out.push_back('/');
        rest.remove_prefix(slash + 1);
    }
    return out;
}

std::string to_hex(const uint8_t* data, size_t size) {
    std::string out(size * 2, '0');
    for (size_t i = 0; i < size; ++i) {
        out[2 * i] = HEX_LOWER[data[i] >> 4];
        out[2 * i + 1] = HEX_LOWER[data[i] & 0x0f];
    }
    return out;
}

std::string sha256_hex(const uint8_t* data, size_t size) {
    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(data, size, digest);
    return to_hex(digest, sizeof(digest));
}

// ============================================================================
// HttpHeaders
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    remove(name);
    add(name, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    auto key = lowercase(name);
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), key,
                                [](const std::string& k, const HeaderPair& e) { return k < e.first; });
    entries_.insert(pos, {std::move(key), value});
}

void HttpHeaders::remove(const std::string& name) {
    auto key = lowercase(name);
    std::erase_if(entries_, [&key](const HeaderPair& e) { return e.first == key; });
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto key = lowercase(name);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const HeaderPair& e) { return e.first == key; });
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    std::string_view rest(url);

    auto sep = rest.find("://");
    if (sep == std::string_view::npos || sep == 0) return std::nullopt;

    ParsedUrl out;
    out.scheme = lowercase(rest.substr(0, sep));
    rest.remove_prefix(sep + 3);

    // Drop any fragment up front; it never reaches the server
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    auto authority_end = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, authority_end);
    rest.remove_prefix(authority_end == std::string_view::npos ? rest.size() : authority_end);
    if (authority.empty()) return std::nullopt;

    std::string_view port_text;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        out.host = std::string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::nullopt;
            port_text = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        out.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) port_text = authority.substr(colon + 1);
    }

    if (!port_text.empty()) {
        auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(),
                                         out.port);
        if (ec != std::errc() || end != port_text.data() + port_text.size() ||
            out.port <= 0 || out.port > 65535) {
            return std::nullopt;
        }
    }

    auto q = rest.find('?');
    out.path = std::string(rest.substr(0, q));
    if (q != std::string_view::npos) out.query = std::string(rest.substr(q + 1));
    return out;
}

std::string ParsedUrl::authority() const {
    std::string h = host.find(':') == std::string::npos ? host : "[" + host + "]";
    bool implicit = port == 0 || (scheme == "https" && port == 443) ||
                    (scheme == "http" && port == 80);
    return implicit ? h : h + ":" + std::to_string(port);
}

// ============================================================================
// HttpClient
// ============================================================================

namespace {

// Owns a curl_slist for the duration of one request
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() { curl_slist_free_all(list_); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& line) { list_ = curl_slist_append(list_, line.c_str()); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// Per-request state shared with the curl callbacks
struct Exchange {
    std::span<const uint8_t> upload;
    size_t upload_pos = 0;

    HttpResponse* response = nullptr;
    size_t body_limit = 0;
    bool body_overflow = false;

    static size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ex = static_cast<Exchange*>(userdata);
        size_t n = size * nmemb;
        auto& body = ex->response->body;
        if (ex->body_limit > 0 && body.size() + n > ex->body_limit) {
            ex->body_overflow = true;
            return 0;
        }
        body.insert(body.end(), ptr, ptr + n);
        return n;
    }

    static size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ex = static_cast<Exchange*>(userdata);
        size_t n = size * nitems;
        std::string_view line = trim(std::string_view(buffer, n));

        // Each status line (100-continue, redirects) opens a fresh header block
        if (line.starts_with("HTTP/")) {
            ex->response->headers.clear();
        } else if (auto colon = line.find(':'); colon != std::string_view::npos) {
            ex->response->headers.add(std::string(line.substr(0, colon)),
                                      std::string(trim(line.substr(colon + 1))));
        }
        return n;
    }

    static size_t on_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ex = static_cast<Exchange*>(userdata);
        size_t n = std::min(size * nitems, ex->upload.size() - ex->upload_pos);
        if (n > 0) {
            std::memcpy(buffer, ex->upload.data() + ex->upload_pos, n);
            ex->upload_pos += n;
        }
        return n;
    }
};

}  // namespace

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        std::lock_guard lock(mutex_);
        for (CURL* handle : idle_) {
            curl_easy_cleanup(handle);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = checkout();
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }

        Exchange exchange;
        exchange.upload = request.body;
        exchange.response = &response;
        exchange.body_limit = config_.max_response_size;

        HeaderList headers;
        for (const auto& [name, value] : request.headers.all()) {
            headers.append(name + ": " + value);
        }
        // Some S3 gateways reject Expect: 100-continue
        headers.append("Expect:");

        std::string range;
        if (request.byte_range) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
        }

        configure(curl, request, exchange, headers, range);

        auto started = std::chrono::steady_clock::now();
        CURLcode rc = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (rc == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
        } else if (exchange.body_overflow) {
            response.body.clear();
            response.status_code = 413;
            response.error = "Response larger than " + std::to_string(config_.max_response_size) +
                             " bytes";
        } else {
            response.body.clear();
            response.error = curl_easy_strerror(rc);
            response.is_network_error = true;
            response.timed_out = rc == CURLE_OPERATION_TIMEDOUT;
        }

        checkin(curl);
        return response;
    }

private:
    void configure(CURL* curl, const HttpRequest& request, Exchange& exchange,
                   const HeaderList& headers, const std::string& range) const {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);
        if (config_.tcp_keepalive) curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        if (config_.verbose) curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, &Exchange::on_upload);
                curl_easy_setopt(curl, CURLOPT_READDATA, &exchange);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
        }

        if (!range.empty()) curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &Exchange::on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &exchange);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &Exchange::on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &exchange);
    }

    // Reuse an idle easy handle so connections stay warm between parts
    CURL* checkout() {
        std::unique_lock lock(mutex_);
        if (idle_.empty()) {
            lock.unlock();
            return curl_easy_init();
        }
        CURL* handle = idle_.back();
        idle_.pop_back();
        return handle;
    }

    void checkin(CURL* handle) {
        curl_easy_reset(handle);
        std::unique_lock lock(mutex_);
        if (idle_.size() >= config_.max_idle_handles) {
            lock.unlock();
            curl_easy_cleanup(handle);
            return;
        }
        idle_.push_back(handle);
    }

    HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

namespace {

using Digest = std::vector<uint8_t>;

Digest hmac(const Digest& key, std::string_view data) {
    Digest out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data(), &len);
    out.resize(len);
    return out;
}

std::string sha256_of(std::string_view s) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// "yyyymmddThhmmssZ"
std::string amz_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

// Sort already-encoded query parameters by name; bare names become "name="
std::string canonical_query(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> params;
    std::string_view rest(query);
    while (!rest.empty()) {
        auto amp = rest.find('&');
        auto param = rest.substr(0, amp);
        if (!param.empty()) {
            auto eq = param.find('=');
            params.emplace_back(std::string(param.substr(0, eq)),
                                eq == std::string_view::npos ? "" : std::string(param.substr(eq + 1)));
        }
        if (amp == std::string_view::npos) break;
        rest.remove_prefix(amp + 1);
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) out.push_back('&');
        out += name + "=" + value;
    }
    return out;
}

// Canonical request over sorted, lowercased headers. Repeated names are
// folded into one comma-separated line. Returns the signed header list
// through `signed_headers`.
std::string canonical_request(const char* method,
                              const ParsedUrl& url,
                              const std::vector<HttpHeaders::HeaderPair>& headers,
                              const std::string& payload_hash,
                              std::string& signed_headers) {
    std::string header_block;
    signed_headers.clear();
    for (size_t i = 0; i < headers.size(); ++i) {
        const auto& [name, value] = headers[i];
        if (i > 0 && headers[i - 1].first == name) {
            header_block.back() = ',';
            header_block += std::string(trim(value)) + "\n";
            continue;
        }
        if (!signed_headers.empty()) signed_headers.push_back(';');
        signed_headers += name;
        header_block += name + ":" + std::string(trim(value)) + "\n";
    }

    return std::string(method) + "\n" +
           (url.path.empty() ? "/" : url.path) + "\n" +
           canonical_query(url.query) + "\n" +
           header_block + "\n" +
           signed_headers + "\n" +
           payload_hash;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

std::string AwsSigV4Signer::scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string AwsSigV4Signer::sign_canonical(const std::string& amz_date,
                                           const std::string& canonical) const {
    std::string date = amz_date.substr(0, 8);
    std::string to_sign = "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope(date) + "\n" +
                          sha256_of(canonical);

    std::string secret = "AWS4" + secret_access_key_;
    Digest key = hmac(Digest(secret.begin(), secret.end()), date);
    for (const std::string& part : {region_, service_, std::string("aws4_request")}) {
        key = hmac(key, part);
    }
    Digest sig = hmac(key, to_sign);
    return to_hex(sig.data(), sig.size());
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    std::string amz_date = amz_timestamp(std::chrono::system_clock::now());

    // A caller may pre-set the payload hash (UNSIGNED-PAYLOAD)
    std::string payload_hash = request.headers.get("X-Amz-Content-Sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
    }

    request.headers.remove("Authorization");
    request.headers.set("Host", url->authority());
    request.headers.set("X-Amz-Date", amz_date);
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::string signed_headers;
    auto canonical = canonical_request(http_method_to_string(request.method), *url,
                                       request.headers.all(), payload_hash, signed_headers);

    request.headers.set("Authorization",
        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope(amz_date.substr(0, 8)) +
        ", SignedHeaders=" + signed_headers +
        ", Signature=" + sign_canonical(amz_date, canonical));
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

std::string AwsSigV4Signer::presign_url(const std::string& url,
                                        std::chrono::seconds expires,
                                        const std::string& session_token,
                                        std::chrono::system_clock::time_point now) const {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) return "";

    std::string amz_date = amz_timestamp(now);

    std::string query = parsed->query.empty() ? "" : parsed->query + "&";
    query += "X-Amz-Algorithm=AWS4-HMAC-SHA256";
    query += "&X-Amz-Credential=" + url_encode(access_key_id_ + "/" + scope(amz_date.substr(0, 8)));
    query += "&X-Amz-Date=" + amz_date;
    query += "&X-Amz-Expires=" + std::to_string(expires.count());
    if (!session_token.empty()) {
        query += "&X-Amz-Security-Token=" + url_encode(session_token);
    }
    query += "&X-Amz-SignedHeaders=host";

    ParsedUrl to_sign = *parsed;
    to_sign.query = query;

    std::string signed_headers;
    auto canonical = canonical_request("GET", to_sign, {{"host", parsed->authority()}},
                                       "UNSIGNED-PAYLOAD", signed_headers);

    return parsed->scheme + "://" + parsed->authority() +
           (parsed->path.empty() ? "/" : parsed->path) +
           "?" + query + "&X-Amz-Signature=" + sign_canonical(amz_date, canonical);
}

}  // namespace replistore::net
