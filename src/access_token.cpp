#include "replistore/access_token.hpp"
#include "replistore/http.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>
#include <vector>

namespace replistore {

namespace {

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

bool is_decimal(const std::string& s) {
    if (s.empty() || s.size() > 18) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

AccessTokenIssuer::AccessTokenIssuer(std::string secret, Clock clock)
    : secret_(std::move(secret))
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {
    if (secret_.empty()) {
        throw std::invalid_argument("Token secret must not be empty");
    }
}

std::string AccessTokenIssuer::sign(const std::string& payload) const {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
         reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
         mac, &mac_len);

    return net::to_hex(mac, mac_len);
}

std::string AccessTokenIssuer::issue(const std::string& identity,
                                     const std::string& object_name,
                                     std::chrono::seconds ttl) const {
    if (identity.empty() || object_name.empty()) {
        throw std::invalid_argument("Token identity and object name must not be empty");
    }
    if (identity.find(constants::TOKEN_DELIMITER) != std::string::npos ||
        object_name.find(constants::TOKEN_DELIMITER) != std::string::npos) {
        throw std::invalid_argument("Token fields must not contain ':'");
    }
    if (ttl.count() <= 0) {
        throw std::invalid_argument("Token TTL must be positive");
    }

    auto expiry = std::chrono::duration_cast<std::chrono::seconds>(
        (clock_() + ttl).time_since_epoch()).count();

    std::string payload = identity + constants::TOKEN_DELIMITER + object_name +
                          constants::TOKEN_DELIMITER + std::to_string(expiry);
    return payload + constants::TOKEN_DELIMITER + sign(payload);
}

std::optional<TokenClaims> AccessTokenIssuer::verify(const std::string& token) const {
    auto parts = split(token, constants::TOKEN_DELIMITER);
    if (parts.size() != 4) {
        return std::nullopt;
    }

    const auto& identity = parts[0];
    const auto& object_name = parts[1];
    const auto& expiry = parts[2];
    const auto& signature = parts[3];

    if (identity.empty() || object_name.empty() || !is_decimal(expiry)) {
        return std::nullopt;
    }

    std::string expected = sign(identity + constants::TOKEN_DELIMITER + object_name +
                                constants::TOKEN_DELIMITER + expiry);
    if (signature.size() != expected.size() ||
        CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
        return std::nullopt;
    }

    // Expiry is whole seconds, compared against the full-resolution clock
    std::chrono::system_clock::time_point expires_at{std::chrono::seconds(std::stoll(expiry))};
    if (expires_at < clock_()) {
        return std::nullopt;
    }

    return TokenClaims{identity, object_name, expires_at};
}

} // namespace replistore
