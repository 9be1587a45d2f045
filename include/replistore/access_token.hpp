#pragma once

#include "replistore/constants.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace replistore {

/// Claims carried by a verified access token.
struct TokenClaims {
    std::string identity;
    std::string object_name;
    std::chrono::system_clock::time_point expires_at;
};

/// Issues and verifies stateless capability tokens of the form
/// "identity:object_name:expiry:signature", where expiry is unix seconds and
/// signature is the lowercase hex HMAC-SHA256 of the first three fields.
///
/// Tokens cannot be revoked or extended. Expiry is truncated to whole
/// seconds at issue; a token stops verifying as soon as the clock moves past
/// that instant.
class AccessTokenIssuer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// Throws std::invalid_argument if `secret` is empty.
    explicit AccessTokenIssuer(std::string secret, Clock clock = {});

    /// Throws std::invalid_argument if a field contains the delimiter or
    /// is empty, or if ttl is not positive.
    std::string issue(const std::string& identity,
                      const std::string& object_name,
                      std::chrono::seconds ttl = constants::DEFAULT_TOKEN_TTL) const;

    /// Malformed, forged and expired tokens all yield std::nullopt.
    std::optional<TokenClaims> verify(const std::string& token) const;

private:
    std::string sign(const std::string& payload) const;

    std::string secret_;
    Clock clock_;
};

} // namespace replistore
