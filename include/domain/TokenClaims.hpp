#pragma once

#include <string>
#include <chrono>

namespace identity::domain {

/**
 * @brief Registered claims access token'а (RFC 7519)
 *
 * sub - accountId, iss/aud - из TokenSettings, iat/exp - секунды Unix time.
 */
struct TokenClaims {
    std::string subject;    ///< sub
    std::string issuer;     ///< iss
    std::string audience;   ///< aud
    std::string tokenId;    ///< jti
    std::chrono::system_clock::time_point issuedAt;   ///< iat
    std::chrono::system_clock::time_point expiresAt;  ///< exp
};

} // namespace identity::domain
