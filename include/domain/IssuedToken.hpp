#pragma once

#include <string>
#include <chrono>

namespace identity::domain {

/**
 * @brief Выданный bearer token
 */
struct IssuedToken {
    std::string token;
    std::string accountId;
    std::chrono::system_clock::time_point issuedAt;
    std::chrono::system_clock::time_point expiresAt;

    int64_t expiresInSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(expiresAt - issuedAt).count();
    }
};

} // namespace identity::domain
