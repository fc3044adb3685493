#pragma once

#include <string>
#include <stdexcept>

namespace identity::domain {

/**
 * @brief Способ, которым вызов был аутентифицирован
 */
enum class AuthMethod {
    BEARER_TOKEN,         ///< authorization: Bearer <token>
    DEV_ACCOUNT_HEADER    ///< Небезопасный заголовок, только DEVELOPMENT
};

inline std::string toString(AuthMethod method) {
    switch (method) {
        case AuthMethod::BEARER_TOKEN:       return "BEARER_TOKEN";
        case AuthMethod::DEV_ACCOUNT_HEADER: return "DEV_ACCOUNT_HEADER";
        default: return "UNKNOWN";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AuthMethod parseAuthMethod(const std::string& str) {
    if (str == "BEARER_TOKEN")       return AuthMethod::BEARER_TOKEN;
    if (str == "DEV_ACCOUNT_HEADER") return AuthMethod::DEV_ACCOUNT_HEADER;
    throw std::invalid_argument("Unknown auth method: " + str);
}

} // namespace identity::domain
