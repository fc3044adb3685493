#pragma once

#include "domain/IssuedToken.hpp"
#include "domain/enums/AuthErrorCode.hpp"
#include <string>

namespace identity::ports::input {

/**
 * @brief Результат выдачи токена
 */
struct IssueTokenResult {
    bool success = false;
    domain::IssuedToken token;
    domain::AuthErrorCode error = domain::AuthErrorCode::OK;
    std::string message;
};

/**
 * @brief Результат валидации токена
 */
struct ValidateResult {
    bool valid = false;
    std::string accountId;
    domain::AuthErrorCode error = domain::AuthErrorCode::OK;
    std::string message;
};

/**
 * @brief Интерфейс сервиса bearer токенов
 */
class ITokenService {
public:
    virtual ~ITokenService() = default;

    /**
     * @brief Выдать подписанный токен для существующего аккаунта
     */
    virtual IssueTokenResult issue(const std::string& accountId) = 0;

    /**
     * @brief Проверить подпись, iss, aud и срок действия
     *
     * Горячий путь: вызывается на каждый запрос, без I/O и побочных эффектов.
     */
    virtual ValidateResult validate(const std::string& token) = 0;
};

} // namespace identity::ports::input
