#pragma once

#include "domain/enums/AuthErrorCode.hpp"
#include <string>

namespace identity::ports::input {

/**
 * @brief Результат create-or-get
 */
struct CreateOrGetResult {
    bool success = false;
    std::string accountId;
    bool created = false;       ///< true - аккаунт создан этим вызовом
    domain::AuthErrorCode error = domain::AuthErrorCode::OK;
    std::string message;
};

/**
 * @brief Выдача анонимной идентичности по отпечатку устройства
 */
class IIdentityIssuer {
public:
    virtual ~IIdentityIssuer() = default;

    /**
     * @brief Вернуть существующий аккаунт устройства или создать новый
     *
     * Идемпотентно: повторный вызов с тем же fingerprint возвращает
     * тот же accountId, в том числе при параллельных вызовах.
     */
    virtual CreateOrGetResult createOrGetAccount(const std::string& deviceFingerprint) = 0;
};

} // namespace identity::ports::input
