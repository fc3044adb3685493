#pragma once

#include "enums/AuthMethod.hpp"
#include <string>

namespace identity::domain {

/**
 * @brief Контекст одного входящего вызова
 *
 * Создаётся AuthInterceptor'ом и живёт ровно один запрос.
 * Единственный источник идентичности для бизнес-логики: поля
 * account_id/user_id из тела запроса не используются.
 */
struct CallContext {
    std::string accountId;
    AuthMethod authMethod = AuthMethod::BEARER_TOKEN;

    CallContext() = default;

    CallContext(const std::string& accountId, AuthMethod authMethod)
        : accountId(accountId)
        , authMethod(authMethod)
    {}
};

} // namespace identity::domain
