#pragma once

#include "domain/CallContext.hpp"
#include "domain/enums/AuthErrorCode.hpp"
#include <string>
#include <optional>
#include <vector>

namespace identity::ports::input {

/**
 * @brief Состояния обработки входящего вызова
 */
enum class InterceptState {
    RECEIVED,
    EXTRACTING,
    VALIDATING,
    AUTHORIZED,
    REJECTED
};

inline std::string toString(InterceptState state) {
    switch (state) {
        case InterceptState::RECEIVED:   return "RECEIVED";
        case InterceptState::EXTRACTING: return "EXTRACTING";
        case InterceptState::VALIDATING: return "VALIDATING";
        case InterceptState::AUTHORIZED: return "AUTHORIZED";
        case InterceptState::REJECTED:   return "REJECTED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Credential'ы из метаданных вызова
 */
struct InboundCredentials {
    std::optional<std::string> authorization;   ///< Заголовок authorization
    std::optional<std::string> devAccountId;    ///< Небезопасный dev-заголовок
};

/**
 * @brief Итог обработки вызова
 */
struct InterceptResult {
    InterceptState state = InterceptState::RECEIVED;
    std::vector<InterceptState> trace;          ///< Пройденные состояния
    std::optional<domain::CallContext> context; ///< Только для AUTHORIZED
    domain::AuthErrorCode error = domain::AuthErrorCode::OK;
    std::string message;

    bool authorized() const { return state == InterceptState::AUTHORIZED; }
};

/**
 * @brief Аутентификация каждого входящего вызова
 */
class IAuthInterceptor {
public:
    virtual ~IAuthInterceptor() = default;

    virtual InterceptResult intercept(const InboundCredentials& credentials) = 0;
};

} // namespace identity::ports::input
