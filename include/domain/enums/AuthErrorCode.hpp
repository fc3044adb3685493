#pragma once

#include <string>

namespace identity::domain {

/**
 * @brief Таксономия ошибок аутентификации
 *
 * Значения совпадают по смыслу с gRPC status codes, чтобы
 * gRPC-Web клиент мог различать "не залогинен" и "сервис деградировал".
 */
enum class AuthErrorCode {
    OK,
    INVALID_ARGUMENT,   ///< Некорректный fingerprint или форма запроса
    UNAUTHENTICATED,    ///< Нет credential, невалидный или истёкший токен
    UNAVAILABLE,        ///< Хранилище или ключи подписи недоступны
    DEADLINE_EXCEEDED   ///< Превышен таймаут операции
};

inline std::string toString(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::OK:                return "OK";
        case AuthErrorCode::INVALID_ARGUMENT:  return "INVALID_ARGUMENT";
        case AuthErrorCode::UNAUTHENTICATED:   return "UNAUTHENTICATED";
        case AuthErrorCode::UNAVAILABLE:       return "UNAVAILABLE";
        case AuthErrorCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief HTTP статус для ответа клиенту
 */
inline int toHttpStatus(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::OK:                return 200;
        case AuthErrorCode::INVALID_ARGUMENT:  return 400;
        case AuthErrorCode::UNAUTHENTICATED:   return 401;
        case AuthErrorCode::UNAVAILABLE:       return 503;
        case AuthErrorCode::DEADLINE_EXCEEDED: return 504;
        default: return 500;
    }
}

/**
 * @brief Числовой gRPC status (заголовок grpc-status)
 */
inline int toGrpcStatus(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::OK:                return 0;
        case AuthErrorCode::INVALID_ARGUMENT:  return 3;
        case AuthErrorCode::UNAUTHENTICATED:   return 16;
        case AuthErrorCode::UNAVAILABLE:       return 14;
        case AuthErrorCode::DEADLINE_EXCEEDED: return 4;
        default: return 2;
    }
}

} // namespace identity::domain
