#pragma once

#include "domain/TokenClaims.hpp"
#include <string>
#include <optional>

namespace identity::ports::output {

/**
 * @brief Результат разбора и проверки подписи JWT
 */
enum class JwtDecodeStatus {
    OK,
    MALFORMED,            ///< Не три сегмента, невалидный base64url/JSON, нет claims
    UNSUPPORTED_ALGORITHM,///< alg != HS256 (в т.ч. "none")
    UNKNOWN_KEY,          ///< kid не найден в хранилище ключей
    BAD_SIGNATURE
};

struct JwtDecodeResult {
    JwtDecodeStatus status = JwtDecodeStatus::MALFORMED;
    domain::TokenClaims claims;
};

inline std::string toString(JwtDecodeStatus status) {
    switch (status) {
        case JwtDecodeStatus::OK:                    return "OK";
        case JwtDecodeStatus::MALFORMED:             return "Malformed token";
        case JwtDecodeStatus::UNSUPPORTED_ALGORITHM: return "Unsupported token algorithm";
        case JwtDecodeStatus::UNKNOWN_KEY:           return "Unknown signing key";
        case JwtDecodeStatus::BAD_SIGNATURE:         return "Invalid token signature";
        default: return "Unknown";
    }
}

/**
 * @brief Интерфейс провайдера JWT токенов
 *
 * Отвечает только за формат и подпись. Проверка iss/aud/exp -
 * ответственность TokenService.
 */
class IJwtProvider {
public:
    virtual ~IJwtProvider() = default;

    /**
     * @brief Подписать claims текущим ключом
     * @throws domain::SigningKeyUnavailableException
     */
    virtual std::string encode(const domain::TokenClaims& claims) = 0;

    /**
     * @brief Разобрать токен и проверить подпись
     *
     * Не выполняет I/O и не бросает исключений на невалидном вводе.
     */
    virtual JwtDecodeResult decode(const std::string& token) const = 0;
};

} // namespace identity::ports::output
