#pragma once

#include <string>
#include <optional>

namespace identity::ports::output {

/**
 * @brief HMAC ключ подписи
 */
struct SigningKey {
    std::string keyId;    ///< Значение заголовка kid
    std::string secret;
};

/**
 * @brief Хранилище секретов для подписи токенов
 *
 * currentKey() используется для подписи, findKey() - для проверки.
 * Предыдущий ключ остаётся доступным для проверки на время ротации.
 */
class ISigningKeyStore {
public:
    virtual ~ISigningKeyStore() = default;

    /**
     * @throws domain::SigningKeyUnavailableException
     */
    virtual SigningKey currentKey() const = 0;

    virtual std::optional<SigningKey> findKey(const std::string& keyId) const = 0;
};

} // namespace identity::ports::output
