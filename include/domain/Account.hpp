#pragma once

#include <string>
#include <chrono>

namespace identity::domain {

/**
 * @brief Анонимный аккаунт, привязанный к устройству
 *
 * Создаётся Identity Issuer при первом запуске приложения на устройстве.
 * Идентификатор неизменяем, аккаунт этим сервисом не удаляется.
 */
struct Account {
    std::string accountId;           ///< UUID v4
    std::string deviceFingerprint;   ///< Vendor-scoped ID устройства (уникальный ключ)
    std::chrono::system_clock::time_point createdAt;

    Account() = default;

    Account(const std::string& accountId,
            const std::string& deviceFingerprint,
            std::chrono::system_clock::time_point createdAt)
        : accountId(accountId)
        , deviceFingerprint(deviceFingerprint)
        , createdAt(createdAt)
    {}
};

} // namespace identity::domain
