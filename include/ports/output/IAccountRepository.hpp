#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>

namespace identity::ports::output {

/**
 * @brief Интерфейс репозитория аккаунтов
 *
 * Реализация обязана обеспечивать уникальность device_fingerprint
 * на уровне хранилища (unique index), а не проверкой в приложении.
 *
 * @throws domain::StorageUnavailableException хранилище недоступно
 * @throws domain::StorageTimeoutException превышен statement timeout
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Атомарно вставить новый аккаунт
     * @throws domain::DuplicateFingerprintException fingerprint уже занят
     */
    virtual domain::Account insert(const domain::Account& account) = 0;

    virtual std::optional<domain::Account> findById(const std::string& accountId) = 0;
    virtual std::optional<domain::Account> findByFingerprint(const std::string& fingerprint) = 0;
};

} // namespace identity::ports::output
