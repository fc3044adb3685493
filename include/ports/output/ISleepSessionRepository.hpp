#pragma once

#include "domain/SleepSession.hpp"
#include <string>
#include <vector>

namespace identity::ports::output {

/**
 * @brief Интерфейс репозитория записей о сне
 */
class ISleepSessionRepository {
public:
    virtual ~ISleepSessionRepository() = default;

    /**
     * @throws domain::UnknownAccountException если accountId нет среди аккаунтов
     * @throws domain::StorageTimeoutException
     * @throws domain::StorageUnavailableException
     */
    virtual domain::SleepSession save(const domain::SleepSession& session) = 0;
    virtual std::vector<domain::SleepSession> findByAccountId(const std::string& accountId) = 0;
};

} // namespace identity::ports::output
