#pragma once

#include "domain/CallContext.hpp"
#include "domain/SleepSession.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace identity::ports::input {

/**
 * @brief Запрос на сохранение записи о сне
 *
 * Намеренно не содержит accountId: владелец берётся из CallContext.
 */
struct RecordSleepRequest {
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point endedAt;
    int quality = 0;
    std::string notes;
};

/**
 * @brief Сервис пользовательских данных о сне
 */
class ISleepSessionService {
public:
    virtual ~ISleepSessionService() = default;

    /**
     * @throws std::invalid_argument при некорректном интервале или quality
     */
    virtual domain::SleepSession recordSession(
        const domain::CallContext& context,
        const RecordSleepRequest& request
    ) = 0;

    virtual std::vector<domain::SleepSession> listSessions(const domain::CallContext& context) = 0;
};

} // namespace identity::ports::input
