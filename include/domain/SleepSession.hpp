#pragma once

#include <string>
#include <chrono>

namespace identity::domain {

/**
 * @brief Запись о сне пользователя
 *
 * Пользовательские данные, доступ к которым защищён AuthInterceptor'ом.
 */
struct SleepSession {
    std::string sessionId;      ///< "sleep-xxxxxxxx"
    std::string accountId;      ///< Владелец (только из CallContext)
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point endedAt;
    int quality = 0;            ///< Оценка качества сна 0..100
    std::string notes;

    int64_t durationMinutes() const {
        return std::chrono::duration_cast<std::chrono::minutes>(endedAt - startedAt).count();
    }
};

} // namespace identity::domain
