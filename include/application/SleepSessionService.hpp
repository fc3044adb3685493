#pragma once

#include "ports/input/ISleepSessionService.hpp"
#include "ports/output/ISleepSessionRepository.hpp"
#include "IdGenerator.hpp"
#include <memory>
#include <stdexcept>
#include <iostream>

namespace identity::application {

/**
 * @brief Сервис записей о сне
 *
 * Владелец записи всегда context.accountId.
 */
class SleepSessionService : public ports::input::ISleepSessionService {
public:
    explicit SleepSessionService(
        std::shared_ptr<ports::output::ISleepSessionRepository> sessionRepo
    ) : sessionRepo_(std::move(sessionRepo))
    {
        std::cout << "[SleepSessionService] Created" << std::endl;
    }

    domain::SleepSession recordSession(
        const domain::CallContext& context,
        const ports::input::RecordSleepRequest& request
    ) override {
        if (context.accountId.empty()) {
            throw std::invalid_argument("Call context has no account");
        }
        if (request.endedAt <= request.startedAt) {
            throw std::invalid_argument("ended_at must be after started_at");
        }
        if (request.quality < 0 || request.quality > 100) {
            throw std::invalid_argument("quality must be within 0..100");
        }

        domain::SleepSession session;
        session.sessionId = IdGenerator::prefixed("sleep");
        session.accountId = context.accountId;
        session.startedAt = request.startedAt;
        session.endedAt = request.endedAt;
        session.quality = request.quality;
        session.notes = request.notes;

        return sessionRepo_->save(session);
    }

    std::vector<domain::SleepSession> listSessions(const domain::CallContext& context) override {
        if (context.accountId.empty()) {
            throw std::invalid_argument("Call context has no account");
        }
        return sessionRepo_->findByAccountId(context.accountId);
    }

private:
    std::shared_ptr<ports::output::ISleepSessionRepository> sessionRepo_;
};

} // namespace identity::application
