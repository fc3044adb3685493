#pragma once

#include "ports/output/ISleepSessionRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/StorageExceptions.hpp"
#include "PostgresConnection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace identity::adapters::secondary
{

    /**
     * @brief PostgreSQL репозиторий записей о сне
     *
     * sleep_sessions.account_id ссылается на accounts: запись для
     * несуществующего аккаунта (например, из dev-заголовка) отклоняется
     * как UnknownAccountException.
     */
    class PostgresSleepSessionRepository : public ports::output::ISleepSessionRepository
    {
    public:
        explicit PostgresSleepSessionRepository(std::shared_ptr<settings::DbSettings> settings)
            : settings_(std::move(settings))
        {
            std::cout << "[PostgresSleepSessionRepository] Created" << std::endl;
        }

        domain::SleepSession save(const domain::SleepSession &session) override
        {
            try
            {
                auto c = openConnection(*settings_);
                pqxx::work t(*c);
                t.exec("SET LOCAL statement_timeout = " + std::to_string(settings_->getStatementTimeoutMs()));
                t.exec_params(
                    R"(
                        INSERT INTO sleep_sessions (session_id, account_id, started_at, ended_at, quality, notes)
                        VALUES ($1, $2, to_timestamp($3), to_timestamp($4), $5, $6)
                    )",
                    session.sessionId,
                    session.accountId,
                    toEpochSeconds(session.startedAt),
                    toEpochSeconds(session.endedAt),
                    session.quality,
                    session.notes);
                t.commit();
                return session;
            }
            catch (const pqxx::query_canceled &e)
            {
                std::cerr << "[PostgresSleepSessionRepository] save() timed out: " << e.what() << std::endl;
                throw domain::StorageTimeoutException(e.what());
            }
            catch (const pqxx::foreign_key_violation &e)
            {
                std::cerr << "[PostgresSleepSessionRepository] save() for unknown account " << session.accountId << ": " << e.what() << std::endl;
                throw domain::UnknownAccountException(session.accountId);
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresSleepSessionRepository] save() failed: " << e.what() << std::endl;
                throw domain::StorageUnavailableException(e.what());
            }
        }

        std::vector<domain::SleepSession> findByAccountId(const std::string &accountId) override
        {
            try
            {
                auto c = openConnection(*settings_);
                pqxx::work t(*c);
                t.exec("SET LOCAL statement_timeout = " + std::to_string(settings_->getStatementTimeoutMs()));
                auto r = t.exec_params(
                    R"(SELECT session_id, account_id,
                              EXTRACT(EPOCH FROM started_at)::BIGINT AS started_epoch,
                              EXTRACT(EPOCH FROM ended_at)::BIGINT AS ended_epoch,
                              quality, notes
                       FROM sleep_sessions WHERE account_id = $1
                       ORDER BY started_at DESC)",
                    accountId);
                t.commit();

                std::vector<domain::SleepSession> sessions;
                for (const auto &row : r)
                {
                    sessions.push_back(rowToSession(row));
                }
                return sessions;
            }
            catch (const pqxx::query_canceled &e)
            {
                std::cerr << "[PostgresSleepSessionRepository] findByAccountId() timed out: " << e.what() << std::endl;
                throw domain::StorageTimeoutException(e.what());
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresSleepSessionRepository] findByAccountId() failed: " << e.what() << std::endl;
                throw domain::StorageUnavailableException(e.what());
            }
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;

        static int64_t toEpochSeconds(std::chrono::system_clock::time_point tp)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
        }

        static domain::SleepSession rowToSession(const pqxx::row &row)
        {
            domain::SleepSession s;
            s.sessionId = row["session_id"].as<std::string>();
            s.accountId = row["account_id"].as<std::string>();
            s.startedAt = std::chrono::system_clock::time_point(std::chrono::seconds(row["started_epoch"].as<int64_t>()));
            s.endedAt = std::chrono::system_clock::time_point(std::chrono::seconds(row["ended_epoch"].as<int64_t>()));
            s.quality = row["quality"].as<int>();
            s.notes = row["notes"].is_null() ? "" : row["notes"].as<std::string>();
            return s;
        }
    };

} // namespace identity::adapters::secondary
