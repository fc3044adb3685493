#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include "PostgresConnection.hpp"
#include "domain/StorageExceptions.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>
#include <iostream>

namespace identity::adapters::secondary
{

    /**
     * @brief PostgreSQL репозиторий аккаунтов
     *
     * Уникальность device_fingerprint - constraint accounts_device_fingerprint_key
     * (см. sql/schema.sql); конфликт по нему распознаётся через ON CONFLICT,
     * а не по тексту ошибки. Каждый вызов открывает своё соединение, поэтому
     * параллельные запросы не делят состояние; атомарность create-or-get
     * обеспечивает сама БД, в том числе между несколькими экземплярами сервиса.
     */
    class PostgresAccountRepository : public ports::output::IAccountRepository
    {
    public:
        static constexpr const char *kFingerprintConstraint = "accounts_device_fingerprint_key";

        static constexpr const char *kInsertSql = R"(
            INSERT INTO accounts (account_id, device_fingerprint, created_at)
            VALUES ($1, $2, to_timestamp($3))
            ON CONFLICT ON CONSTRAINT accounts_device_fingerprint_key DO NOTHING
            RETURNING account_id
        )";

        explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
            : settings_(std::move(settings))
        {
            std::cout << "[PostgresAccountRepository] Connecting to " << settings_->getHost() << std::endl;
            try
            {
                auto c = openConnection(*settings_);
                std::cout << "[PostgresAccountRepository] Connected to " << settings_->getName() << std::endl;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresAccountRepository] Connection failed: " << e.what() << std::endl;
                throw;
            }
        }

        domain::Account insert(const domain::Account &account) override
        {
            return withTransaction("insert()", [&](pqxx::work &t)
            {
                auto r = t.exec_params(
                    kInsertSql,
                    account.accountId,
                    account.deviceFingerprint,
                    toEpochSeconds(account.createdAt));
                t.commit();

                // Пустой RETURNING: строку с этим fingerprint вставил другой вызов
                if (r.empty())
                {
                    throw domain::DuplicateFingerprintException(account.deviceFingerprint);
                }
                return account;
            });
        }

        std::optional<domain::Account> findById(const std::string &accountId) override
        {
            return withTransaction("findById()", [&](pqxx::work &t)
            {
                auto r = t.exec_params(
                    R"(SELECT account_id, device_fingerprint, EXTRACT(EPOCH FROM created_at)::BIGINT AS created_epoch
                       FROM accounts WHERE account_id = $1)",
                    accountId);
                t.commit();

                if (r.empty())
                    return std::optional<domain::Account>{};
                return std::optional<domain::Account>{rowToAccount(r[0])};
            });
        }

        std::optional<domain::Account> findByFingerprint(const std::string &fingerprint) override
        {
            return withTransaction("findByFingerprint()", [&](pqxx::work &t)
            {
                auto r = t.exec_params(
                    R"(SELECT account_id, device_fingerprint, EXTRACT(EPOCH FROM created_at)::BIGINT AS created_epoch
                       FROM accounts WHERE device_fingerprint = $1)",
                    fingerprint);
                t.commit();

                if (r.empty())
                    return std::optional<domain::Account>{};
                return std::optional<domain::Account>{rowToAccount(r[0])};
            });
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;

        /**
         * @brief Выполнить fn в транзакции с statement_timeout
         *
         * query_canceled и истёкший connect_timeout -> StorageTimeoutException,
         * прочие ошибки libpqxx -> StorageUnavailableException.
         */
        template <typename Fn>
        auto withTransaction(const char *operation, Fn &&fn) -> decltype(fn(std::declval<pqxx::work &>()))
        {
            try
            {
                auto c = openConnection(*settings_);
                pqxx::work t(*c);
                t.exec("SET LOCAL statement_timeout = " + std::to_string(settings_->getStatementTimeoutMs()));
                return fn(t);
            }
            catch (const pqxx::query_canceled &e)
            {
                std::cerr << "[PostgresAccountRepository] " << operation << " timed out: " << e.what() << std::endl;
                throw domain::StorageTimeoutException(e.what());
            }
            catch (const pqxx::broken_connection &e)
            {
                std::cerr << "[PostgresAccountRepository] " << operation << " connection lost: " << e.what() << std::endl;
                throw domain::StorageUnavailableException(e.what());
            }
            catch (const pqxx::sql_error &e)
            {
                std::cerr << "[PostgresAccountRepository] " << operation << " failed: " << e.what() << std::endl;
                throw domain::StorageUnavailableException(e.what());
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresAccountRepository] " << operation << " failed: " << e.what() << std::endl;
                throw domain::StorageUnavailableException(e.what());
            }
        }

        static int64_t toEpochSeconds(std::chrono::system_clock::time_point tp)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
        }

        static domain::Account rowToAccount(const pqxx::row &row)
        {
            return domain::Account(
                row["account_id"].as<std::string>(),
                row["device_fingerprint"].as<std::string>(),
                std::chrono::system_clock::time_point(std::chrono::seconds(row["created_epoch"].as<int64_t>())));
        }
    };

} // namespace identity::adapters::secondary
