#pragma once

#include "ConfigurationError.hpp"
#include <string>
#include <chrono>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace identity::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения (K8s ENV).
     * IDENTITY_DB_STATEMENT_TIMEOUT_MS - deadline для каждого запроса к БД.
     * IDENTITY_DB_CONNECT_TIMEOUT_MS - deadline на установку соединения,
     * передаётся в libpq как connect_timeout в целых секундах (не меньше 2).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("IDENTITY_DB_HOST", "identity-postgres");
            port_ = std::stoi(getEnvOrDefault("IDENTITY_DB_PORT", "5432"));
            name_ = getEnvOrDefault("IDENTITY_DB_NAME", "identity_db");
            user_ = getEnvOrDefault("IDENTITY_DB_USER", "identity_user");
            password_ = getEnvOrThrow("IDENTITY_DB_PASSWORD");
            statementTimeoutMs_ = std::stoi(getEnvOrDefault("IDENTITY_DB_STATEMENT_TIMEOUT_MS", "2000"));
            connectTimeoutMs_ = std::stoi(getEnvOrDefault("IDENTITY_DB_CONNECT_TIMEOUT_MS", "2000"));

            if (statementTimeoutMs_ <= 0)
            {
                throw std::invalid_argument("IDENTITY_DB_STATEMENT_TIMEOUT_MS must be positive");
            }
            if (connectTimeoutMs_ <= 0)
            {
                throw std::invalid_argument("IDENTITY_DB_CONNECT_TIMEOUT_MS must be positive");
            }
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }
        int getStatementTimeoutMs() const { return statementTimeoutMs_; }
        int getConnectTimeoutMs() const { return connectTimeoutMs_; }

        // libpq принимает только секунды и поднимает 1 до 2
        int getConnectTimeoutSeconds() const
        {
            return std::max(2, (connectTimeoutMs_ + 999) / 1000);
        }

        /**
         * @brief Неудачное подключение длилось до срабатывания connect_timeout
         *
         * libpq отсчитывает connect_timeout с точностью до секунды,
         * поэтому срабатывание возможно на секунду раньше номинала.
         */
        bool isConnectTimeout(std::chrono::steady_clock::duration elapsed) const
        {
            return elapsed >= std::chrono::seconds(getConnectTimeoutSeconds() - 1);
        }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_ +
                   " connect_timeout=" + std::to_string(getConnectTimeoutSeconds());
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int statementTimeoutMs_;
        int connectTimeoutMs_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static std::string getEnvOrThrow(const char *name)
        {
            const char *value = std::getenv(name);
            if (!value)
            {
                throw ConfigurationError(std::string("Required env variable not set: ") + name);
            }
            return value;
        }
    };

} // namespace identity::settings
