#pragma once

#include "settings/DbSettings.hpp"
#include "domain/StorageExceptions.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <memory>
#include <string>
#include <iostream>

namespace identity::adapters::secondary
{

    /**
     * @brief Открыть соединение с PostgreSQL в пределах connect_timeout
     *
     * broken_connection, случившийся после истечения connect_timeout,
     * становится StorageTimeoutException. Быстрый отказ (сервер отверг
     * соединение, неверный пароль) пробрасывается как есть.
     */
    inline std::unique_ptr<pqxx::connection> openConnection(const settings::DbSettings &settings)
    {
        auto started = std::chrono::steady_clock::now();
        try
        {
            return std::make_unique<pqxx::connection>(settings.getConnectionString());
        }
        catch (const pqxx::broken_connection &e)
        {
            if (settings.isConnectTimeout(std::chrono::steady_clock::now() - started))
            {
                std::cerr << "[PostgresConnection] Connect to " << settings.getHost()
                          << " timed out after " << settings.getConnectTimeoutSeconds() << "s" << std::endl;
                throw domain::StorageTimeoutException(std::string("Connect timed out: ") + e.what());
            }
            throw;
        }
    }

} // namespace identity::adapters::secondary
