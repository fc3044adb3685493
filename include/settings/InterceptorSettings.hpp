#pragma once

#include "domain/enums/DeploymentMode.hpp"
#include "ConfigurationError.hpp"
#include <string>
#include <cstdlib>
#include <stdexcept>
#include <iostream>

namespace identity::settings
{

    /**
     * @brief Настройки AuthInterceptor
     *
     * Читает из ENV:
     * - IDENTITY_ENVIRONMENT              (default: "production")
     * - IDENTITY_ALLOW_DEV_ACCOUNT_HEADER (default: "false")
     *
     * Dev-заголовок с сырым accountId разрешён только в DEVELOPMENT.
     * Флаг, включённый в любом другом окружении, - ошибка конфигурации:
     * сервис не стартует.
     */
    class InterceptorSettings
    {
    public:
        static constexpr const char *DEV_ACCOUNT_HEADER = "x-dev-account-id-insecure";

        InterceptorSettings()
        {
            mode_ = domain::parseDeploymentMode(getEnvOrDefault("IDENTITY_ENVIRONMENT", "production"));
            bool requested = parseBool(getEnvOrDefault("IDENTITY_ALLOW_DEV_ACCOUNT_HEADER", "false"));

            if (requested && mode_ != domain::DeploymentMode::DEVELOPMENT)
            {
                throw ConfigurationError(
                    "IDENTITY_ALLOW_DEV_ACCOUNT_HEADER must not be enabled in " + domain::toString(mode_));
            }

            devHeaderAllowed_ = requested;
            if (devHeaderAllowed_)
            {
                std::cerr << "[InterceptorSettings] WARNING: insecure header '" << DEV_ACCOUNT_HEADER
                          << "' is accepted (DEVELOPMENT only)" << std::endl;
            }
        }

        domain::DeploymentMode getMode() const { return mode_; }

        bool isDevHeaderAllowed() const
        {
            return devHeaderAllowed_ && mode_ == domain::DeploymentMode::DEVELOPMENT;
        }

    private:
        domain::DeploymentMode mode_;
        bool devHeaderAllowed_ = false;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static bool parseBool(const std::string &value)
        {
            if (value == "true" || value == "1" || value == "yes")
                return true;
            if (value == "false" || value == "0" || value == "no" || value.empty())
                return false;
            throw std::invalid_argument("Invalid boolean value: " + value);
        }
    };

} // namespace identity::settings
