#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>
#include <chrono>

namespace identity::settings
{

    /**
     * @brief Настройки выдачи и проверки access token'ов
     *
     * Читает из ENV:
     * - IDENTITY_TOKEN_ISSUER             (default: "sleep-identity")
     * - IDENTITY_TOKEN_AUDIENCE           (default: "sleep-api")
     * - IDENTITY_TOKEN_TTL_SECONDS        (default: 1800, 60..86400)
     * - IDENTITY_TOKEN_CLOCK_SKEW_SECONDS (default: 0, 0..300)
     *
     * Clock skew применяется и к exp, и к iat. Без явной настройки
     * допуск нулевой.
     */
    class TokenSettings
    {
    public:
        static constexpr int MIN_TTL_SECONDS = 60;
        static constexpr int MAX_TTL_SECONDS = 86400;
        static constexpr int MAX_CLOCK_SKEW_SECONDS = 300;

        TokenSettings()
        {
            issuer_ = getEnvOrDefault("IDENTITY_TOKEN_ISSUER", "sleep-identity");
            audience_ = getEnvOrDefault("IDENTITY_TOKEN_AUDIENCE", "sleep-api");
            ttlSeconds_ = std::stoi(getEnvOrDefault("IDENTITY_TOKEN_TTL_SECONDS", "1800"));
            clockSkewSeconds_ = std::stoi(getEnvOrDefault("IDENTITY_TOKEN_CLOCK_SKEW_SECONDS", "0"));

            if (issuer_.empty() || audience_.empty())
            {
                throw std::invalid_argument("Token issuer and audience must not be empty");
            }
            if (ttlSeconds_ < MIN_TTL_SECONDS || ttlSeconds_ > MAX_TTL_SECONDS)
            {
                throw std::invalid_argument("IDENTITY_TOKEN_TTL_SECONDS out of range: " + std::to_string(ttlSeconds_));
            }
            if (clockSkewSeconds_ < 0 || clockSkewSeconds_ > MAX_CLOCK_SKEW_SECONDS)
            {
                throw std::invalid_argument("IDENTITY_TOKEN_CLOCK_SKEW_SECONDS out of range: " + std::to_string(clockSkewSeconds_));
            }
        }

        std::string getIssuer() const { return issuer_; }
        std::string getAudience() const { return audience_; }
        int getTtlSeconds() const { return ttlSeconds_; }
        int getClockSkewSeconds() const { return clockSkewSeconds_; }

        std::chrono::seconds getTtl() const { return std::chrono::seconds(ttlSeconds_); }
        std::chrono::seconds getClockSkew() const { return std::chrono::seconds(clockSkewSeconds_); }

    private:
        std::string issuer_;
        std::string audience_;
        int ttlSeconds_;
        int clockSkewSeconds_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace identity::settings
