#pragma once

#include <stdexcept>
#include <string>

namespace identity::settings
{

    /**
     * @brief Окружение задаёт недопустимую конфигурацию, сервис не должен стартовать
     */
    class ConfigurationError : public std::runtime_error
    {
    public:
        explicit ConfigurationError(const std::string &message)
            : std::runtime_error(message) {}
    };

    /// Код выхода процесса при ошибке конфигурации (EX_CONFIG из sysexits.h)
    constexpr int EXIT_CONFIGURATION_ERROR = 78;

} // namespace identity::settings
