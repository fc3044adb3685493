#pragma once

#include <string>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace identity::domain {

/**
 * @brief Окружение развёртывания
 */
enum class DeploymentMode {
    DEVELOPMENT,
    STAGING,
    PRODUCTION
};

inline std::string toString(DeploymentMode mode) {
    switch (mode) {
        case DeploymentMode::DEVELOPMENT: return "DEVELOPMENT";
        case DeploymentMode::STAGING:     return "STAGING";
        case DeploymentMode::PRODUCTION:  return "PRODUCTION";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Преобразовать строку в DeploymentMode (без учёта регистра)
 * @throws std::invalid_argument если строка не распознана
 */
inline DeploymentMode parseDeploymentMode(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "development" || lower == "dev")  return DeploymentMode::DEVELOPMENT;
    if (lower == "staging")                        return DeploymentMode::STAGING;
    if (lower == "production" || lower == "prod")  return DeploymentMode::PRODUCTION;
    throw std::invalid_argument("Unknown deployment mode: " + str);
}

} // namespace identity::domain
