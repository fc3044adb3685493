#pragma once

#include <vector>
#include <string>

namespace identity::settings {

/**
 * @brief Определение метрики для Prometheus
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "tokens_issued_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge", "histogram"
};

/**
 * @brief Настройки метрик Identity Service
 *
 * Все ключи перечислены явно: они инициализируются нулями
 * и определяют порядок вывода.
 */
class MetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const {
        return {
            {"accounts_created_total", "Total anonymous accounts created", "counter"},
            {"tokens_issued_total", "Total access tokens issued", "counter"},
            {"auth_requests_total", "Total intercepted calls by outcome", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const {
        return {
            "accounts_created_total",
            "tokens_issued_total",
            "auth_requests_total{result=\"authorized\"}",
            "auth_requests_total{result=\"unauthenticated\"}",
            "auth_requests_total{result=\"unavailable\"}",
            "auth_requests_total{result=\"deadline_exceeded\"}"
        };
    }
};

} // namespace identity::settings
