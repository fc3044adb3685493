#pragma once

#include <string>
#include <map>

namespace identity::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Только counter метрики с опциональными labels, вывод в формате Prometheus.
 *
 * @example
 * ```cpp
 * metricsService->increment("tokens_issued_total");
 * metricsService->increment("auth_requests_total", {{"result", "authorized"}});
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик метрики
     *
     * @note Ключ метрики формируется как "name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @return Строка в Prometheus text format (version 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace identity::ports::input
