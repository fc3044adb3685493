#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/MetricsSettings.hpp"

#include <memory>
#include <string>
#include <sstream>
#include <map>
#include <vector>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <iostream>

namespace identity::application {

/**
 * @brief Счётчики Identity Service в формате Prometheus
 *
 * Семейства метрик объявлены в MetricsSettings. Серии из getAllKeys()
 * создаются нулями при старте, остальные - при первом increment().
 * Инкремент незарегистрированного семейства игнорируется с предупреждением.
 *
 * Вывод сгруппирован по семействам: HELP, TYPE и затем все серии семейства.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::MetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& def : settings_->getDefinitions()) {
            families_[def.name];
        }
        for (const auto& key : settings_->getAllKeys()) {
            addSeries(familyOf(key), key, 0);
        }

        std::cout << "[MetricsService] Initialized with " << families_.size()
                  << " families, " << series_.size() << " series" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = series_.find(key);
            if (it != series_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = series_.find(key);
        if (it != series_.end()) {
            it->second->fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (families_.find(name) == families_.end()) {
            std::cerr << "[MetricsService] Unknown metric family: " << name << std::endl;
            return;
        }
        addSeries(name, key, 1);
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;
        std::shared_lock<std::shared_mutex> lock(mutex_);

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";

            auto family = families_.find(def.name);
            if (family == families_.end()) continue;

            for (const auto& key : family->second) {
                oss << key << " " << series_.at(key)->load(std::memory_order_relaxed) << "\n";
            }
        }

        return oss.str();
    }

    /**
     * @brief Текущее значение серии, 0 если её нет
     */
    int64_t value(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = series_.find(key);
        return it == series_.end() ? 0 : it->second->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<settings::MetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::vector<std::string>> families_;  // family -> series keys
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> series_;

    // Вызывается под unique_lock или из конструктора
    void addSeries(const std::string& family, const std::string& key, int64_t initial) {
        series_[key] = std::make_unique<std::atomic<int64_t>>(initial);
        families_[family].push_back(key);
    }

    static std::string familyOf(const std::string& key) {
        return key.substr(0, key.find('{'));
    }

    static std::string escapeLabel(const std::string& value) {
        std::string out;
        for (char c : value) {
            if (c == '\\' || c == '"') out.push_back('\\');
            if (c == '\n') {
                out += "\\n";
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << escapeLabel(v) << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }
};

} // namespace identity::application
