#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace identity::domain {

/**
 * @brief ISO 8601 (UTC, секундная точность) <-> time_point
 */
class Timestamp {
public:
    /**
     * @brief Разобрать "YYYY-MM-DDTHH:MM:SSZ"
     * @throws std::invalid_argument при неверном формате
     */
    static std::chrono::system_clock::time_point fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        char zone = 0;
        ss >> zone;
        if (zone != 'Z' || ss.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Timestamp must be UTC (suffix Z): " + str);
        }

        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    static std::string toString(std::chrono::system_clock::time_point tp) {
        auto time_t_val = std::chrono::system_clock::to_time_t(tp);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
};

} // namespace identity::domain
