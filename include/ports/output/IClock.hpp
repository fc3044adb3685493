#pragma once

#include <chrono>

namespace identity::ports::output {

/**
 * @brief Источник текущего времени
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
};

} // namespace identity::ports::output
