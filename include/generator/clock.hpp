#pragma once

#include <chrono>

namespace squid {
/**
 * @class Clock
 * @brief Источник текущего времени для генератора
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Текущее время относительно эпохи Unix
     * @return Количество миллисекунд с начала эпохи (отрицательное, если часы показывают время
     * раньше эпохи)
     */
    virtual std::chrono::milliseconds sinceEpoch() = 0;
};

/**
 * @class SystemClock
 * @brief Системные часы реального времени (std::chrono::system_clock)
 */
class SystemClock : public Clock {
public:
    std::chrono::milliseconds sinceEpoch() override;
};
} // namespace squid
