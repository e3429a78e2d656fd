#pragma once

#include <chrono>

namespace bank::settings {

/**
 * @brief Политика повторов при CONCURRENCY_CONFLICT
 */
class IRetrySettings {
public:
    virtual ~IRetrySettings() = default;

    /// Общее число попыток (>= 1), включая первую
    virtual int getMaxAttempts() const = 0;

    /// Шаг линейной паузы между попытками (попытка N ждёт N * backoff)
    virtual std::chrono::milliseconds getBackoff() const = 0;
};

} // namespace bank::settings
