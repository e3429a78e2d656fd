#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>

namespace bank::domain {

/**
 * @brief Временная метка UTC
 *
 * Хранится и сохраняется в БД с точностью до микросекунд,
 * строковая форма округляется вниз до миллисекунд.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMicros(int64_t micros) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros))));
    }

    int64_t toMicros() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            value.time_since_epoch()).count();
    }

    /**
     * @brief ISO 8601 с миллисекундами: 2024-01-31T12:00:00.123Z
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()).count() % 1000;
        if (millis < 0) millis += 1000;

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }
};

} // namespace bank::domain
