#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>

namespace ibtrader::domain {

/**
 * @brief Временная метка (UTC), сериализуется в ISO 8601
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Преобразовать в ISO 8601 строку ("2025-12-16T10:30:00Z")
     */
    std::string toString() const {
        auto timeValue = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&timeValue, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    /**
     * @brief Сколько прошло с этой метки до момента now
     */
    std::chrono::milliseconds ageAt(const Timestamp& now) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now.value - value);
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }
};

} // namespace ibtrader::domain
