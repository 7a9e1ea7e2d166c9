#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace sessions::domain {

/**
 * @brief Временная метка в UTC (ISO 8601, секундная точность)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
};

} // namespace sessions::domain
