#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timefmt
{
    // Local time as ISO-8601 with microseconds, e.g. 2024-03-01T14:22:05.120431
    inline std::string toIsoString(std::chrono::system_clock::time_point tp)
    {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) % 1000000;
        if (us.count() < 0)
            us += std::chrono::seconds(1);

        std::tm local{};
        localtime_r(&time_t, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(6) << us.count();
        return ss.str();
    }

    // Compact id used for report names: 20240301_142205
    inline std::string toCompactId(std::chrono::system_clock::time_point tp)
    {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&time_t, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%Y%m%d_%H%M%S");
        return ss.str();
    }

} // namespace timefmt
