#pragma once

#include <chrono>
#include <string>

namespace net_survey::common
{
    // "2024-05-01T10:20:30.123456Z"
    std::string FormatIsoTimestamp(std::chrono::system_clock::time_point when);

    inline std::string UtcNow()
    {
        return FormatIsoTimestamp(std::chrono::system_clock::now());
    }
}
