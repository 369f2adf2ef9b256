#include "TimeFormat.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace net_survey::common
{
    std::string FormatIsoTimestamp(std::chrono::system_clock::time_point when)
    {
        auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(when);
        if (seconds > when)
            seconds -= std::chrono::seconds(1);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(when - seconds).count();

        std::time_t raw = std::chrono::system_clock::to_time_t(seconds);
        std::tm utc{};
        gmtime_r(&raw, &utc);

        std::ostringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
        return ss.str();
    }
}
