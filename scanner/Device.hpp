#pragma once

#include <optional>
#include <string>
#include <vector>

namespace net_survey::scanner
{
    struct Device
    {
        std::string ip;
        std::optional<std::string> mac;
        std::optional<std::string> vendor;
        std::optional<std::string> hostname;
        bool is_gateway = false;
        // Unset when liveness probing was disabled.
        std::optional<bool> alive;
        // Set if and only if alive is true.
        std::optional<double> rtt_ms;
        std::string first_seen;
        std::string last_seen;
    };

    struct ScanResult
    {
        std::string subnet;
        std::optional<std::string> gateway_ip;
        // Ascending numeric IPv4 order.
        std::vector<Device> devices;
        std::string started_at;
        std::string finished_at;
    };
}
