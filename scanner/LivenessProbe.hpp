#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace net_survey::scanner
{
    // Address -> round-trip time in milliseconds. Silent addresses are absent.
    using RttMap = std::map<std::string, double>;

    class LivenessProbe
    {
    public:
        virtual ~LivenessProbe() = default;
        virtual RttMap Probe(const std::vector<std::string> &ips,
                             const std::optional<std::string> &interface_name) = 0;
    };
}
