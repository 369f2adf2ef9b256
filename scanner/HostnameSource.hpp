#pragma once

#include <optional>
#include <string>

namespace net_survey::scanner
{
    // One strategy for turning an address into a name. Implementations never
    // throw for a missing name, a timeout or a bad reply; they return nullopt.
    class HostnameSource
    {
    public:
        virtual ~HostnameSource() = default;
        virtual std::optional<std::string> Lookup(const std::string &ip) = 0;
    };
}
