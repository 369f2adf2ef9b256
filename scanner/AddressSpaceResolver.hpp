#pragma once

#include <optional>
#include <string>
#include "RouteTable.hpp"
#include "../common/Ipv4.hpp"

namespace net_survey::scanner
{
    struct AddressSpace
    {
        common::Ipv4Network network;
        // Only set when the range was autodetected from the default route.
        std::optional<std::string> gateway;
        std::optional<std::string> interface_name;
    };

    class AddressSpaceResolver
    {
    public:
        explicit AddressSpaceResolver(RouteTable &routes);

        // An explicit subnet wins; otherwise the default route's interface decides.
        // Throws common::ConfigurationError.
        AddressSpace Resolve(const std::optional<std::string> &subnet);

    private:
        AddressSpace Autodetect();

        RouteTable &m_routes;
    };
}
