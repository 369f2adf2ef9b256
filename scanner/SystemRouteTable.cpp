#include "RouteTable.hpp"
#include "../common/Ipv4.hpp"

#include <tins/tins.h>

namespace net_survey::scanner
{
    std::optional<DefaultRoute> SystemRouteTable::FindDefaultRoute()
    {
        std::optional<DefaultRoute> best;
        int bestMetric = 0;

        for (const auto &entry : Tins::Utils::route_entries())
        {
            if (entry.destination.to_string() != "0.0.0.0" || entry.mask.to_string() != "0.0.0.0")
                continue;
            if (entry.gateway.to_string() == "0.0.0.0")
                continue;

            if (!best || entry.metric < bestMetric)
            {
                best = DefaultRoute{entry.gateway.to_string(), entry.interface};
                bestMetric = entry.metric;
            }
        }
        return best;
    }

    std::optional<InterfaceAddress> SystemRouteTable::FindInterfaceAddress(const std::string &interface_name)
    {
        Tins::NetworkInterface::Info info;
        try
        {
            info = Tins::NetworkInterface(interface_name).info();
        }
        catch (const Tins::invalid_interface &)
        {
            return std::nullopt;
        }

        auto address = common::ParseAddress(info.ip_addr.to_string());
        auto netmask = common::ParseAddress(info.netmask.to_string());
        if (!address || *address == 0 || !netmask)
            return std::nullopt;
        // No mask configured: assume a /24.
        if (*netmask == 0)
            return InterfaceAddress{*address, 0xFFFFFF00u};
        return InterfaceAddress{*address, *netmask};
    }
}
