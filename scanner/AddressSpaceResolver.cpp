#include "AddressSpaceResolver.hpp"
#include "../common/Errors.hpp"

namespace net_survey::scanner
{
    AddressSpaceResolver::AddressSpaceResolver(RouteTable &routes) : m_routes(routes)
    {
    }

    AddressSpace AddressSpaceResolver::Resolve(const std::optional<std::string> &subnet)
    {
        if (subnet)
        {
            AddressSpace space;
            space.network = common::Ipv4Network::Parse(*subnet);
            return space;
        }
        return Autodetect();
    }

    AddressSpace AddressSpaceResolver::Autodetect()
    {
        auto route = m_routes.FindDefaultRoute();
        if (!route)
            throw common::ConfigurationError("Could not determine default IPv4 gateway");

        auto iface = m_routes.FindInterfaceAddress(route->interface_name);
        if (!iface)
            throw common::ConfigurationError("No IPv4 address found on interface " + route->interface_name);

        auto prefix = common::MaskToPrefix(iface->netmask);
        if (!prefix)
            throw common::ConfigurationError("Non-contiguous netmask " + common::FormatAddress(iface->netmask) +
                                             " on interface " + route->interface_name);

        AddressSpace space;
        space.network = common::Ipv4Network(iface->address, *prefix);
        space.gateway = route->gateway;
        space.interface_name = route->interface_name;
        return space;
    }
}
