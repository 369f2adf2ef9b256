#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace net_survey::scanner
{
    struct DefaultRoute
    {
        std::string gateway;
        std::string interface_name;
    };

    struct InterfaceAddress
    {
        std::uint32_t address;
        std::uint32_t netmask;
    };

    // Host routing configuration. The system implementation reads the kernel
    // tables; tests substitute fixed answers.
    class RouteTable
    {
    public:
        virtual ~RouteTable() = default;
        virtual std::optional<DefaultRoute> FindDefaultRoute() = 0;
        virtual std::optional<InterfaceAddress> FindInterfaceAddress(const std::string &interface_name) = 0;
    };

    class SystemRouteTable : public RouteTable
    {
    public:
        std::optional<DefaultRoute> FindDefaultRoute() override;
        std::optional<InterfaceAddress> FindInterfaceAddress(const std::string &interface_name) override;
    };
}
