#pragma once

#include <chrono>
#include "DiscoveryProbe.hpp"

namespace net_survey::scanner
{
    // Broadcasts one ARP who-has per host and listens for is-at replies.
    class ArpSweeper : public DiscoveryProbe
    {
    public:
        ArpSweeper(std::chrono::milliseconds window, std::chrono::milliseconds spacing);

        DiscoveryMap Sweep(const common::Ipv4Network &network,
                           const std::optional<std::string> &interface_name) override;

    private:
        std::chrono::milliseconds m_window;
        std::chrono::milliseconds m_spacing;
    };
}
