#pragma once

#include <chrono>
#include <cstdint>
#include "LivenessProbe.hpp"

namespace net_survey::scanner
{
    // One echo request per address, sequentially, each with its own window.
    // A capture that cannot be opened leaves every address unanswered.
    class IcmpPinger : public LivenessProbe
    {
    public:
        IcmpPinger(std::chrono::milliseconds timeout, std::chrono::milliseconds spacing);

        RttMap Probe(const std::vector<std::string> &ips,
                     const std::optional<std::string> &interface_name) override;

    private:
        std::chrono::milliseconds m_timeout;
        std::chrono::milliseconds m_spacing;
        std::uint16_t m_identifier;
    };
}
