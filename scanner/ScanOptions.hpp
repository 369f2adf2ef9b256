#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace net_survey::scanner
{
    inline constexpr std::chrono::milliseconds DEFAULT_ARP_WINDOW{2000};
    inline constexpr std::chrono::milliseconds DEFAULT_ARP_SPACING{20};
    inline constexpr std::chrono::milliseconds DEFAULT_ECHO_TIMEOUT{1000};
    inline constexpr std::chrono::milliseconds DEFAULT_ECHO_SPACING{30};
    inline constexpr std::chrono::milliseconds DEFAULT_MDNS_TIMEOUT{700};

    struct ProbeTiming
    {
        std::chrono::milliseconds arp_window = DEFAULT_ARP_WINDOW;
        std::chrono::milliseconds arp_spacing = DEFAULT_ARP_SPACING;
        std::chrono::milliseconds echo_timeout = DEFAULT_ECHO_TIMEOUT;
        std::chrono::milliseconds echo_spacing = DEFAULT_ECHO_SPACING;
        std::chrono::milliseconds mdns_timeout = DEFAULT_MDNS_TIMEOUT;
    };

    struct ScanOptions
    {
        std::optional<std::string> subnet;
        std::optional<std::string> interface_name;
        bool enable_ping = true;
        bool enable_multicast_names = true;
        // Sends every probed address to the configured resolver; opt-in only.
        bool enable_legacy_resolver = false;
        ProbeTiming timing;
    };
}
