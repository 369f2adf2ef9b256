#pragma once

#include <optional>
#include <string>
#include "HostnameSource.hpp"

namespace net_survey::scanner
{
    class NameResolver
    {
    public:
        NameResolver(HostnameSource &multicast, HostnameSource &legacy);

        // Multicast first, the legacy resolver only when multicast found nothing.
        std::optional<std::string> Resolve(const std::string &ip, bool use_multicast, bool use_legacy);

    private:
        HostnameSource &m_multicast;
        HostnameSource &m_legacy;
    };
}
