#include "NameResolver.hpp"

namespace net_survey::scanner
{
    NameResolver::NameResolver(HostnameSource &multicast, HostnameSource &legacy)
        : m_multicast(multicast), m_legacy(legacy)
    {
    }

    std::optional<std::string> NameResolver::Resolve(const std::string &ip, bool use_multicast, bool use_legacy)
    {
        if (use_multicast)
        {
            auto name = m_multicast.Lookup(ip);
            if (name && !name->empty())
                return name;
        }

        if (use_legacy)
        {
            auto name = m_legacy.Lookup(ip);
            if (name && !name->empty())
                return name;
        }

        return std::nullopt;
    }
}
