#pragma once

#include "HostnameSource.hpp"

namespace net_survey::scanner
{
    // Whatever the host's resolver configuration says (hosts file, unicast DNS).
    class SystemResolverSource : public HostnameSource
    {
    public:
        std::optional<std::string> Lookup(const std::string &ip) override;
    };
}
