#include "DiscoveryProbe.hpp"
#include "../common/HardwareAddress.hpp"

namespace net_survey::scanner
{
    bool ArpReplyTable::Record(const std::string &ip, const std::string &mac)
    {
        if (!m_network.Contains(ip))
            return false;

        auto canonical = common::NormalizeHardwareAddress(mac);
        if (!canonical)
            return false;

        m_entries[ip] = *canonical;
        return true;
    }
}
