#pragma once

#include <map>
#include <optional>
#include <string>
#include "../common/Ipv4.hpp"

namespace net_survey::scanner
{
    // Responding IPv4 address -> canonical hardware address.
    using DiscoveryMap = std::map<std::string, std::string>;

    class DiscoveryProbe
    {
    public:
        virtual ~DiscoveryProbe() = default;

        // Silent hosts are absent from the result. Throws
        // common::PermissionError when raw frames cannot be sent or received.
        virtual DiscoveryMap Sweep(const common::Ipv4Network &network,
                                   const std::optional<std::string> &interface_name) = 0;
    };

    // Reply bookkeeping for one sweep: only addresses inside the swept range
    // are kept and a later reply for the same address replaces an earlier one.
    class ArpReplyTable
    {
    public:
        explicit ArpReplyTable(const common::Ipv4Network &network) : m_network(network) {}

        // Returns false when the reply was ignored.
        bool Record(const std::string &ip, const std::string &mac);

        const DiscoveryMap &Entries() const { return m_entries; }
        DiscoveryMap Take() { return std::move(m_entries); }

    private:
        common::Ipv4Network m_network;
        DiscoveryMap m_entries;
    };
}
