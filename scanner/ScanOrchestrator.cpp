#include "ScanOrchestrator.hpp"
#include "../common/Ipv4.hpp"
#include "../common/TimeFormat.hpp"

#include <algorithm>
#include <iostream>

namespace net_survey::scanner
{
    ScanOrchestrator::ScanOrchestrator(AddressSpaceResolver &resolver,
                                       DiscoveryProbe &discovery,
                                       LivenessProbe &liveness,
                                       NameResolver &names,
                                       const VendorDirectory &vendors)
        : m_resolver(resolver), m_discovery(discovery), m_liveness(liveness), m_names(names), m_vendors(vendors)
    {
    }

    ScanResult ScanOrchestrator::Run(const ScanOptions &options)
    {
        const std::string startedAt = common::UtcNow();

        AddressSpace space = m_resolver.Resolve(options.subnet);
        std::cout << "[Scan] Target " << space.network.ToString();
        if (space.gateway)
            std::cout << " via gateway " << *space.gateway;
        std::cout << "\n";

        std::optional<std::string> iface = options.interface_name ? options.interface_name : space.interface_name;

        DiscoveryMap discovered = m_discovery.Sweep(space.network, iface);

        std::vector<std::string> ips;
        ips.reserve(discovered.size());
        for (const auto &entry : discovered)
            ips.push_back(entry.first);
        std::sort(ips.begin(), ips.end(), common::AddressLess);

        RttMap rtts;
        if (options.enable_ping && !ips.empty())
            rtts = m_liveness.Probe(ips, iface);

        ScanResult result;
        result.subnet = space.network.ToString();
        result.gateway_ip = space.gateway;
        result.started_at = startedAt;
        result.devices.reserve(ips.size());

        for (const auto &ip : ips)
        {
            Device dev;
            dev.ip = ip;
            dev.mac = discovered[ip];
            dev.vendor = m_vendors.Lookup(*dev.mac);
            dev.hostname = m_names.Resolve(ip, options.enable_multicast_names, options.enable_legacy_resolver);
            dev.is_gateway = space.gateway.has_value() && *space.gateway == ip;

            if (options.enable_ping)
            {
                auto it = rtts.find(ip);
                dev.alive = it != rtts.end();
                if (it != rtts.end())
                    dev.rtt_ms = it->second;
            }

            dev.first_seen = startedAt;
            dev.last_seen = startedAt;
            result.devices.push_back(std::move(dev));
        }

        result.finished_at = common::UtcNow();
        return result;
    }
}
