#pragma once

#include "AddressSpaceResolver.hpp"
#include "Device.hpp"
#include "DiscoveryProbe.hpp"
#include "LivenessProbe.hpp"
#include "NameResolver.hpp"
#include "ScanOptions.hpp"
#include "VendorDirectory.hpp"

namespace net_survey::scanner
{
    class ScanOrchestrator
    {
    public:
        ScanOrchestrator(AddressSpaceResolver &resolver,
                         DiscoveryProbe &discovery,
                         LivenessProbe &liveness,
                         NameResolver &names,
                         const VendorDirectory &vendors);

        // One complete scan. Address-space and discovery failures propagate
        // as common::ScanError and leave no partial result.
        ScanResult Run(const ScanOptions &options);

    private:
        AddressSpaceResolver &m_resolver;
        DiscoveryProbe &m_discovery;
        LivenessProbe &m_liveness;
        NameResolver &m_names;
        const VendorDirectory &m_vendors;
    };
}
