#pragma once

#include <memory>
#include <vector>
#include "HostnameResolver.hpp"
#include "VendorLookup.hpp"
#include "../common/ScanTypes.hpp"

namespace arp_presence::scanner
{
    // Adds vendor and hostname to probe results. Lookup misses fall back to
    // "Unknown" and no hostname.
    class Enricher
    {
    public:
        Enricher(std::shared_ptr<VendorLookup> vendors,
                 std::shared_ptr<HostnameResolver> hostnames,
                 bool resolve_hostnames);

        common::Device Enrich(const common::ProbeResult &result) const;
        std::vector<common::Device> Enrich(const std::vector<common::ProbeResult> &results) const;

    private:
        std::shared_ptr<VendorLookup> m_vendors;
        std::shared_ptr<HostnameResolver> m_hostnames;
        bool m_resolve_hostnames;
    };
}
