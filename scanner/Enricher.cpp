#include "Enricher.hpp"
#include <iostream>

namespace arp_presence::scanner
{
    Enricher::Enricher(std::shared_ptr<VendorLookup> vendors,
                       std::shared_ptr<HostnameResolver> hostnames,
                       bool resolve_hostnames)
        : m_vendors(std::move(vendors)), m_hostnames(std::move(hostnames)), m_resolve_hostnames(resolve_hostnames)
    {
        if (!m_vendors)
            m_vendors = std::make_shared<NullVendorLookup>();
        if (!m_hostnames)
            m_hostnames = std::make_shared<NullHostnameResolver>();
    }

    common::Device Enricher::Enrich(const common::ProbeResult &result) const
    {
        common::Device device;
        device.ip = result.ip;
        device.mac = result.mac;

        try
        {
            auto vendor = m_vendors->Lookup(result.mac);
            if (vendor.has_value() && !vendor->empty())
                device.vendor = *vendor;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Enricher] Vendor lookup failed for " << result.mac << ": " << e.what() << "\n";
        }

        if (m_resolve_hostnames)
        {
            try
            {
                auto hostname = m_hostnames->Resolve(result.ip);
                if (hostname.has_value() && !hostname->empty())
                    device.hostname = *hostname;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Enricher] Hostname lookup failed for " << result.ip << ": " << e.what() << "\n";
            }
        }

        return device;
    }

    std::vector<common::Device> Enricher::Enrich(const std::vector<common::ProbeResult> &results) const
    {
        std::vector<common::Device> devices;
        devices.reserve(results.size());

        for (const auto &result : results)
        {
            devices.push_back(Enrich(result));
        }
        return devices;
    }
}
