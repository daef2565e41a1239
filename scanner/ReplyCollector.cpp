#include "ReplyCollector.hpp"
#include "../common/MacAddress.hpp"

namespace arp_presence::scanner
{
    ReplyCollector::ReplyCollector(const common::Ipv4Network &network)
        : m_network(network)
    {
    }

    bool ReplyCollector::Add(const std::string &ip, const std::string &mac)
    {
        auto address = common::ParseIpv4(ip);
        if (!address.has_value() || !m_network.Contains(*address))
            return false;

        auto canonical = common::CanonicalMac(mac);
        if (!canonical.has_value())
            return false;

        if (!m_seen_macs.insert(*canonical).second)
        {
            ++m_duplicates;
            return false;
        }

        m_results.push_back({common::FormatIpv4(*address), *canonical});
        return true;
    }
}
