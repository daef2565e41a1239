#pragma once

#include <set>
#include <string>
#include <vector>
#include "../common/Ipv4Network.hpp"
#include "../common/ScanTypes.hpp"

namespace arp_presence::scanner
{
    // Accumulates ARP replies for one probe cycle. A hardware address is kept
    // with the first address it answered for.
    class ReplyCollector
    {
    public:
        explicit ReplyCollector(const common::Ipv4Network &network);

        // Returns false when the reply is ignored (outside the network,
        // malformed, or a repeat of a hardware address already seen).
        bool Add(const std::string &ip, const std::string &mac);

        const std::vector<common::ProbeResult> &Results() const { return m_results; }
        size_t Duplicates() const { return m_duplicates; }

    private:
        common::Ipv4Network m_network;
        std::vector<common::ProbeResult> m_results;
        std::set<std::string> m_seen_macs;
        size_t m_duplicates = 0;
    };
}
