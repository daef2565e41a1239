#pragma once

#include <chrono>
#include <string>
#include "Prober.hpp"
#include "ReplyCollector.hpp"

namespace Tins
{
    class BaseSniffer;
}

namespace arp_presence::scanner
{
    // Maps a libtins/pcap error message onto PermissionDenied or ProbeFailed.
    common::ScanCondition ClassifyProbeError(const std::string &message);

    // Hands every frame already queued on the sniffer to the collector and
    // returns the number of frames read. Never waits: a non-blocking live
    // capture returns 0 when nothing is queued, a capture file returns once
    // it is exhausted. Only ARP replies reach the collector.
    // Throws std::runtime_error on a pcap error.
    int DrainArpReplies(Tins::BaseSniffer &sniffer, ReplyCollector &collector);

    // Broadcasts one ARP who-has per address in the target network and
    // collects replies until the timeout runs out. Needs CAP_NET_RAW.
    class ArpProber : public Prober
    {
    public:
        explicit ArpProber(std::chrono::microseconds send_gap = std::chrono::microseconds(300));

        common::ProbeOutcome Probe(const common::NetworkTarget &target,
                                   std::chrono::milliseconds timeout) override;

    private:
        std::chrono::microseconds m_send_gap;
    };
}
