#include "ArpProber.hpp"
#include "../common/Ipv4Network.hpp"
#include <tins/tins.h>
#include <pcap.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <stdexcept>
#include <thread>

namespace arp_presence::scanner
{
    namespace
    {
        struct DrainContext
        {
            pcap_t *handle;
            ReplyCollector *collector;
            int frames;
            std::string error;
        };

        void HandleFrame(u_char *user, const struct pcap_pkthdr *header, const u_char *bytes)
        {
            auto *context = reinterpret_cast<DrainContext *>(user);
            ++context->frames;

            try
            {
                Tins::EthernetII eth(bytes, header->caplen);
                const Tins::ARP *arp = eth.find_pdu<Tins::ARP>();
                if (arp && arp->opcode() == Tins::ARP::REPLY)
                {
                    context->collector->Add(arp->sender_ip_addr().to_string(), arp->sender_hw_addr().to_string());
                }
            }
            catch (const Tins::malformed_packet &)
            {
                // Truncated or non-ARP frame that slipped past the filter.
            }
            catch (const std::exception &e)
            {
                // Must not unwind through libpcap; rethrown after dispatch.
                context->error = e.what();
                pcap_breakloop(context->handle);
            }
        }

        common::ProbeOutcome Failed(common::ScanCondition condition, const std::string &detail)
        {
            common::ProbeOutcome outcome;
            outcome.condition = condition;
            outcome.detail = detail;
            return outcome;
        }
    }

    common::ScanCondition ClassifyProbeError(const std::string &message)
    {
        std::string lowered = message;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lowered.find("permission") != std::string::npos ||
            lowered.find("not permitted") != std::string::npos)
        {
            return common::ScanCondition::PermissionDenied;
        }
        return common::ScanCondition::ProbeFailed;
    }

    int DrainArpReplies(Tins::BaseSniffer &sniffer, ReplyCollector &collector)
    {
        pcap_t *handle = sniffer.get_pcap_handle();
        if (pcap_datalink(handle) != DLT_EN10MB)
            throw std::runtime_error("capture is not Ethernet");

        DrainContext context{handle, &collector, 0, ""};
        int ret = pcap_dispatch(handle, -1, &HandleFrame, reinterpret_cast<u_char *>(&context));
        if (!context.error.empty())
            throw std::runtime_error("reply handling: " + context.error);
        if (ret == -1)
            throw std::runtime_error(std::string("pcap_dispatch: ") + pcap_geterr(handle));
        return context.frames;
    }

    ArpProber::ArpProber(std::chrono::microseconds send_gap) : m_send_gap(send_gap)
    {
    }

    common::ProbeOutcome ArpProber::Probe(const common::NetworkTarget &target, std::chrono::milliseconds timeout)
    {
        auto network = common::Ipv4Network::Parse(target.cidr);
        if (!network.has_value())
        {
            return Failed(common::ScanCondition::TargetUnresolved, "invalid network '" + target.cidr + "'");
        }

        try
        {
            Tins::NetworkInterface iface(target.interface);
            Tins::NetworkInterface::Info info = iface.info();

            if (!info.is_up)
            {
                return Failed(common::ScanCondition::TargetUnresolved, "interface " + target.interface + " is down");
            }
            if (static_cast<std::uint32_t>(info.ip_addr) == 0)
            {
                return Failed(common::ScanCondition::TargetUnresolved,
                              "interface " + target.interface + " has no IPv4 address");
            }

            Tins::SnifferConfiguration config;
            config.set_promisc_mode(false);
            config.set_immediate_mode(true);
            config.set_filter("arp");
            config.set_timeout(100);

            Tins::Sniffer sniffer(iface.name(), config);

            char errbuf[PCAP_ERRBUF_SIZE];
            if (pcap_setnonblock(sniffer.get_pcap_handle(), 1, errbuf) == -1)
            {
                throw std::runtime_error(std::string("pcap_setnonblock: ") + errbuf);
            }

            Tins::PacketSender sender;
            ReplyCollector collector(*network);

            std::cout << "[ArpProber] Probing " << network->Size() << " addresses on "
                      << target.interface << " (" << target.cidr << ")\n";

            for (std::uint32_t address : network->Addresses())
            {
                Tins::ARP request(Tins::IPv4Address(common::FormatIpv4(address)), info.ip_addr,
                                  Tins::ARP::hwaddress_type(), info.hw_addr);
                request.opcode(Tins::ARP::REQUEST);

                Tins::EthernetII eth = Tins::EthernetII(Tins::EthernetII::BROADCAST, info.hw_addr) / request;
                sender.send(eth, iface);

                DrainArpReplies(sniffer, collector);

                if (m_send_gap.count() > 0)
                    std::this_thread::sleep_for(m_send_gap);
            }

            const int fd = sniffer.get_fd();
            const auto deadline = std::chrono::steady_clock::now() + timeout;

            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                    break;

                struct pollfd pfd;
                pfd.fd = fd;
                pfd.events = POLLIN;
                pfd.revents = 0;

                int ret = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 100)));
                if (ret < 0)
                {
                    if (errno == EINTR)
                        continue;
                    throw std::runtime_error(std::string("poll: ") + std::strerror(errno));
                }
                if (ret > 0)
                    DrainArpReplies(sniffer, collector);
            }

            common::ProbeOutcome outcome;
            outcome.results = collector.Results();

            std::cout << "[ArpProber] " << outcome.results.size() << " hosts answered on " << target.interface;
            if (collector.Duplicates() > 0)
                std::cout << " (" << collector.Duplicates() << " duplicate replies dropped)";
            std::cout << "\n";

            return outcome;
        }
        catch (const Tins::invalid_interface &)
        {
            std::cerr << "[ArpProber] Interface " << target.interface << " does not exist\n";
            return Failed(common::ScanCondition::TargetUnresolved, "interface " + target.interface + " does not exist");
        }
        catch (const std::exception &e)
        {
            common::ScanCondition condition = ClassifyProbeError(e.what());
            if (condition == common::ScanCondition::PermissionDenied)
            {
                std::cerr << "[ArpProber] Permission denied on " << target.interface
                          << ". Grant CAP_NET_RAW or run as root: " << e.what() << "\n";
                return Failed(condition, "permission denied for raw ARP probing on " + target.interface +
                                             " (grant CAP_NET_RAW or run as root): " + e.what());
            }

            std::cerr << "[ArpProber] Probe failed on " << target.interface << ": " << e.what() << "\n";
            return Failed(condition, "ARP probe failed on " + target.interface + ": " + e.what());
        }
    }
}
