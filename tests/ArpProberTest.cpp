#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <tins/tins.h>
#include <unistd.h>
#include <vector>
#include "../scanner/ArpProber.hpp"

using namespace arp_presence;
using namespace std::chrono_literals;

namespace
{
    const char *OWN_IP = "192.168.1.2";
    const std::string OWN_MAC = "02:00:00:00:00:01";

    Tins::EthernetII WhoHas(const std::string &ip)
    {
        return Tins::ARP::make_arp_request(ip, OWN_IP, OWN_MAC);
    }

    Tins::EthernetII IsAt(const std::string &ip, const std::string &mac)
    {
        return Tins::ARP::make_arp_reply(OWN_IP, ip, OWN_MAC, mac);
    }

    // Writes frames to a pcap file and reads them back through FileSniffer.
    class CaptureTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            char pattern[] = "/tmp/arp_presence_capture_XXXXXX";
            int fd = mkstemp(pattern);
            ASSERT_GE(fd, 0);
            close(fd);
            m_path = pattern;
        }

        void TearDown() override
        {
            std::remove(m_path.c_str());
        }

        void WriteCapture(std::vector<Tins::EthernetII> frames)
        {
            Tins::PacketWriter writer(m_path, Tins::DataLinkType<Tins::EthernetII>());
            for (auto &frame : frames)
                writer.write(frame);
        }

        std::string m_path;
        scanner::ReplyCollector m_collector{*common::Ipv4Network::Parse("192.168.1.0/24")};
    };
}

TEST(ArpProberTest, ClassifiesPermissionErrors)
{
    EXPECT_EQ(scanner::ClassifyProbeError("socket: Operation not permitted"),
              common::ScanCondition::PermissionDenied);
    EXPECT_EQ(scanner::ClassifyProbeError("eth0: You don't have PERMISSION to capture on that device"),
              common::ScanCondition::PermissionDenied);
}

TEST(ArpProberTest, OtherErrorsAreProbeFailures)
{
    EXPECT_EQ(scanner::ClassifyProbeError("send: Network is down"), common::ScanCondition::ProbeFailed);
    EXPECT_EQ(scanner::ClassifyProbeError(""), common::ScanCondition::ProbeFailed);
}

TEST(ArpProberTest, InvalidNetworkIsUnresolved)
{
    scanner::ArpProber prober;
    auto outcome = prober.Probe({"eth0", "192.168.1.0/99"}, 500ms);

    EXPECT_EQ(outcome.condition, common::ScanCondition::TargetUnresolved);
    EXPECT_TRUE(outcome.results.empty());
}

TEST(ArpProberTest, MissingInterfaceIsUnresolved)
{
    scanner::ArpProber prober;
    auto outcome = prober.Probe({"nosuchif0", "192.168.1.0/24"}, 500ms);

    EXPECT_EQ(outcome.condition, common::ScanCondition::TargetUnresolved);
    EXPECT_NE(outcome.detail.find("nosuchif0"), std::string::npos);
    EXPECT_TRUE(outcome.results.empty());
}

TEST_F(CaptureTest, CollectsRepliesAndIgnoresOtherFrames)
{
    Tins::EthernetII dns = Tins::EthernetII(OWN_MAC, "aa:bb:cc:dd:ee:09") /
                           Tins::IP(OWN_IP, "192.168.1.9") / Tins::UDP(40000, 53);
    WriteCapture({WhoHas("192.168.1.10"),
                  IsAt("192.168.1.10", "AA:BB:CC:DD:EE:01"),
                  WhoHas("192.168.1.20"),
                  dns,
                  IsAt("192.168.1.20", "aa:bb:cc:dd:ee:02")});

    Tins::FileSniffer sniffer(m_path);
    EXPECT_EQ(scanner::DrainArpReplies(sniffer, m_collector), 5);

    const auto &results = m_collector.Results();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].ip, "192.168.1.10");
    EXPECT_EQ(results[0].mac, "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(results[1].ip, "192.168.1.20");
    EXPECT_EQ(results[1].mac, "aa:bb:cc:dd:ee:02");
}

TEST_F(CaptureTest, HostAnsweringForSeveralAddressesKeepsFirst)
{
    WriteCapture({IsAt("192.168.1.10", "aa:bb:cc:dd:ee:01"),
                  IsAt("192.168.1.11", "aa:bb:cc:dd:ee:01"),
                  IsAt("192.168.1.10", "aa:bb:cc:dd:ee:01")});

    Tins::FileSniffer sniffer(m_path);
    scanner::DrainArpReplies(sniffer, m_collector);

    ASSERT_EQ(m_collector.Results().size(), 1u);
    EXPECT_EQ(m_collector.Results()[0].ip, "192.168.1.10");
    EXPECT_EQ(m_collector.Duplicates(), 2u);
}

TEST_F(CaptureTest, RepliesFromOutsideNetworkAreIgnored)
{
    WriteCapture({IsAt("10.0.0.5", "aa:bb:cc:dd:ee:05")});

    Tins::FileSniffer sniffer(m_path);
    EXPECT_EQ(scanner::DrainArpReplies(sniffer, m_collector), 1);
    EXPECT_TRUE(m_collector.Results().empty());
}

TEST_F(CaptureTest, ReturnsOnceCaptureIsExhausted)
{
    WriteCapture({IsAt("192.168.1.10", "aa:bb:cc:dd:ee:01")});

    Tins::FileSniffer sniffer(m_path);
    EXPECT_EQ(scanner::DrainArpReplies(sniffer, m_collector), 1);
    EXPECT_EQ(scanner::DrainArpReplies(sniffer, m_collector), 0);
    EXPECT_EQ(m_collector.Results().size(), 1u);
}

TEST_F(CaptureTest, EmptyCaptureYieldsNothing)
{
    WriteCapture({});

    Tins::FileSniffer sniffer(m_path);
    EXPECT_EQ(scanner::DrainArpReplies(sniffer, m_collector), 0);
    EXPECT_TRUE(m_collector.Results().empty());
}
