#include <gtest/gtest.h>
#include "../common/MacAddress.hpp"
#include "../common/ScanTypes.hpp"

using namespace arp_presence::common;

TEST(MacAddressTest, CanonicalFormIsLowercaseColons)
{
    EXPECT_EQ(CanonicalMac("AA:BB:CC:DD:EE:FF"), "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(CanonicalMac("aa-bb-cc-dd-ee-01"), "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(CanonicalMac("AABBCCDDEE02"), "aa:bb:cc:dd:ee:02");
}

TEST(MacAddressTest, RejectsMalformed)
{
    EXPECT_FALSE(CanonicalMac("").has_value());
    EXPECT_FALSE(CanonicalMac("aa:bb:cc:dd:ee").has_value());
    EXPECT_FALSE(CanonicalMac("aa:bb:cc:dd:ee:fg").has_value());
    EXPECT_FALSE(CanonicalMac("aa:bb-cc:dd:ee:ff").has_value());
    EXPECT_FALSE(CanonicalMac("aab:bcc:dde:eff").has_value());
}

TEST(MacAddressTest, OuiPrefix)
{
    EXPECT_EQ(OuiPrefix("b8:27:eb:12:34:56"), "B827EB");
    EXPECT_FALSE(OuiPrefix("b8:27").has_value());
}

TEST(MacAddressTest, DisplayNameFallsBackToMac)
{
    Device device;
    device.ip = "192.168.1.10";
    device.mac = "aa:bb:cc:dd:ee:01";
    EXPECT_EQ(DisplayName(device), "aabbccddee01");

    device.hostname = "printer";
    EXPECT_EQ(DisplayName(device), "printer");
}
