#include <gtest/gtest.h>
#include "Utils/NetworkAddress.hpp"

TEST(NetworkAddressTest, AcceptsDottedQuads) {
    EXPECT_TRUE(NetworkAddress::isIpv4("192.168.100.1"));
    EXPECT_TRUE(NetworkAddress::isIpv4("10.0.0.254"));
}

TEST(NetworkAddressTest, RejectsEverythingElse) {
    EXPECT_FALSE(NetworkAddress::isIpv4(""));
    EXPECT_FALSE(NetworkAddress::isIpv4("fe80::5054:ff:fe12:3456"));
    EXPECT_FALSE(NetworkAddress::isIpv4("192.168.100"));
    EXPECT_FALSE(NetworkAddress::isIpv4("192.168.100.256"));
    EXPECT_FALSE(NetworkAddress::isIpv4("lb.ocp4.local"));
}

TEST(NetworkAddressTest, ParsesOctets) {
    EXPECT_EQ(NetworkAddress::parseOctet("100").value_or(999u), 100u);
    EXPECT_EQ(NetworkAddress::parseOctet("0").value_or(999u), 0u);
    EXPECT_EQ(NetworkAddress::parseOctet("255").value_or(999u), 255u);
    EXPECT_FALSE(NetworkAddress::parseOctet("256"));
    EXPECT_FALSE(NetworkAddress::parseOctet("-1"));
    EXPECT_FALSE(NetworkAddress::parseOctet("1a"));
    EXPECT_FALSE(NetworkAddress::parseOctet(""));
    EXPECT_FALSE(NetworkAddress::parseOctet("0100"));
}

TEST(NetworkAddressTest, BuildsPrivateHostAddresses) {
    EXPECT_EQ(NetworkAddress::privateHost(100, 1), "192.168.100.1");
    EXPECT_EQ(NetworkAddress::privateHost(7, 254), "192.168.7.254");
}
