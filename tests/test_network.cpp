#include "Core/Net/Network.hpp"

#include <gtest/gtest.h>

TEST(Network, ParseCidr4)
{
    NetConfig::CidrV4 c{};
    ASSERT_TRUE(NetConfig::parse_cidr4("10.99.3.7/24", c));
    EXPECT_EQ(c.prefix, 24);
    EXPECT_EQ(NetConfig::to_network_cidr(c), "10.99.3.0/24");
    EXPECT_EQ(NetConfig::first_host(c), "10.99.3.1");

    ASSERT_TRUE(NetConfig::parse_cidr4("192.168.1.1", c));
    EXPECT_EQ(c.prefix, 32);
}

TEST(Network, ParseCidr4Rejects)
{
    NetConfig::CidrV4 c{};
    EXPECT_FALSE(NetConfig::parse_cidr4("", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0.0/", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0.0/33", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0.0/+8", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0/8", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("fd00::/64", c));
}

TEST(Network, Contains)
{
    NetConfig::CidrV4 c{};
    ASSERT_TRUE(NetConfig::parse_cidr4("10.99.1.0/24", c));
    EXPECT_TRUE(NetConfig::cidr4_contains(c, "10.99.1.42"));
    EXPECT_FALSE(NetConfig::cidr4_contains(c, "10.99.2.42"));
    EXPECT_FALSE(NetConfig::cidr4_contains(c, "fd00::1"));
    EXPECT_FALSE(NetConfig::cidr4_contains(c, "pod"));
}

TEST(Network, IpLiteral)
{
    EXPECT_TRUE(NetConfig::is_ip_literal("100.64.0.1"));
    EXPECT_TRUE(NetConfig::is_ip_literal("fd7a:115c:a1e0::1"));
    EXPECT_FALSE(NetConfig::is_ip_literal("100.64.0.1:80"));
    EXPECT_FALSE(NetConfig::is_ip_literal("node-1"));
    EXPECT_FALSE(NetConfig::is_ip_literal(""));
}

TEST(Network, Netmask)
{
    EXPECT_EQ(NetConfig::netmask_be(0), 0u);
    EXPECT_EQ(NetConfig::netmask_be(32), 0xFFFFFFFFu);
}
