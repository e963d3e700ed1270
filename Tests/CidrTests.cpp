#include "Core/Net/Cidr.hpp"

#include <gtest/gtest.h>

TEST(Cidr, ParseAndFormat)
{
    NetConfig::CidrV4 c;
    ASSERT_TRUE(NetConfig::parse_cidr4("192.168.10.77/22", c));
    EXPECT_EQ(c.prefix, 22);
    EXPECT_EQ(NetConfig::format_cidr4(c), "192.168.10.77/22");
    EXPECT_EQ(NetConfig::to_network_cidr(c), "192.168.8.0/22");
}

TEST(Cidr, PrefixEdges)
{
    NetConfig::CidrV4 c;
    ASSERT_TRUE(NetConfig::parse_cidr4("10.1.2.3/32", c));
    EXPECT_EQ(NetConfig::to_network_cidr(c), "10.1.2.3/32");
    ASSERT_TRUE(NetConfig::parse_cidr4("10.1.2.3/0", c));
    EXPECT_EQ(NetConfig::to_network_cidr(c), "0.0.0.0/0");
    EXPECT_EQ(NetConfig::to_network(c), NetConfig::default_route_v4());
}

TEST(Cidr, RejectsMalformed)
{
    NetConfig::CidrV4 c;
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0.1", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0.1/", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0.1/33", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0.1/x", c));
    EXPECT_FALSE(NetConfig::parse_cidr4("10.0.0/24", c));

    std::uint32_t be = 0;
    EXPECT_FALSE(NetConfig::parse_ip4("fd00::1", be));
}
