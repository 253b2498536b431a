/**
 * @file test_address.cpp
 * @brief Unit tests for broker address parsing
 */

#include <gtest/gtest.h>
#include <nsqsub/core/address.hpp>

using namespace nsqsub::core;

TEST(AddressTest, ParsesHostAndPort) {
    auto address = Address::parse("127.0.0.1:4150");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->host, "127.0.0.1");
    EXPECT_EQ(address->port, 4150);
}

TEST(AddressTest, ParsesHostname) {
    auto address = Address::parse("nsqd-1.internal:4150");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->host, "nsqd-1.internal");
}

TEST(AddressTest, ParsesBracketedIpv6) {
    auto address = Address::parse("[::1]:4150");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->host, "[::1]");
    EXPECT_EQ(address->port, 4150);
}

TEST(AddressTest, RejectsMalformedInput) {
    EXPECT_FALSE(Address::parse("").has_value());
    EXPECT_FALSE(Address::parse("localhost").has_value());
    EXPECT_FALSE(Address::parse(":4150").has_value());
    EXPECT_FALSE(Address::parse("localhost:").has_value());
    EXPECT_FALSE(Address::parse("localhost:41a0").has_value());
    EXPECT_FALSE(Address::parse("localhost:-1").has_value());
    EXPECT_FALSE(Address::parse("::1:4150").has_value());
}

TEST(AddressTest, RejectsPortOutOfRange) {
    EXPECT_FALSE(Address::parse("localhost:0").has_value());
    EXPECT_FALSE(Address::parse("localhost:65536").has_value());
    EXPECT_FALSE(Address::parse("localhost:123456").has_value());
    EXPECT_TRUE(Address::parse("localhost:65535").has_value());
    EXPECT_TRUE(Address::parse("localhost:1").has_value());
}

TEST(AddressTest, ConnectionIdFormat) {
    EXPECT_EQ(connectionId("10.0.0.5", 4150), "10.0.0.5:4150");
    EXPECT_EQ(Address("broker", 4150).toString(), "broker:4150");
}

TEST(AddressTest, Equality) {
    EXPECT_EQ(Address("a", 1), Address("a", 1));
    EXPECT_NE(Address("a", 1), Address("a", 2));
    EXPECT_NE(Address("a", 1), Address("b", 1));
}
