#include "gtest/gtest.h"
#include "chunkflow/core/SocketAddress.hpp"

using namespace chunkflow::core;

TEST(SocketAddressTest, ParsesIpAndPort) {
	auto addr = SocketAddress::from_string("127.0.0.1:8002");

	ASSERT_TRUE(addr.has_value());
	EXPECT_EQ(addr->get_port(), 8002);
	EXPECT_EQ(addr->to_string(), "127.0.0.1:8002");
}

TEST(SocketAddressTest, RejectsMalformed) {
	EXPECT_FALSE(SocketAddress::from_string("127.0.0.1").has_value());
	EXPECT_FALSE(SocketAddress::from_string("not-an-ip:80").has_value());
}

TEST(SocketAddressTest, ComparesByValue) {
	auto a = SocketAddress::loopback_ipv4(9000);
	auto b = SocketAddress::from_string("127.0.0.1:9000");

	ASSERT_TRUE(b.has_value());
	EXPECT_EQ(a, *b);
	EXPECT_NE(a, SocketAddress::loopback_ipv4(9001));
}
