#include "gtest/gtest.h"
#include "chunkflow/core/Endian.hpp"

#include <arpa/inet.h>

using namespace chunkflow::core;

TEST(EndianTest, SetsCorrectEndianness) {
	if(htons(1) == 1) {
		// BE
		EXPECT_EQ(CHUNKFLOW_CORE_ENDIANNESS, CHUNKFLOW_CORE_BIG_ENDIAN);
	} else {
		// LE
		EXPECT_EQ(CHUNKFLOW_CORE_ENDIANNESS, CHUNKFLOW_CORE_LITTLE_ENDIAN);
	}
}

TEST(EndianTest, ToBeMatchesNetworkOrder) {
	EXPECT_EQ(to_be<uint16_t>(0x0102), htons(0x0102));
	EXPECT_EQ(to_be<uint32_t>(0x01020304), htonl(0x01020304));
	EXPECT_EQ(to_be<uint8_t>(0x01), 0x01);
}
