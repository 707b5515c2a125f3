// bitrate.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "mapping.h"

namespace mapping::tests
{
	TEST(Bitrate, stereo)
	{
		EXPECT_EQ(bitrateForChannels(1), "224");
		EXPECT_EQ(bitrateForChannels(2), "224");
	}

	TEST(Bitrate, quad)
	{
		EXPECT_EQ(bitrateForChannels(3), "448");
		EXPECT_EQ(bitrateForChannels(4), "448");
	}

	TEST(Bitrate, surround)
	{
		EXPECT_EQ(bitrateForChannels(5), "640");
		EXPECT_EQ(bitrateForChannels(6), "640");
	}

	TEST(Bitrate, unknownOrTooMany)
	{
		EXPECT_EQ(bitrateForChannels(0), "640");
		EXPECT_EQ(bitrateForChannels(-1), "640");
		EXPECT_EQ(bitrateForChannels(8), "640");

		EXPECT_EQ(clampChannels(8), 6);
		EXPECT_EQ(clampChannels(2), 2);
	}
}
