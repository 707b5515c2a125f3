// probe.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "probe.h"

namespace probe::tests
{
	TEST(ProbeDocument, streams)
	{
		auto res = parseProbeDocument(R"({
			"streams": [
				{ "index": 0, "codec_name": "h264", "codec_type": "video" },
				{ "index": 1, "codec_name": "DTS", "codec_type": "audio", "channels": 6,
					"tags": { "LANGUAGE": "eng", "title": "Surround 5.1" } },
				{ "index": 2, "codec_name": "aac", "codec_type": "audio", "channels": "2" },
				{ "index": 3, "codec_name": "ass", "codec_type": "subtitle", "tags": { "language": "jpn" } },
				{ "index": 4, "codec_type": "data" }
			]
		})");

		ASSERT_TRUE(res.valid);
		ASSERT_EQ(res.streams.size(), 5u);

		EXPECT_EQ(res.streams[1].type, mapping::StreamType::Audio);
		EXPECT_EQ(res.streams[1].codecName, "dts");
		EXPECT_EQ(res.streams[1].channels, 6);
		EXPECT_EQ(res.streams[1].tag("language"), "eng");
		EXPECT_EQ(res.streams[1].tag("title"), "Surround 5.1");

		EXPECT_EQ(res.streams[2].index, 1u);
		EXPECT_EQ(res.streams[2].channels, 2);

		EXPECT_EQ(res.streams[3].type, mapping::StreamType::Subtitle);
		EXPECT_EQ(res.streams[3].index, 0u);

		EXPECT_EQ(res.streams[4].type, mapping::StreamType::Data);
		EXPECT_EQ(res.streams[4].codecName, "");
	}

	TEST(ProbeDocument, missingFields)
	{
		auto res = parseProbeDocument(R"({ "streams": [ { "codec_type": "audio", "channels": "lots" }, 42 ] })");

		ASSERT_TRUE(res.valid);
		ASSERT_EQ(res.streams.size(), 1u);
		EXPECT_EQ(res.streams[0].channels, 0);
		EXPECT_TRUE(res.streams[0].tags.empty());
	}

	TEST(ProbeDocument, unknownType)
	{
		auto res = parseProbeDocument(R"({ "streams": [ { "codec_type": "hologram" } ] })");

		ASSERT_TRUE(res.valid);
		ASSERT_EQ(res.streams.size(), 1u);
		EXPECT_EQ(res.streams[0].type, mapping::StreamType::Unknown);
	}

	TEST(ProbeDocument, malformed)
	{
		auto res = parseProbeDocument("{ \"streams\": [");
		EXPECT_FALSE(res.valid);
		EXPECT_FALSE(res.error.empty());

		res = parseProbeDocument(R"({ "format": {} })");
		EXPECT_FALSE(res.valid);
		EXPECT_EQ(res.error, "probe document has no 'streams' list");
	}

	TEST(ProbeFile, nonexistent)
	{
		auto res = probeFile("/nonexistent/streamplan/file.mkv");
		EXPECT_FALSE(res.valid);
		EXPECT_FALSE(res.error.empty());
	}
}
