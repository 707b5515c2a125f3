// builder.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "mapping.h"

namespace mapping::tests
{
	using Tokens = std::vector<std::string>;

	TEST(Inventory, perTypeIndices)
	{
		StreamInventory inv;
		addStream(inv, StreamType::Video, "h264");
		addStream(inv, StreamType::Audio, "DTS", 6, { { "LANGUAGE", "eng" } });
		addStream(inv, StreamType::Subtitle, "ass");
		addStream(inv, StreamType::Audio, "aac", 2);

		ASSERT_EQ(inv.size(), 4u);
		EXPECT_EQ(inv[0].index, 0u);
		EXPECT_EQ(inv[1].index, 0u);
		EXPECT_EQ(inv[2].index, 0u);
		EXPECT_EQ(inv[3].index, 1u);
		EXPECT_EQ(inv[3].globalIndex, 3u);

		// codecs and tag keys are normalised.
		EXPECT_EQ(inv[1].codecName, "dts");
		EXPECT_EQ(inv[1].tag("language"), "eng");
		EXPECT_EQ(inv[1].tag("title"), "");
	}

	TEST(Inventory, selectors)
	{
		EXPECT_EQ(selector(StreamType::Audio, 1), "0:a:1");
		EXPECT_EQ(selector(StreamType::Video, 0), "0:v:0");
		EXPECT_EQ(selector(StreamType::Attachment, 2), "0:t:2");
		EXPECT_EQ(typeFromName("Subtitle"), StreamType::Subtitle);
		EXPECT_EQ(typeFromName("weird"), StreamType::Unknown);
	}

	TEST(Builder, copiesUntouchedStreams)
	{
		StreamInventory inv;
		addStream(inv, StreamType::Video, "h264");
		addStream(inv, StreamType::Audio, "dts", 6);
		addStream(inv, StreamType::Audio, "ac3", 2);
		addStream(inv, StreamType::Attachment, "ttf");

		auto plan = buildPlan(inv, CodecConversion(CodecPolicy()));

		EXPECT_TRUE(plan.needsProcessing);
		EXPECT_EQ(plan.streamMapping, (Tokens { "-map", "0:v:0", "-map", "0:a:0", "-map", "0:a:1", "-map", "0:t:0" }));
		EXPECT_EQ(plan.streamEncoding, (Tokens {
			"-c:v:0", "copy",
			"-c:a:0", "ac3", "-ac:a:0", "6", "-b:a:0", "640k",
			"-c:a:1", "copy",
			"-c:t:0", "copy"
		}));
	}

	TEST(Builder, skipsUnknownStreams)
	{
		StreamInventory inv;
		addStream(inv, StreamType::Unknown, "bin_data");
		addStream(inv, StreamType::Audio, "ac3", 2);

		auto plan = buildPlan(inv, CodecConversion(CodecPolicy()));

		EXPECT_FALSE(plan.needsProcessing);
		EXPECT_EQ(plan.streamMapping, (Tokens { "-map", "0:a:0" }));
	}

	TEST(Builder, nothingToDo)
	{
		auto plan = buildPlan(StreamInventory(), CodecConversion(CodecPolicy()));

		EXPECT_FALSE(plan.needsProcessing);
		EXPECT_TRUE(plan.streamMapping.empty());
		EXPECT_TRUE(plan.streamEncoding.empty());
	}

	TEST(Builder, runsAreIndependent)
	{
		StreamInventory inv;
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "fre" } });
		addStream(inv, StreamType::Audio, "ac3", 2, { { "language", "eng" } });

		ReorderPolicy pol;
		pol.searchString = "eng";

		auto classifier = LanguageReorder(pol);
		auto a = buildPlan(inv, classifier);
		auto b = buildPlan(inv, classifier);

		EXPECT_EQ(a.streamMapping, b.streamMapping);
		EXPECT_EQ(a.needsProcessing, b.needsProcessing);
	}
}
