// reorder.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "mapping.h"

namespace mapping::tests
{
	using Tokens = std::vector<std::string>;

	// runs the classifier by hand, so we can look at the buckets.
	static Buckets classifyAll(const StreamInventory& inv, const LanguageReorder& classifier)
	{
		Buckets buckets;
		std::map<StreamType, size_t> counters;

		for(const auto& s : inv)
			classifier.classify(s, counters[s.type]++, buckets, nullptr);

		return buckets;
	}

	static StreamInventory mixed()
	{
		StreamInventory inv;
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "en" } });
		addStream(inv, StreamType::Video, "h264");
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "fr" } });
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "en" } });

		return inv;
	}

	TEST(LanguageReorder, buckets)
	{
		ReorderPolicy pol;
		pol.searchString = "en";

		auto buckets = classifyAll(mixed(), LanguageReorder(pol));

		ASSERT_EQ(buckets.matched.size(), 2u);
		EXPECT_EQ(buckets.matched[0].tokens, (Tokens { "-map", "0:a:0", "-disposition:a:0", "default" }));
		EXPECT_EQ(buckets.matched[1].tokens, (Tokens { "-map", "0:a:2" }));

		ASSERT_EQ(buckets.unmatched.size(), 1u);
		EXPECT_EQ(buckets.unmatched[0].tokens, (Tokens { "-map", "0:a:1" }));

		// the video came after the first match.
		EXPECT_TRUE(buckets.pre.empty());
		ASSERT_EQ(buckets.post.size(), 1u);
		EXPECT_EQ(buckets.post[0].tokens, (Tokens { "-map", "0:v:0" }));

		EXPECT_TRUE(streamsToBeReordered(buckets));
	}

	TEST(LanguageReorder, plan)
	{
		ReorderPolicy pol;
		pol.searchString = "en";

		auto plan = buildPlan(mixed(), LanguageReorder(pol));

		EXPECT_TRUE(plan.needsProcessing);
		EXPECT_EQ(plan.streamMapping, (Tokens {
			"-c", "copy", "-disposition:a", "-default",
			"-map", "0:a:0", "-disposition:a:0", "default",
			"-map", "0:a:2",
			"-map", "0:a:1",
			"-map", "0:v:0"
		}));
		EXPECT_TRUE(plan.streamEncoding.empty());
	}

	TEST(LanguageReorder, alreadyOrdered)
	{
		StreamInventory inv;
		addStream(inv, StreamType::Video, "h264");
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "eng" } });
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "jpn" } });

		auto classifier = LanguageReorder(ReorderPolicy());

		// twice, to make sure nothing sticks around between runs.
		EXPECT_FALSE(buildPlan(inv, classifier).needsProcessing);
		EXPECT_FALSE(buildPlan(inv, classifier).needsProcessing);
	}

	TEST(LanguageReorder, noMatchesOrNothingElse)
	{
		StreamInventory inv;
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "jpn" } });
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "fra" } });

		EXPECT_FALSE(buildPlan(inv, LanguageReorder(ReorderPolicy())).needsProcessing);

		// everything matches, so there's nothing to move ahead of.
		ReorderPolicy pol;
		pol.searchString = "jpn";

		StreamInventory same;
		addStream(same, StreamType::Audio, "aac", 2, { { "language", "jpn" } });
		addStream(same, StreamType::Audio, "flac", 2, { { "language", "jpn" } });

		EXPECT_FALSE(buildPlan(same, LanguageReorder(pol)).needsProcessing);
	}

	TEST(LanguageReorder, matching)
	{
		StreamInventory inv;
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "ENG" } });
		addStream(inv, StreamType::Audio, "aac", 2, { { "title", "English Commentary" } });
		addStream(inv, StreamType::Audio, "aac", 2);

		ReorderPolicy pol;
		pol.searchString = " Eng ";

		auto classifier = LanguageReorder(pol);
		EXPECT_EQ(classifier.searchString(), "eng");
		EXPECT_TRUE(classifier.matches(inv[0]));
		EXPECT_TRUE(classifier.matches(inv[1]));
		EXPECT_FALSE(classifier.matches(inv[2]));

		pol.searchString = "";
		EXPECT_FALSE(LanguageReorder(pol).matches(inv[0]));
	}
}
