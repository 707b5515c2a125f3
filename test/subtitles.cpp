// subtitles.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "mapping.h"

namespace mapping::tests
{
	using Tokens = std::vector<std::string>;

	static StreamInventory sample()
	{
		StreamInventory inv;
		addStream(inv, StreamType::Video, "h264");
		addStream(inv, StreamType::Audio, "aac", 2, { { "language", "jpn" } });
		addStream(inv, StreamType::Subtitle, "ass", 0, { { "language", "eng" }, { "title", "Signs & Songs" } });
		addStream(inv, StreamType::Subtitle, "subrip", 0, { { "language", "eng" } });
		addStream(inv, StreamType::Subtitle, "ssa", 0, { { "language", "FRE" } });
		addStream(inv, StreamType::Subtitle, "ass");

		return inv;
	}

	TEST(SubtitleExtraction, languageList)
	{
		EXPECT_EQ(parseLanguageList("eng, fre ,,JPN"), (Tokens { "eng", "fre", "jpn" }));
		EXPECT_EQ(parseLanguageList(" pt br "), (Tokens { "pt-br" }));
		EXPECT_TRUE(parseLanguageList("").empty());
		EXPECT_TRUE(parseLanguageList(" , ").empty());
	}

	TEST(SubtitleExtraction, tags)
	{
		auto inv = sample();

		EXPECT_EQ(extractionTag(inv[2], 0, true), ".eng.Signs-&-Songs");
		EXPECT_EQ(extractionTag(inv[2], 0, false), ".eng");
		EXPECT_EQ(extractionTag(inv[4], 2, true), ".fre");
		EXPECT_EQ(extractionTag(inv[5], 3, true), ".3");
	}

	TEST(SubtitleExtraction, tagsAreSafeFileNames)
	{
		StreamInventory inv;
		addStream(inv, StreamType::Subtitle, "ass", 0, { { "language", "eng" }, { "title", "Signs/Songs\\FX" } });
		addStream(inv, StreamType::Subtitle, "ass", 0, { { "title", "Full\tSubs" } });

		EXPECT_EQ(extractionTag(inv[0], 0, true), ".eng.Signs-Songs-FX");
		EXPECT_EQ(extractionTag(inv[1], 1, true), ".Full-Subs");
	}

	TEST(SubtitleExtraction, onlyTextSubtitles)
	{
		auto plan = buildPlan(sample(), SubtitleExtraction(SubtitlePolicy()));

		EXPECT_TRUE(plan.needsProcessing);
		ASSERT_EQ(plan.extractions.size(), 3u);

		EXPECT_EQ(plan.extractions[0].mapping, (Tokens { "-map", "0:s:0" }));
		EXPECT_EQ(plan.extractions[0].tag, ".eng.Signs-&-Songs");
		EXPECT_EQ(plan.extractions[1].mapping, (Tokens { "-map", "0:s:2" }));
		EXPECT_EQ(plan.extractions[2].mapping, (Tokens { "-map", "0:s:3" }));
	}

	TEST(SubtitleExtraction, languageFilter)
	{
		SubtitlePolicy pol;
		pol.languages = "fre";

		auto plan = buildPlan(sample(), SubtitleExtraction(pol));

		EXPECT_TRUE(plan.needsProcessing);
		ASSERT_EQ(plan.extractions.size(), 1u);
		EXPECT_EQ(plan.extractions[0].tag, ".fre");
	}

	TEST(SubtitleExtraction, nothingMatches)
	{
		SubtitlePolicy pol;
		pol.languages = "deu";

		auto plan = buildPlan(sample(), SubtitleExtraction(pol));
		EXPECT_FALSE(plan.needsProcessing);
		EXPECT_TRUE(plan.extractions.empty());
	}

	TEST(SubtitleExtraction, priorMarker)
	{
		SubtitlePolicy pol;
		pol.priorMarker = "eng fre";

		auto classifier = SubtitleExtraction(pol);
		EXPECT_TRUE(classifier.alreadyExtracted());

		auto plan = buildPlan(sample(), classifier);
		EXPECT_FALSE(plan.needsProcessing);

		pol.priorMarker = "  ";
		EXPECT_FALSE(SubtitleExtraction(pol).alreadyExtracted());
	}

	TEST(SubtitleExtraction, extractedLanguages)
	{
		auto inv = sample();

		EXPECT_EQ(extractedLanguages(inv, { }), "eng eng FRE");
		EXPECT_EQ(extractedLanguages(inv, { "fre" }), "FRE");
		EXPECT_EQ(extractedLanguages(inv, { "deu" }), "");
	}
}
