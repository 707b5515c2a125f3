// command.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "command.h"

namespace command::tests
{
	using Tokens = std::vector<std::string>;

	TEST(Command, transcode)
	{
		mapping::StreamInventory inv;
		mapping::addStream(inv, mapping::StreamType::Audio, "dts", 2);

		auto plan = mapping::buildPlan(inv, mapping::CodecConversion(mapping::CodecPolicy()));
		auto cmd = transcode(plan, "in.mkv", "out.mkv");

		ASSERT_TRUE(cmd.valid);
		EXPECT_EQ(cmd.args, (Tokens {
			"-hide_banner", "-loglevel", "info",
			"-i", "in.mkv",
			"-strict", "-2", "-max_muxing_queue_size", "2048",
			"-map", "0:a:0",
			"-c:a:0", "ac3", "-ac:a:0", "2", "-b:a:0", "224k",
			"-y", "out.mkv"
		}));
	}

	TEST(Command, missingInput)
	{
		auto cmd = transcode(mapping::MappingPlan(), "", "out.mkv");

		EXPECT_FALSE(cmd.valid);
		EXPECT_EQ(cmd.error, "input file has not been set");
		EXPECT_TRUE(cmd.args.empty());
	}

	TEST(Command, extract)
	{
		mapping::StreamInventory inv;
		mapping::addStream(inv, mapping::StreamType::Subtitle, "ass", 0, { { "language", "eng" } });
		mapping::addStream(inv, mapping::StreamType::Subtitle, "ass");

		auto plan = mapping::buildPlan(inv, mapping::SubtitleExtraction(mapping::SubtitlePolicy()));
		auto cmd = extract(plan, "/tmp/work.mkv", "/movies/Film (2001).mkv");

		ASSERT_TRUE(cmd.valid);
		EXPECT_EQ(cmd.args, (Tokens {
			"-hide_banner", "-loglevel", "info",
			"-i", "/tmp/work.mkv",
			"-strict", "-2", "-max_muxing_queue_size", "4096",
			"-map", "0:s:0", "-y", "/movies/Film (2001).eng.ass",
			"-map", "0:s:1", "-y", "/movies/Film (2001).1.ass"
		}));
	}

	TEST(Command, extractNeedsOriginal)
	{
		auto cmd = extract(mapping::MappingPlan(), "in.mkv", "");
		EXPECT_FALSE(cmd.valid);
	}

	TEST(Command, extractionPath)
	{
		EXPECT_EQ(extractionPath("/a/b/show.s01e01.mkv", ".jpn").string(), "/a/b/show.s01e01.jpn.ass");
	}
}
