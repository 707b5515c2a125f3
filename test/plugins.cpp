// plugins.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "defs.h"
#include "lang.h"

namespace plugins::tests
{
	struct CountingService : lang::LookupService
	{
		std::string name() const override { return "counting"; }
		bool isConfigured() const override { return true; }

		std::string originalLanguage(const std::string& term, util::Observer* obs) override
		{
			this->calls++;
			return "Japanese";
		}

		int calls = 0;
	};

	TEST(ReorderAudio, unreadableFileSkipsLookups)
	{
		config::setIsUsingFFprobe(false);
		config::setIsUsingRadarr(true);
		config::setIsUsingSonarr(true);

		CountingService radarr;
		CountingService sonarr;

		auto original = std::fs::path("/nonexistent/streamplan/Film (2001).mkv");
		auto current = original;

		EXPECT_FALSE(reorderAudio(original, current, &radarr, &sonarr));
		EXPECT_EQ(current, original);

		EXPECT_EQ(radarr.calls, 0);
		EXPECT_EQ(sonarr.calls, 0);
	}
}
