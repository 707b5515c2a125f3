// languages.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "lang.h"

namespace lang::tests
{
	TEST(Languages, names)
	{
		EXPECT_EQ(codeForLanguageName("English"), "eng");
		EXPECT_EQ(codeForLanguageName("japanese"), "jpn");
		EXPECT_EQ(codeForLanguageName("  French "), "fra");
		EXPECT_EQ(codeForLanguageName("Klingon"), "");
		EXPECT_EQ(codeForLanguageName(""), "");
	}

	TEST(Languages, aliases)
	{
		EXPECT_EQ(codeForLanguageName("Greek"), "ell");
		EXPECT_EQ(codeForLanguageName("Flemish"), "nld");
		EXPECT_EQ(codeForLanguageName("Portuguese (Brazil)"), "por");
		EXPECT_EQ(codeForLanguageName("Spanish (Latin)"), "spa");
	}

	TEST(Languages, codes)
	{
		auto names = namesForCode("DEU");
		ASSERT_FALSE(names.empty());
		EXPECT_EQ(names[0], "German");

		EXPECT_TRUE(namesForCode("xxx").empty());
	}

	TEST(Languages, lookupResponse)
	{
		std::string err;
		EXPECT_EQ(parseOriginalLanguage(R"([{"title":"Spirited Away","originalLanguage":{"id":8,"name":"Japanese"}},
			{"title":"Other","originalLanguage":{"id":1,"name":"English"}}])", &err), "Japanese");

		EXPECT_EQ(parseOriginalLanguage("[]", &err), "");
		EXPECT_EQ(err, "no results");

		EXPECT_EQ(parseOriginalLanguage(R"([{"title":"x"}])", &err), "");
		EXPECT_FALSE(err.empty());

		EXPECT_EQ(parseOriginalLanguage("{ not json", &err), "");
		EXPECT_FALSE(err.empty());

		EXPECT_EQ(parseOriginalLanguage(R"({"message":"Unauthorized"})"), "");
	}

	TEST(Languages, services)
	{
		auto radarr = makeRadarr({ "http://localhost:7878/", "abc", 1000 });
		EXPECT_EQ(radarr.name(), "radarr");
		EXPECT_EQ(radarr.lookupUrl(), "http://localhost:7878/api/v3/movie/lookup");
		EXPECT_TRUE(radarr.isConfigured());

		auto sonarr = makeSonarr({ "http://localhost:8989", "", 1000 });
		EXPECT_EQ(sonarr.lookupUrl(), "http://localhost:8989/api/v3/series/lookup");
		EXPECT_FALSE(sonarr.isConfigured());

		// not configured, so this never goes near the network.
		EXPECT_EQ(sonarr.originalLanguage("/movies/x.mkv", nullptr), "");
	}
}
