// resolver.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <gtest/gtest.h>

#include "lang.h"

namespace lang::tests
{
	struct FakeService : LookupService
	{
		FakeService(const std::string& answer, bool configured = true) : answer(answer), configured(configured) { }

		std::string name() const override { return "fake"; }
		bool isConfigured() const override { return this->configured; }

		std::string originalLanguage(const std::string& term, util::Observer* obs) override
		{
			this->calls++;
			this->lastTerm = term;
			return this->answer;
		}

		std::string answer;
		bool configured = true;

		int calls = 0;
		std::string lastTerm;
	};

	struct CollectingObserver : util::Observer
	{
		void message(util::LogLevel level, const std::string& msg) override
		{
			this->messages.push_back(msg);
		}

		std::vector<std::string> messages;
	};

	TEST(Resolver, fallsBackToSearchString)
	{
		ResolverConfig config;
		config.searchString = "spa";
		config.useRadarr = false;
		config.useSonarr = true;

		FakeService radarr("Japanese");
		FakeService sonarr("");

		EXPECT_EQ(resolve(config, "/tv/show.mkv", &radarr, &sonarr), "spa");
		EXPECT_EQ(radarr.calls, 0);
		EXPECT_EQ(sonarr.calls, 1);
	}

	TEST(Resolver, radarrFirst)
	{
		ResolverConfig config;
		config.useRadarr = true;
		config.useSonarr = true;

		FakeService radarr("Japanese");
		FakeService sonarr("French");

		CollectingObserver obs;
		EXPECT_EQ(resolve(config, "/movies/film.mkv", &radarr, &sonarr, &obs), "jpn");
		EXPECT_EQ(radarr.lastTerm, "/movies/film.mkv");
		EXPECT_EQ(sonarr.calls, 0);
		EXPECT_FALSE(obs.messages.empty());
	}

	TEST(Resolver, sonarrSecond)
	{
		ResolverConfig config;
		config.useRadarr = true;
		config.useSonarr = true;

		FakeService radarr("");
		FakeService sonarr("French");

		EXPECT_EQ(resolve(config, "x", &radarr, &sonarr), "fra");
	}

	TEST(Resolver, aliasedLanguageName)
	{
		ResolverConfig config;
		config.useRadarr = true;

		FakeService radarr("Flemish");

		CollectingObserver obs;
		EXPECT_EQ(resolve(config, "x", &radarr, nullptr, &obs), "nld");

		ASSERT_EQ(obs.messages.size(), 1u);
		EXPECT_EQ(obs.messages[0], "fake: original language is Flemish (Dutch, nld)");
	}

	TEST(Resolver, unknownLanguageName)
	{
		ResolverConfig config;
		config.searchString = "eng";
		config.useRadarr = true;

		FakeService radarr("Elvish");

		EXPECT_EQ(resolve(config, "x", &radarr, nullptr), "eng");
	}

	TEST(Resolver, unconfiguredServicesAreSkipped)
	{
		ResolverConfig config;
		config.searchString = "deu";
		config.useRadarr = true;
		config.useSonarr = true;

		FakeService radarr("Japanese", false);

		EXPECT_EQ(resolve(config, "x", &radarr, nullptr), "deu");
		EXPECT_EQ(radarr.calls, 0);
	}
}
