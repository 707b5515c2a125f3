// lang.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <string>
#include <vector>

#include "observer.h"

namespace lang
{
	// iso 639-3 code for an english language name (eg. "French" -> "fra"), or empty.
	std::string codeForLanguageName(const std::string& name);

	// all the names we know for a code, eg. "deu" -> { "German" }.
	std::vector<std::string> namesForCode(const std::string& code);


	// something that can tell us the original language of whatever a file is.
	class LookupService
	{
	public:
		virtual ~LookupService() { }

		virtual std::string name() const = 0;

		// false if the url or api key is missing, in which case we don't even try.
		virtual bool isConfigured() const = 0;

		// the human-readable language name (eg. "Japanese"), or empty on any kind of failure.
		virtual std::string originalLanguage(const std::string& term, util::Observer* obs) = 0;
	};

	struct ServiceConfig
	{
		std::string url;
		std::string apiKey;

		// milliseconds
		int timeout = 10000;
	};

	// shared by radarr and sonarr, since their lookup endpoints look the same.
	class ArrService : public LookupService
	{
	public:
		ArrService(const std::string& name, const std::string& endpoint, const ServiceConfig& config);

		std::string name() const override { return this->serviceName; }
		bool isConfigured() const override;

		std::string originalLanguage(const std::string& term, util::Observer* obs) override;

		std::string lookupUrl() const;

	private:
		std::string serviceName;
		std::string endpoint;
		ServiceConfig config;
	};

	ArrService makeRadarr(const ServiceConfig& config);
	ArrService makeSonarr(const ServiceConfig& config);

	// picks the language out of a lookup response body: the first result's originalLanguage.name.
	std::string parseOriginalLanguage(const std::string& body, std::string* err = nullptr);


	struct ResolverConfig
	{
		std::string searchString = "eng";

		bool useRadarr = false;
		ServiceConfig radarr = { "http://localhost:7878", "", 10000 };

		bool useSonarr = false;
		ServiceConfig sonarr = { "http://localhost:8989", "", 10000 };
	};

	// never fails: if neither service comes up with something, you get config.searchString (which might be empty).
	std::string resolve(const ResolverConfig& config, const std::string& term, LookupService* radarr,
		LookupService* sonarr, util::Observer* obs = nullptr);
}
