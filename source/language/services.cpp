// services.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "cpr/cpr.h"
#include "defs.h"
#include "lang.h"
#include "picojson.h"

namespace pj = picojson;

namespace lang
{
	ArrService::ArrService(const std::string& name, const std::string& endpoint, const ServiceConfig& config)
		: serviceName(name), endpoint(endpoint), config(config)
	{
		// 'http://localhost:7878/' and 'http://localhost:7878' are the same thing.
		while(!this->config.url.empty() && this->config.url.back() == '/')
			this->config.url.pop_back();
	}

	bool ArrService::isConfigured() const
	{
		return !util::trim(this->config.url).empty() && !util::trim(this->config.apiKey).empty();
	}

	std::string ArrService::lookupUrl() const
	{
		return zpr::sprint("%s%s", this->config.url, this->endpoint);
	}

	std::string parseOriginalLanguage(const std::string& body, std::string* err)
	{
		auto fail = [&err](const std::string& msg) -> std::string {
			if(err) *err = msg;
			return "";
		};

		pj::value resp;
		if(auto e = pj::parse(resp, body); !e.empty())
			return fail(zpr::sprint("malformed response: %s", e));

		if(!resp.is<pj::array>())
			return fail("expected an array of results");

		auto results = resp.get<pj::array>();
		if(results.empty())
			return fail("no results");

		// only the first one counts, same as if you searched in the ui.
		auto& first = results[0];
		if(!first.is<pj::object>() || !first.contains("originalLanguage"))
			return fail("no 'originalLanguage' in the first result");

		auto orig = first.get("originalLanguage");
		if(!orig.is<pj::object>() || !orig.contains("name") || !orig.get("name").is<std::string>())
			return fail("'originalLanguage' has no name");

		return orig.get("name").get<std::string>();
	}

	std::string ArrService::originalLanguage(const std::string& term, util::Observer* obs)
	{
		if(!this->isConfigured())
		{
			util::notify(obs, util::LogLevel::Debug, "%s: missing url or api key, skipping", this->serviceName);
			return "";
		}

		auto r = cpr::Get(
			cpr::Url(this->lookupUrl()),
			cpr::Parameters({{ "term", term }}),
			cpr::Header({{ "X-Api-Key", this->config.apiKey }}),
			cpr::Timeout{ this->config.timeout }
		);

		if(r.error.code != cpr::ErrorCode::OK)
		{
			util::notify(obs, util::LogLevel::Warn, "%s: request failed - '%s' (%s)", this->serviceName,
				this->lookupUrl(), r.error.message);
			return "";
		}

		if(r.status_code != 200)
		{
			util::notify(obs, util::LogLevel::Warn, "%s: http request failed - '%s' (status %d)", this->serviceName,
				r.url.str(), r.status_code);
			return "";
		}

		std::string err;
		auto name = parseOriginalLanguage(r.text, &err);
		if(name.empty())
			util::notify(obs, util::LogLevel::Debug, "%s: %s", this->serviceName, err);

		return name;
	}

	ArrService makeRadarr(const ServiceConfig& config)
	{
		return ArrService("radarr", "/api/v3/movie/lookup", config);
	}

	ArrService makeSonarr(const ServiceConfig& config)
	{
		return ArrService("sonarr", "/api/v3/series/lookup", config);
	}
}
