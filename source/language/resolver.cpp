// resolver.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "lang.h"

namespace lang
{
	static std::string lookup_code(LookupService* service, const std::string& term, util::Observer* obs)
	{
		if(!service || !service->isConfigured())
			return "";

		auto name = service->originalLanguage(term, obs);
		if(name.empty())
		{
			util::notify(obs, util::LogLevel::Debug, "%s: no original language for '%s'", service->name(), term);
			return "";
		}

		auto code = codeForLanguageName(name);
		if(code.empty())
		{
			util::notify(obs, util::LogLevel::Warn, "%s: unknown language '%s'", service->name(), name);
			return "";
		}

		// radarr and sonarr have their own spellings for some of these, eg. 'Flemish' for dutch.
		if(auto names = namesForCode(code); !names.empty() && util::lowercase(names[0]) != util::lowercase(name))
			util::notify(obs, util::LogLevel::Info, "%s: original language is %s (%s, %s)", service->name(), name, names[0], code);

		else
			util::notify(obs, util::LogLevel::Info, "%s: original language is %s (%s)", service->name(), name, code);

		return code;
	}

	std::string resolve(const ResolverConfig& config, const std::string& term, LookupService* radarr,
		LookupService* sonarr, util::Observer* obs)
	{
		std::string code;

		if(config.useRadarr)
			code = lookup_code(radarr, term, obs);

		if(code.empty() && config.useSonarr)
			code = lookup_code(sonarr, term, obs);

		if(code.empty())
			code = config.searchString;

		return code;
	}
}
