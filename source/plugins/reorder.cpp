// reorder.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "lang.h"
#include "probe.h"
#include "command.h"
#include "mapping.h"

namespace plugins
{
	bool reorderAudio(const std::fs::path& original, std::fs::path& current)
	{
		auto conf = config::getResolverConfig();
		auto radarr = lang::makeRadarr(conf.radarr);
		auto sonarr = lang::makeSonarr(conf.sonarr);

		return reorderAudio(original, current, &radarr, &sonarr);
	}

	bool reorderAudio(const std::fs::path& original, std::fs::path& current, lang::LookupService* radarr,
		lang::LookupService* sonarr)
	{
		// probe before any of the lookups.
		auto probed = driver::probeStreams(current);
		if(!probed.valid)
		{
			util::error("failed to probe '%s': %s", current.string(), probed.error);
			return false;
		}

		auto observer = util::ConsoleObserver(config::isVerbose());

		auto conf = config::getResolverConfig();

		// the services want the path the user knows the file by, not our temporary copy.
		std::error_code ec;
		auto term = std::fs::absolute(original, ec).string();
		if(ec) term = original.string();

		auto policy = config::getReorderPolicy();
		policy.searchString = lang::resolve(conf, term, radarr, sonarr, &observer);

		if(policy.searchString.empty())
		{
			util::warn("no language to search for; skipping");
			return true;
		}

		auto classifier = mapping::LanguageReorder(policy);
		auto plan = mapping::buildPlan(probed.streams, classifier, &observer);
		if(!plan.needsProcessing)
		{
			util::log("audio streams are already in order for '%s'", classifier.searchString());
			return true;
		}

		auto output = driver::outputPath(original, current);

		auto cmd = command::transcode(plan, current.string(), output.string());
		if(!cmd.valid)
		{
			util::error("%s", cmd.error);
			return false;
		}

		if(!driver::runTranscoder(cmd.args))
			return false;

		if(config::isDryRun())
			return true;

		if(!driver::finishOutput(output, original))
			return false;

		current = std::fs::path(config::getOutputFolder()) / original.filename();
		return true;
	}
}
