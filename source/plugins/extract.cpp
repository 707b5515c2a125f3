// extract.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "probe.h"
#include "command.h"
#include "mapping.h"
#include "sidecar.h"

namespace plugins
{
	bool extractSubtitles(const std::fs::path& original, std::fs::path& current)
	{
		auto policy = config::getSubtitlePolicy();
		policy.priorMarker = sidecar::readMarker(original, sidecar::EXTRACTION_SECTION);

		auto observer = util::ConsoleObserver(config::isVerbose());
		auto classifier = mapping::SubtitleExtraction(policy);

		auto probed = driver::probeStreams(current);
		if(!probed.valid)
		{
			util::error("failed to probe '%s': %s", current.string(), probed.error);
			return false;
		}

		auto plan = mapping::buildPlan(probed.streams, classifier, &observer);
		if(!plan.needsProcessing)
		{
			if(!classifier.alreadyExtracted())
				util::log("no ass/ssa subtitles to extract");

			return true;
		}

		// the .ass files go next to the original, whatever we're reading from.
		auto cmd = command::extract(plan, current.string(), original);
		if(!cmd.valid)
		{
			util::error("%s", cmd.error);
			return false;
		}

		if(!driver::runTranscoder(cmd.args))
			return false;

		util::log("extracted %d %s", plan.extractions.size(), util::plural("subtitle", plan.extractions.size()));
		if(config::isDryRun())
			return true;

		auto langs = mapping::extractedLanguages(probed.streams, classifier.languages());

		// the marker can't be empty, or we'd do this all over again next time.
		if(langs.empty())
			langs = "-";

		if(!sidecar::writeMarker(original, sidecar::EXTRACTION_SECTION, langs))
		{
			util::error("failed to write '%s'", sidecar::sidecarPath(original).string());
			return false;
		}

		return true;
	}
}
