// encode.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "probe.h"
#include "command.h"
#include "mapping.h"

namespace plugins
{
	bool encodeAudio(const std::fs::path& original, std::fs::path& current)
	{
		auto probed = driver::probeStreams(current);
		if(!probed.valid)
		{
			util::error("failed to probe '%s': %s", current.string(), probed.error);
			return false;
		}

		auto observer = util::ConsoleObserver(config::isVerbose());
		auto classifier = mapping::CodecConversion(config::getCodecPolicy());

		auto plan = mapping::buildPlan(probed.streams, classifier, &observer);
		if(!plan.needsProcessing)
		{
			util::log("all audio streams are already %s", classifier.policy().targetCodec);
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
