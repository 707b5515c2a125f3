// probe.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <string>
#include <filesystem>

#include "mapping.h"

namespace probe
{
	struct ProbeResult
	{
		bool valid = false;
		std::string error;

		mapping::StreamInventory streams;
	};

	// the json that 'ffprobe -print_format json -show_streams' spits out.
	ProbeResult parseProbeDocument(const std::string& json);

	// runs ffprobe on the file and parses what comes back.
	ProbeResult runFFprobe(const std::string& program, const std::filesystem::path& path);

	// opens the file with libavformat and reads the streams directly.
	ProbeResult probeFile(const std::filesystem::path& path);
}
