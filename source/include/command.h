// command.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "mapping.h"

namespace command
{
	// "-hide_banner -loglevel info"
	std::vector<std::string> genericOptions();

	struct Arguments
	{
		bool valid = false;
		std::string error;

		std::vector<std::string> args;
	};

	// generic, -i input, main, advanced, mapping, encoding, -y output. the output may be left
	// empty, the input may not.
	Arguments transcode(const mapping::MappingPlan& plan, const std::string& input, const std::string& output);

	// like transcode, but instead of the primary output, each extracted subtitle stream
	// gets its own '-map 0:s:N -y <file>' pair.
	Arguments extract(const mapping::MappingPlan& plan, const std::string& input,
		const std::filesystem::path& originalFile);

	// eg. "/movies/Film (2001).mkv" + ".eng.Signs" -> "/movies/Film (2001).eng.Signs.ass"
	std::filesystem::path extractionPath(const std::filesystem::path& originalFile, const std::string& tag);
}
