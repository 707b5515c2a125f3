// sidecar.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <string>
#include <vector>
#include <utility>
#include <filesystem>

// the per-directory '.unmanic' file. it's an ini file, sections of 'key = value' lines, and we
// only care about one section of it -- the rest must be preserved when we write it back.
namespace sidecar
{
	static constexpr const char* FILE_NAME          = ".unmanic";
	static constexpr const char* EXTRACTION_SECTION = "extract_ass_subtitles_to_files";

	struct Section
	{
		std::string name;
		std::vector<std::pair<std::string, std::string>> entries;
	};

	struct Document
	{
		bool valid = false;
		std::string error;

		std::vector<Section> sections;

		// keys are matched case-insensitively, same as python's configparser does it.
		std::string get(const std::string& section, const std::string& key) const;
		void set(const std::string& section, const std::string& key, const std::string& value);
	};

	Document parse(const std::string& text);
	std::string serialise(const Document& doc);

	std::filesystem::path sidecarPath(const std::filesystem::path& mediaFile);

	// empty if there's nothing recorded -- or if the file is unreadable or broken, since
	// processing the file again is the safe choice there.
	std::string readMarker(const std::filesystem::path& mediaFile, const std::string& section);

	bool writeMarker(const std::filesystem::path& mediaFile, const std::string& section, const std::string& value);
}
