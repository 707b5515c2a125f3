// driver.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "probe.h"
#include "tinyprocess.h"

namespace driver
{
	static constexpr const char* TMP_OUTPUT_PREFIX = ".tmp-streamplan-";

	template <typename... Args>
	static void verbose(const std::string& fmt, Args&&... args)
	{
		if(config::isVerbose())
			util::debug(fmt, args...);
	}

	bool processOneFile(const std::fs::path& filepath)
	{
		bool ok = true;

		util::log("%s", filepath.filename().string());
		util::indent_log();

		// each plugin reads what the one before it wrote.
		std::fs::path currentFile = filepath;

		if(config::isExtractingSubtitles())
		{
			util::info("extracting subtitles");
			util::indent_log();

			ok &= plugins::extractSubtitles(filepath, currentFile);

			util::unindent_log();
		}

		if(ok && config::isEncodingAudio())
		{
			util::info("encoding audio");
			util::indent_log();

			ok &= plugins::encodeAudio(filepath, currentFile);

			util::unindent_log();
		}

		if(ok && config::isReorderingAudio())
		{
			util::info("reordering audio");
			util::indent_log();

			ok &= plugins::reorderAudio(filepath, currentFile);

			util::unindent_log();
		}

		util::unindent_log();
		zpr::println("");

		if(!ok && config::shouldStopOnError())
		{
			util::error("stopping on first error");
			exit(-1);
		}

		return ok;
	}

	probe::ProbeResult probeStreams(const std::fs::path& filepath)
	{
		probe::ProbeResult ret;
		if(config::isUsingFFprobe())
			ret = probe::runFFprobe(config::getFFprobeProgram(), filepath);

		else
			ret = probe::probeFile(filepath);

		if(ret.valid)
		{
			verbose("found %d %s", ret.streams.size(), util::plural("stream", ret.streams.size()));
			for(const auto& s : ret.streams)
			{
				verbose("#%d: %s %d (%s%s)", s.globalIndex, mapping::typeName(s.type), s.index, s.codecName,
					s.tag("language").empty() ? "" : zpr::sprint(", %s", s.tag("language")));
			}
		}

		return ret;
	}

	bool runTranscoder(const std::vector<std::string>& args)
	{
		auto cmd = util::commandString(config::getFFmpegProgram(), args);

		if(config::isDryRun())
		{
			util::info("dry run: %s", cmd);
			return true;
		}

		verbose("running: %s", cmd);

		std::string serr;
		tinyproclib::Process proc(cmd, "",
			[](const char*, size_t) {
			},
			[&serr](const char* bytes, size_t n) {
				serr += std::string(bytes, n);
			}
		);

		if(auto status = proc.get_exit_status(); status != 0)
		{
			util::error("%s exited with status %d", config::getFFmpegProgram(), status);

			// the last few lines are usually the only useful ones.
			auto lines = util::splitString(util::trim(serr));
			for(size_t i = (lines.size() > 5 ? lines.size() - 5 : 0); i < lines.size(); i++)
				util::log("%s", lines[i]);

			return false;
		}

		return true;
	}

	std::fs::path outputPath(const std::fs::path& original, const std::fs::path& current)
	{
		auto target = std::fs::path(config::getOutputFolder()) / original.filename();

		// ffmpeg can't write over the file it's reading.
		std::error_code ec;
		if(std::fs::exists(target, ec) && std::fs::equivalent(target, current, ec))
			return target.parent_path() / (TMP_OUTPUT_PREFIX + original.filename().string());

		return target;
	}

	bool finishOutput(const std::fs::path& written, const std::fs::path& original)
	{
		auto target = std::fs::path(config::getOutputFolder()) / original.filename();
		if(written == target)
			return true;

		std::error_code ec;
		std::fs::rename(written, target, ec);
		if(ec)
		{
			util::error("failed to move '%s' to '%s': %s", written.string(), target.string(), ec.message());
			return false;
		}

		return true;
	}






	void createOutputFolder()
	{
		if(auto out = config::getOutputFolder(); !out.empty())
		{
			auto path = std::fs::path(out);
			if(!std::fs::exists(path))
			{
				std::error_code ec;
				bool res = std::fs::create_directories(path, ec);
				if(res) { util::info("creating output folder '%s'", out); }
				else    { util::error("failed to create output folder '%s'", out); exit(-1); }
			}
			else if(!std::fs::is_directory(path))
			{
				util::error("%serror:%s specified output path '%s' is not a directory",
					COLOUR_RED_BOLD, COLOUR_RESET, out);
				exit(-1);
			}
		}
	}

	std::vector<std::fs::path> collectFiles(const std::vector<std::string>& files)
	{
		std::vector<std::fs::path> ret;

		for(auto file : files)
		{
			auto filepath = std::fs::path(file);

			if(!std::fs::exists(filepath))
			{
				util::error("skipping nonexistent file '%s'", filepath.string());
				if(config::shouldStopOnError()) exit(-1);
				continue;
			}
			else if(!std::fs::is_regular_file(filepath))
			{
				util::error("skipping '%s' (not a regular file)", filepath.string());
				if(config::shouldStopOnError()) exit(-1);
				continue;
			}

			if(auto out = config::getOutputFolder(); !out.empty() && std::fs::exists(out))
			{
				if(std::fs::equivalent(std::fs::canonical(std::fs::absolute(filepath).parent_path()),
					std::fs::canonical(std::fs::path(out))))
				{
					util::error("skipping input file overlapping with output folder");
					if(config::shouldStopOnError()) exit(-1);
					continue;
				}
			}

			ret.push_back(filepath);
		}

		return ret;
	}
}
