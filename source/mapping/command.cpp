// command.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "command.h"

namespace command
{
	std::vector<std::string> genericOptions()
	{
		return { "-hide_banner", "-loglevel", "info" };
	}

	template <typename T>
	static void append(std::vector<T>& xs, const std::vector<T>& ys)
	{
		xs.insert(xs.end(), ys.begin(), ys.end());
	}

	// everything up to (and including) the advanced options is the same for both.
	static Arguments common_args(const mapping::MappingPlan& plan, const std::string& input)
	{
		Arguments ret;
		if(input.empty())
		{
			ret.error = "input file has not been set";
			return ret;
		}

		append(ret.args, genericOptions());
		append(ret.args, { "-i", input });
		append(ret.args, plan.mainOptions);
		append(ret.args, plan.advancedOptions);

		ret.valid = true;
		return ret;
	}

	Arguments transcode(const mapping::MappingPlan& plan, const std::string& input, const std::string& output)
	{
		auto ret = common_args(plan, input);
		if(!ret.valid)
			return ret;

		append(ret.args, plan.streamMapping);
		append(ret.args, plan.streamEncoding);

		if(!output.empty())
			append(ret.args, { "-y", output });

		return ret;
	}

	Arguments extract(const mapping::MappingPlan& plan, const std::string& input, const std::fs::path& originalFile)
	{
		auto ret = common_args(plan, input);
		if(!ret.valid)
			return ret;

		if(originalFile.empty())
		{
			ret.valid = false;
			ret.error = "original file path has not been set";
			return ret;
		}

		for(const auto& ex : plan.extractions)
		{
			append(ret.args, ex.mapping);
			append(ret.args, { "-y", extractionPath(originalFile, ex.tag).string() });
		}

		return ret;
	}

	std::fs::path extractionPath(const std::fs::path& originalFile, const std::string& tag)
	{
		auto name = originalFile.stem().string() + tag + ".ass";
		return originalFile.parent_path() / name;
	}
}
