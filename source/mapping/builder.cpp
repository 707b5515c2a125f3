// builder.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <unordered_map>

#include "defs.h"
#include "mapping.h"

namespace mapping
{
	std::vector<std::string> defaultAdvancedOptions()
	{
		return { "-strict", "-2", "-max_muxing_queue_size", "4096" };
	}

	static void copy_stream(MappingPlan& plan, StreamType type, size_t position)
	{
		plan.streamMapping.push_back("-map");
		plan.streamMapping.push_back(selector(type, position));

		plan.streamEncoding.push_back(zpr::sprint("-c:%s:%d", std::string(1, typeIdent(type)), position));
		plan.streamEncoding.push_back("copy");
	}

	MappingPlan buildPlan(const StreamInventory& streams, const StreamClassifier& classifier, util::Observer* obs)
	{
		MappingPlan plan;
		plan.advancedOptions = defaultAdvancedOptions();

		// a fresh one every time, so nothing leaks from one file to the next.
		Buckets buckets;

		// the counters are per type, since that's how the selectors count.
		std::unordered_map<int, size_t> counters;

		for(const auto& strm : streams)
		{
			if(strm.type == StreamType::Unknown)
			{
				util::notify(obs, util::LogLevel::Debug, "ignoring stream %d of unknown type", strm.globalIndex);
				continue;
			}

			size_t position = counters[static_cast<int>(strm.type)]++;

			if(!classifier.handlesType(strm.type))
			{
				copy_stream(plan, strm.type, position);
				continue;
			}

			auto c = classifier.classify(strm, position, buckets, obs);
			if(c.needsProcessing)
			{
				util::notify(obs, util::LogLevel::Debug, "%s: stream %s needs processing (%s)", classifier.name(),
					selector(strm.type, position), strm.codecName);

				plan.needsProcessing = true;
				plan.streamMapping.insert(plan.streamMapping.end(), c.mapping.begin(), c.mapping.end());
				plan.streamEncoding.insert(plan.streamEncoding.end(), c.encoding.begin(), c.encoding.end());
			}
			else
			{
				copy_stream(plan, strm.type, position);
			}
		}

		classifier.assemble(buckets, plan, obs);
		return plan;
	}
}
