// reorder.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "mapping.h"

namespace mapping
{
	LanguageReorder::LanguageReorder(const ReorderPolicy& policy) : pol(policy)
	{
		this->search = util::lowercase(util::trim(this->pol.searchString));
	}

	bool LanguageReorder::handlesType(StreamType type) const
	{
		// everything goes into some bucket.
		(void) type;
		return true;
	}

	bool LanguageReorder::matches(const Stream& strm) const
	{
		// an empty string is in everything, which isn't very useful.
		if(this->search.empty())
			return false;

		if(util::lowercase(strm.tag("language")).find(this->search) != std::string::npos)
			return true;

		if(util::lowercase(strm.tag("title")).find(this->search) != std::string::npos)
			return true;

		return false;
	}

	Classification LanguageReorder::classify(const Stream& strm, size_t position, Buckets& buckets,
		util::Observer* obs) const
	{
		BucketEntry entry;
		entry.index = position;
		entry.tokens = { "-map", selector(strm.type, position) };

		if(strm.type == this->pol.streamType)
		{
			if(this->matches(strm))
			{
				// the first match becomes the default stream. it is going to end up first,
				// so its output index is always 0.
				if(buckets.matched.empty())
				{
					entry.tokens.push_back(zpr::sprint("-disposition:%s:0", std::string(1, typeIdent(strm.type))));
					entry.tokens.push_back("default");
				}

				util::notify(obs, util::LogLevel::Debug, "stream %s matched '%s'", selector(strm.type, position),
					this->search);

				buckets.foundMatch = true;
				buckets.matched.push_back(entry);
			}
			else
			{
				buckets.unmatched.push_back(entry);
			}
		}
		else
		{
			if(!buckets.foundMatch) buckets.pre.push_back(entry);
			else                    buckets.post.push_back(entry);
		}

		// nothing goes through the usual mapping; the buckets are put together in assemble().
		Classification ret;
		ret.needsProcessing = true;
		return ret;
	}

	bool streamsToBeReordered(const Buckets& buckets)
	{
		if(buckets.matched.empty() || buckets.unmatched.empty())
			return false;

		// only the streams of interest are counted; the others keep their relative order anyway.
		size_t counter = 0;
		for(const auto* bucket : { &buckets.matched, &buckets.unmatched })
		{
			for(const auto& entry : *bucket)
			{
				if(entry.index != counter)
					return true;

				counter++;
			}
		}

		return false;
	}

	void LanguageReorder::assemble(const Buckets& buckets, MappingPlan& plan, util::Observer* obs) const
	{
		plan.needsProcessing = streamsToBeReordered(buckets);

		if(!buckets.matched.empty() && !buckets.unmatched.empty())
		{
			util::notify(obs, util::LogLevel::Info, "found %d %s matching '%s'", buckets.matched.size(),
				util::plural("stream", buckets.matched.size()), this->search);

			if(plan.needsProcessing)
				util::notify(obs, util::LogLevel::Info, "the new order for the mapped streams will differ from the source file");
		}

		// clear whatever default flags were there before, the first match sets its own.
		plan.streamMapping = { "-c", "copy", zpr::sprint("-disposition:%s", std::string(1, typeIdent(this->pol.streamType))),
			"-default" };

		for(auto id : { BucketId::Pre, BucketId::Matched, BucketId::Unmatched, BucketId::Post })
		{
			auto tokens = flatten(buckets.get(id));
			plan.streamMapping.insert(plan.streamMapping.end(), tokens.begin(), tokens.end());
		}

		plan.streamEncoding.clear();
	}
}
