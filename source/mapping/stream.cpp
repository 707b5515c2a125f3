// stream.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "mapping.h"

namespace mapping
{
	char typeIdent(StreamType type)
	{
		switch(type)
		{
			case StreamType::Video:         return 'v';
			case StreamType::Audio:         return 'a';
			case StreamType::Subtitle:      return 's';
			case StreamType::Data:          return 'd';
			case StreamType::Attachment:    return 't';

			default:                        return 0;
		}
	}

	StreamType typeFromName(const std::string& name)
	{
		auto n = util::lowercase(name);

		if(n == "video")        return StreamType::Video;
		if(n == "audio")        return StreamType::Audio;
		if(n == "subtitle")     return StreamType::Subtitle;
		if(n == "data")         return StreamType::Data;
		if(n == "attachment")   return StreamType::Attachment;

		return StreamType::Unknown;
	}

	std::string typeName(StreamType type)
	{
		switch(type)
		{
			case StreamType::Video:         return "video";
			case StreamType::Audio:         return "audio";
			case StreamType::Subtitle:      return "subtitle";
			case StreamType::Data:          return "data";
			case StreamType::Attachment:    return "attachment";

			default:                        return "unknown";
		}
	}

	std::string Stream::tag(const std::string& key) const
	{
		if(auto it = this->tags.find(key); it != this->tags.end())
			return it->second;

		return "";
	}

	void addStream(StreamInventory& inv, StreamType type, const std::string& codec, int channels,
		const std::map<std::string, std::string>& tags)
	{
		Stream strm;
		strm.type = type;
		strm.codecName = util::lowercase(codec);
		strm.channels = channels;
		strm.globalIndex = inv.size();

		for(const auto& [ k, v ] : tags)
			strm.tags[util::lowercase(k)] = v;

		size_t idx = 0;
		for(const auto& s : inv)
		{
			if(s.type == type)
				idx++;
		}

		strm.index = idx;
		inv.push_back(strm);
	}

	std::string selector(StreamType type, size_t index)
	{
		return zpr::sprint("0:%s:%d", std::string(1, typeIdent(type)), index);
	}




	Bucket& Buckets::get(BucketId id)
	{
		switch(id)
		{
			case BucketId::Pre:         return this->pre;
			case BucketId::Matched:     return this->matched;
			case BucketId::Unmatched:   return this->unmatched;
			default:                    return this->post;
		}
	}

	const Bucket& Buckets::get(BucketId id) const
	{
		switch(id)
		{
			case BucketId::Pre:         return this->pre;
			case BucketId::Matched:     return this->matched;
			case BucketId::Unmatched:   return this->unmatched;
			default:                    return this->post;
		}
	}

	std::vector<std::string> flatten(const Bucket& bucket)
	{
		std::vector<std::string> ret;
		for(const auto& entry : bucket)
			ret.insert(ret.end(), entry.tokens.begin(), entry.tokens.end());

		return ret;
	}
}
