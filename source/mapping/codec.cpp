// codec.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "mapping.h"

namespace mapping
{
	const std::vector<std::string>& knownAudioCodecs()
	{
		static const std::vector<std::string> codecs = {
			"dts", "dca", "truehd", "eac3", "mp3", "mp2", "aac", "opus", "flac", "vorbis", "pcm_s16le"
		};

		return codecs;
	}

	CodecConversion::CodecConversion(const CodecPolicy& policy) : pol(policy)
	{
		this->pol.targetCodec = util::lowercase(util::trim(this->pol.targetCodec));
		this->pol.encoder = util::trim(this->pol.encoder);

		if(this->pol.encoder.empty())
			this->pol.encoder = this->pol.targetCodec;

		std::vector<std::string> selected;
		for(const auto& c : this->pol.selectedCodecs)
		{
			if(auto x = util::lowercase(util::trim(c)); !x.empty())
				selected.push_back(x);
		}

		this->pol.selectedCodecs = selected;
	}

	bool CodecConversion::handlesType(StreamType type) const
	{
		return type == StreamType::Audio;
	}

	bool CodecConversion::test(const Stream& strm) const
	{
		auto codec = util::lowercase(strm.codecName);

		// ignore streams already of the required codec
		if(codec == this->pol.targetCodec)
			return false;

		if(this->pol.mode == SelectionMode::All)
			return true;

		if(util::contains(this->pol.selectedCodecs, codec))
			return true;

		// "other" catches everything that doesn't have its own checkbox.
		return util::contains(this->pol.selectedCodecs, std::string("other"))
			&& !util::contains(knownAudioCodecs(), codec);
	}

	Classification CodecConversion::classify(const Stream& strm, size_t position, Buckets& buckets,
		util::Observer* obs) const
	{
		(void) buckets;

		Classification ret;
		if(!this->test(strm))
			return ret;

		ret.needsProcessing = true;
		ret.mapping = { "-map", selector(StreamType::Audio, position) };
		ret.encoding = { zpr::sprint("-c:a:%d", position), this->pol.encoder };

		if(this->pol.advanced)
		{
			auto custom = util::splitWhitespace(this->pol.customOptions);
			ret.encoding.insert(ret.encoding.end(), custom.begin(), custom.end());
		}
		else if(strm.channels > 0)
		{
			auto bitrate = bitrateForChannels(strm.channels);
			auto channels = clampChannels(strm.channels);

			util::notify(obs, util::LogLevel::Debug, "stream %d has %d channels, using %sk", position,
				strm.channels, bitrate);

			ret.encoding.push_back(zpr::sprint("-ac:a:%d", position));
			ret.encoding.push_back(std::to_string(channels));
			ret.encoding.push_back(zpr::sprint("-b:a:%d", position));
			ret.encoding.push_back(bitrate + "k");
		}
		else
		{
			util::notify(obs, util::LogLevel::Debug, "stream %d did not report 'channels', leaving bitrate to the encoder",
				position);
		}

		return ret;
	}

	void CodecConversion::assemble(const Buckets& buckets, MappingPlan& plan, util::Observer* obs) const
	{
		(void) buckets;
		(void) obs;

		if(this->pol.advanced)
		{
			// if any were given, they replace the defaults wholesale.
			if(auto main = util::splitWhitespace(this->pol.mainOptions); !main.empty())
				plan.mainOptions = main;

			if(auto adv = util::splitWhitespace(this->pol.advancedOptions); !adv.empty())
				plan.advancedOptions = adv;
		}
		else
		{
			plan.advancedOptions = { "-strict", "-2", "-max_muxing_queue_size",
				std::to_string(this->pol.maxMuxingQueueSize) };
		}
	}
}
