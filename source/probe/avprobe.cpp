// avprobe.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "probe.h"
#include "tinyprocess.h"

// what the fuck? i shouldn't have to do this manually...
extern "C" {
	#include <libavutil/log.h>
	#include <libavutil/dict.h>
	#include <libavutil/version.h>
	#include <libavcodec/avcodec.h>
	#include <libavformat/avformat.h>
}

namespace probe
{
	static mapping::StreamType stream_type(AVMediaType type)
	{
		switch(type)
		{
			case AVMEDIA_TYPE_VIDEO:        return mapping::StreamType::Video;
			case AVMEDIA_TYPE_AUDIO:        return mapping::StreamType::Audio;
			case AVMEDIA_TYPE_SUBTITLE:     return mapping::StreamType::Subtitle;
			case AVMEDIA_TYPE_DATA:         return mapping::StreamType::Data;
			case AVMEDIA_TYPE_ATTACHMENT:   return mapping::StreamType::Attachment;

			default:                        return mapping::StreamType::Unknown;
		}
	}

	static int channel_count(const AVCodecParameters* cp)
	{
	#if LIBAVUTIL_VERSION_INT >= AV_VERSION_INT(57, 24, 100)
		return cp->ch_layout.nb_channels;
	#else
		return cp->channels;
	#endif
	}

	static std::map<std::string, std::string> dict_entries(AVDictionary* dict)
	{
		std::map<std::string, std::string> ret;

		AVDictionaryEntry* ent = nullptr;
		while((ent = av_dict_get(dict, "", ent, AV_DICT_IGNORE_SUFFIX)))
		{
			if(ent->key && ent->value)
				ret[util::lowercase(ent->key)] = ent->value;
		}

		return ret;
	}

	ProbeResult probeFile(const std::fs::path& path)
	{
		ProbeResult ret;

		// we only want the streams, not libav's opinions about them.
		av_log_set_level(AV_LOG_ERROR);

		AVFormatContext* ctx = nullptr;
		if(avformat_open_input(&ctx, path.string().c_str(), nullptr, nullptr) < 0)
		{
			ret.error = zpr::sprint("failed to open input file '%s'", path.string());
			return ret;
		}

		defer(avformat_close_input(&ctx));

		if(avformat_find_stream_info(ctx, nullptr) < 0)
		{
			ret.error = "failed to read streams";
			return ret;
		}

		for(unsigned int i = 0; i < ctx->nb_streams; i++)
		{
			auto strm = ctx->streams[i];
			auto cp = strm->codecpar;

			auto type = stream_type(cp->codec_type);
			int channels = (type == mapping::StreamType::Audio ? channel_count(cp) : 0);

			mapping::addStream(ret.streams, type, avcodec_get_name(cp->codec_id), channels, dict_entries(strm->metadata));
		}

		ret.valid = true;
		return ret;
	}

	ProbeResult runFFprobe(const std::string& program, const std::fs::path& path)
	{
		std::string sout;
		std::string serr;

		auto cmd = util::commandString(program, { "-v", "quiet", "-print_format", "json", "-show_streams",
			path.string() });

		tinyproclib::Process proc(cmd, "",
			[&sout](const char* bytes, size_t n) {
				sout += std::string(bytes, n);
			},
			[&serr](const char* bytes, size_t n) {
				serr += std::string(bytes, n);
			}
		);

		if(auto status = proc.get_exit_status(); status != 0)
		{
			ProbeResult ret;
			ret.error = zpr::sprint("%s exited with status %d%s", program, status,
				serr.empty() ? "" : zpr::sprint(": %s", util::trim(serr)));

			return ret;
		}

		return parseProbeDocument(sout);
	}
}
