// bitrate.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <algorithm>

#include "mapping.h"

namespace mapping
{
	int clampChannels(int channels)
	{
		return std::min(channels, MAX_AC3_CHANNELS);
	}

	std::string bitrateForChannels(int channels)
	{
		// no channel count means we don't know any better, so use the best ac3 can do.
		if(channels <= 0)
			return "640";

		channels = clampChannels(channels);

		if(channels <= 2)       return "224";
		else if(channels <= 4)  return "448";
		else                    return "640";
	}
}
