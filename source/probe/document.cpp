// document.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <algorithm>

#include "defs.h"
#include "probe.h"
#include "picojson.h"

namespace pj = picojson;

namespace probe
{
	static int get_channels(const pj::object& obj)
	{
		auto it = obj.find("channels");
		if(it == obj.end())
			return 0;

		// ffprobe writes a number, but some things write strings.
		if(it->second.is<double>())
			return std::max(0, static_cast<int>(it->second.get<double>()));

		if(it->second.is<std::string>())
		{
			auto s = util::trim(it->second.get<std::string>());
			if(s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 6)
				return 0;

			return std::stoi(s);
		}

		return 0;
	}

	ProbeResult parseProbeDocument(const std::string& json)
	{
		ProbeResult ret;

		pj::value doc;
		if(auto err = pj::parse(doc, json); !err.empty())
		{
			ret.error = zpr::sprint("malformed probe document: %s", err);
			return ret;
		}

		if(!doc.is<pj::object>() || !doc.contains("streams") || !doc.get("streams").is<pj::array>())
		{
			ret.error = "probe document has no 'streams' list";
			return ret;
		}

		for(const auto& s : doc.get("streams").get<pj::array>())
		{
			if(!s.is<pj::object>())
				continue;

			const auto& obj = s.get<pj::object>();

			auto get_string = [&obj](const std::string& key) -> std::string {
				if(auto it = obj.find(key); it != obj.end() && it->second.is<std::string>())
					return it->second.get<std::string>();

				return "";
			};

			std::map<std::string, std::string> tags;
			if(auto it = obj.find("tags"); it != obj.end() && it->second.is<pj::object>())
			{
				for(const auto& [ k, v ] : it->second.get<pj::object>())
				{
					if(v.is<std::string>())
						tags[util::lowercase(k)] = v.get<std::string>();
				}
			}

			mapping::addStream(ret.streams, mapping::typeFromName(get_string("codec_type")), get_string("codec_name"),
				get_channels(obj), tags);
		}

		ret.valid = true;
		return ret;
	}
}
