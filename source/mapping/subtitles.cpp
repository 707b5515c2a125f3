// subtitles.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "mapping.h"

namespace mapping
{
	std::vector<std::string> parseLanguageList(const std::string& list)
	{
		std::vector<std::string> ret;
		for(const auto& piece : util::splitString(list, ','))
		{
			auto lang = util::lowercase(util::trim(piece));
			if(lang.empty())
				continue;

			// "pt br" -> "pt-br"
			for(auto& c : lang)
			{
				if(isspace(static_cast<unsigned char>(c)))
					c = '-';
			}

			ret.push_back(lang);
		}

		return ret;
	}

	std::string extractionTag(const Stream& strm, size_t position, bool includeTitle)
	{
		std::string tag;

		// eg. 'eng', 'fra'
		if(auto lang = util::lowercase(strm.tag("language")); !lang.empty())
			tag += "." + lang;

		// eg. 'English', 'Signs & Songs'
		if(auto title = strm.tag("title"); !title.empty() && includeTitle)
			tag += "." + title;

		// no tags, so just number it.
		if(tag.empty())
			tag = zpr::sprint(".%d", position);

		// this ends up in a filename, so no whitespace or slashes.
		for(auto& c : tag)
		{
			if(isspace(static_cast<unsigned char>(c)) || c == '/' || c == '\\')
				c = '-';
		}

		return tag;
	}

	std::string extractedLanguages(const StreamInventory& streams, const std::vector<std::string>& filter)
	{
		std::vector<std::string> langs;
		for(const auto& strm : streams)
		{
			if(strm.type != StreamType::Subtitle)
				continue;

			auto lang = strm.tag("language");
			if(lang.empty())
				continue;

			if(!filter.empty() && !util::contains(filter, util::lowercase(lang)))
				continue;

			langs.push_back(lang);
		}

		return util::join(langs, " ");
	}




	SubtitleExtraction::SubtitleExtraction(const SubtitlePolicy& policy) : pol(policy)
	{
		this->langs = parseLanguageList(this->pol.languages);
	}

	bool SubtitleExtraction::handlesType(StreamType type) const
	{
		return type == StreamType::Subtitle;
	}

	bool SubtitleExtraction::alreadyExtracted() const
	{
		return !util::trim(this->pol.priorMarker).empty();
	}

	bool SubtitleExtraction::test(const Stream& strm) const
	{
		if(!util::match(util::lowercase(strm.codecName), "ass", "ssa"))
			return false;

		// no languages means extract everything.
		if(this->langs.empty())
			return true;

		return util::contains(this->langs, util::lowercase(strm.tag("language")));
	}

	Classification SubtitleExtraction::classify(const Stream& strm, size_t position, Buckets& buckets,
		util::Observer* obs) const
	{
		Classification ret;
		if(!this->test(strm))
			return ret;

		Extraction ex;
		ex.index = position;
		ex.tag = extractionTag(strm, position, this->pol.includeTitle);
		ex.mapping = { "-map", selector(StreamType::Subtitle, position) };

		util::notify(obs, util::LogLevel::Debug, "extracting subtitle stream %d as '%s'", position, ex.tag);
		buckets.extractions.push_back(ex);

		// the primary output just gets a copy.
		ret.needsProcessing = true;
		ret.mapping = { "-map", selector(StreamType::Subtitle, position) };
		ret.encoding = { zpr::sprint("-c:s:%d", position), "copy" };

		return ret;
	}

	void SubtitleExtraction::assemble(const Buckets& buckets, MappingPlan& plan, util::Observer* obs) const
	{
		plan.extractions = buckets.extractions;

		if(this->alreadyExtracted())
		{
			util::notify(obs, util::LogLevel::Info, "subtitles were already extracted (%s)", this->pol.priorMarker);
			plan.needsProcessing = false;
		}
	}
}
