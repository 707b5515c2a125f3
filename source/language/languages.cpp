// languages.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <unordered_map>

#include "defs.h"
#include "lang.h"

namespace lang
{
	// iso 639-3 codes, and the english names that radarr/sonarr (and iso 639-3 itself) use for them.
	// the first name is the canonical one.
	static const std::unordered_map<std::string, std::vector<std::string>> languageCodeMap = {
		{ "afr", { "Afrikaans" } },
		{ "sqi", { "Albanian" } },
		{ "amh", { "Amharic" } },
		{ "ara", { "Arabic" } },
		{ "hye", { "Armenian" } },
		{ "aze", { "Azerbaijani" } },
		{ "eus", { "Basque" } },
		{ "bel", { "Belarusian" } },
		{ "ben", { "Bengali" } },
		{ "bos", { "Bosnian" } },
		{ "bul", { "Bulgarian" } },
		{ "mya", { "Burmese" } },
		{ "cat", { "Catalan", "Valencian" } },
		{ "zho", { "Chinese" } },
		{ "yue", { "Cantonese", "Yue Chinese" } },
		{ "cmn", { "Mandarin", "Mandarin Chinese" } },
		{ "hrv", { "Croatian" } },
		{ "ces", { "Czech" } },
		{ "dan", { "Danish" } },
		{ "nld", { "Dutch", "Flemish" } },
		{ "eng", { "English" } },
		{ "est", { "Estonian" } },
		{ "fao", { "Faroese" } },
		{ "fil", { "Filipino", "Pilipino" } },
		{ "fin", { "Finnish" } },
		{ "fra", { "French" } },
		{ "glg", { "Galician" } },
		{ "kat", { "Georgian" } },
		{ "deu", { "German" } },
		{ "ell", { "Modern Greek (1453-)", "Greek" } },
		{ "guj", { "Gujarati" } },
		{ "heb", { "Hebrew" } },
		{ "hin", { "Hindi" } },
		{ "hun", { "Hungarian" } },
		{ "isl", { "Icelandic" } },
		{ "ind", { "Indonesian" } },
		{ "gle", { "Irish" } },
		{ "ita", { "Italian" } },
		{ "jpn", { "Japanese" } },
		{ "kan", { "Kannada" } },
		{ "kaz", { "Kazakh" } },
		{ "khm", { "Khmer", "Central Khmer" } },
		{ "kor", { "Korean" } },
		{ "kur", { "Kurdish" } },
		{ "lao", { "Lao" } },
		{ "lat", { "Latin" } },
		{ "lav", { "Latvian" } },
		{ "lit", { "Lithuanian" } },
		{ "ltz", { "Luxembourgish", "Letzeburgesch" } },
		{ "mkd", { "Macedonian" } },
		{ "msa", { "Malay (macrolanguage)", "Malay" } },
		{ "mal", { "Malayalam" } },
		{ "mlt", { "Maltese" } },
		{ "mri", { "Maori" } },
		{ "mar", { "Marathi" } },
		{ "mon", { "Mongolian" } },
		{ "nep", { "Nepali (macrolanguage)", "Nepali" } },
		{ "nor", { "Norwegian" } },
		{ "nob", { "Norwegian Bokmål", "Norwegian Bokmal" } },
		{ "nno", { "Norwegian Nynorsk" } },
		{ "fas", { "Persian", "Farsi" } },
		{ "pol", { "Polish" } },
		{ "por", { "Portuguese", "Portuguese (Brazil)" } },
		{ "pan", { "Panjabi", "Punjabi" } },
		{ "ron", { "Romanian", "Moldavian", "Moldovan" } },
		{ "roh", { "Romansh" } },
		{ "rus", { "Russian" } },
		{ "srp", { "Serbian" } },
		{ "sin", { "Sinhala", "Sinhalese" } },
		{ "slk", { "Slovak" } },
		{ "slv", { "Slovenian" } },
		{ "som", { "Somali" } },
		{ "spa", { "Spanish", "Castilian", "Spanish (Latin)" } },
		{ "swa", { "Swahili (macrolanguage)", "Swahili" } },
		{ "swe", { "Swedish" } },
		{ "tgl", { "Tagalog" } },
		{ "tam", { "Tamil" } },
		{ "tel", { "Telugu" } },
		{ "tha", { "Thai" } },
		{ "bod", { "Tibetan" } },
		{ "tur", { "Turkish" } },
		{ "ukr", { "Ukrainian" } },
		{ "urd", { "Urdu" } },
		{ "uzb", { "Uzbek" } },
		{ "vie", { "Vietnamese" } },
		{ "cym", { "Welsh" } },
		{ "yid", { "Yiddish" } },
		{ "zul", { "Zulu" } },
	};

	std::string codeForLanguageName(const std::string& name)
	{
		auto n = util::lowercase(util::trim(name));
		if(n.empty())
			return "";

		for(const auto& [ code, names ] : languageCodeMap)
		{
			for(const auto& x : names)
			{
				if(util::lowercase(x) == n)
					return code;
			}
		}

		return "";
	}

	std::vector<std::string> namesForCode(const std::string& code)
	{
		if(auto it = languageCodeMap.find(util::lowercase(code)); it != languageCodeMap.end())
			return it->second;

		return { };
	}
}
