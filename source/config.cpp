// config.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <algorithm>

#include "defs.h"
#include "lang.h"
#include "mapping.h"

#include "picojson.h"

namespace pj = picojson;

namespace config
{
	static std::fs::path getDefaultConfigPath()
	{
		auto home = std::fs::path(util::getEnvironmentVar("HOME"));
		if(!home.empty())
		{
			auto x = home / ".config" / "streamplan" / "config.json";
			if(std::fs::exists(x))
				return x;
		}

		if(std::fs::exists("streamplan-config.json"))
			return std::fs::path("streamplan-config.json");

		if(std::fs::exists(".streamplan-config.json"))
			return std::fs::path(".streamplan-config.json");

		return "";
	}

	template <typename... Args>
	void error(const std::string& fmt, Args&&... args)
	{
		util::error(fmt, args...);
	}

	static pj::object get_object(const pj::object& opts, const std::string& key)
	{
		if(auto it = opts.find(key); it != opts.end())
		{
			if(it->second.is<pj::object>())
				return it->second.get<pj::object>();

			else
				error("expected object value for '%s'", key);
		}

		return { };
	}

	static std::string get_string(const pj::object& opts, const std::string& key, const std::string& def)
	{
		if(auto it = opts.find(key); it != opts.end())
		{
			if(it->second.is<std::string>())
				return it->second.get<std::string>();

			else
				error("expected string value for '%s'", key);
		}

		return def;
	}

	static bool get_bool(const pj::object& opts, const std::string& key, bool def)
	{
		if(auto it = opts.find(key); it != opts.end())
		{
			if(it->second.is<bool>())
				return it->second.get<bool>();

			else
				error("expected boolean value for '%s'", key);
		}

		return def;
	}

	static int get_int(const pj::object& opts, const std::string& key, int def)
	{
		if(auto it = opts.find(key); it != opts.end())
		{
			if(it->second.is<double>())
				return static_cast<int>(it->second.get<double>());

			else
				error("expected integer value for '%s'", key);
		}

		return def;
	}

	static std::vector<std::string> get_strings(const pj::object& opts, const std::string& key, const std::vector<std::string>& def)
	{
		if(auto it = opts.find(key); it != opts.end())
		{
			if(!it->second.is<pj::array>())
			{
				error("expected array value for '%s'", key);
				return def;
			}

			std::vector<std::string> ret;
			for(const auto& v : it->second.get<pj::array>())
			{
				if(v.is<std::string>()) ret.push_back(v.get<std::string>());
				else                    error("expected string value in '%s'", key);
			}

			return ret;
		}

		return def;
	}

	static void readConfigFile(const std::fs::path& path)
	{
		// read it.
		uint8_t* buf = 0; size_t sz = 0;
		std::tie(buf, sz) = util::readEntireFile(path.string());
		if(!buf || sz == 0)
		{
			error("failed to read file");
			delete[] buf;
			return;
		}

		defer(delete[] buf);

		pj::value config;

		auto begin = buf;
		auto end = buf + sz;
		std::string err;
		pj::parse(config, begin, end, &err);
		if(!err.empty())
		{
			error("%s", err);
			return;
		}

		// the top-level object should be "options".
		if(!config.is<pj::object>() || !config.contains("options") || !config.get("options").is<pj::object>())
		{
			error("no top-level 'options' object");
			return;
		}

		auto opts = config.get("options").get<pj::object>();

		if(auto x = get_string(opts, "output-folder", ""); !x.empty())
			setOutputFolder(x);

		setFFmpegProgram(get_string(opts, "ffmpeg", getFFmpegProgram()));
		setFFprobeProgram(get_string(opts, "ffprobe", getFFprobeProgram()));
		setIsUsingFFprobe(get_bool(opts, "use-ffprobe", false));
		setShouldStopOnError(get_bool(opts, "stop-on-first-error", false));
		setIsVerbose(get_bool(opts, "verbose", false));

		{
			auto enc = get_object(opts, "encode-audio");

			setIsEncodingAudio(get_bool(enc, "enabled", false));
			setTargetCodec(get_string(enc, "target-codec", getTargetCodec()));
			setEncoder(get_string(enc, "encoder", getEncoder()));
			setCodecSelectionMode(get_string(enc, "codec-selection-mode", getCodecSelectionMode()));
			setSelectedCodecs(get_strings(enc, "selected-codecs", getSelectedCodecs()));
			setIsAdvancedEncoding(get_bool(enc, "advanced", false));
			setCustomOptions(get_string(enc, "custom-options", ""));
			setMainOptions(get_string(enc, "main-options", ""));
			setAdvancedOptions(get_string(enc, "advanced-options", ""));
			setMaxMuxingQueueSize(get_int(enc, "max-muxing-queue-size", getMaxMuxingQueueSize()));
		}

		{
			auto ext = get_object(opts, "extract-subtitles");

			setIsExtractingSubtitles(get_bool(ext, "enabled", false));
			setSubtitleLanguages(get_string(ext, "languages", ""));
			setShouldIncludeTitleInFileName(get_bool(ext, "include-title-in-file-name", true));
		}

		{
			auto ro = get_object(opts, "reorder-audio");

			setIsReorderingAudio(get_bool(ro, "enabled", false));
			setSearchString(get_string(ro, "search-string", getSearchString()));
			setIsUsingRadarr(get_bool(ro, "use-radarr", false));
			setRadarrUrl(get_string(ro, "radarr-url", getRadarrUrl()));
			setRadarrApiKey(get_string(ro, "radarr-api-key", ""));
			setIsUsingSonarr(get_bool(ro, "use-sonarr", false));
			setSonarrUrl(get_string(ro, "sonarr-url", getSonarrUrl()));
			setSonarrApiKey(get_string(ro, "sonarr-api-key", ""));
			setLookupTimeout(get_int(ro, "lookup-timeout-ms", getLookupTimeout()));
		}
	}

	void readConfig()
	{
		// if there's a manual one, use that.
		if(auto cp = getConfigPath(); !cp.empty())
		{
			if(!std::fs::exists(cp))
			{
				util::error("specified configuration file '%s' does not exist", cp);
				return;
			}

			readConfigFile(cp);
			return;
		}

		// it's ok not to have one.
		if(auto cp = getDefaultConfigPath(); !cp.empty())
			readConfigFile(cp);
	}



















	static std::string configPath;
	static std::string outputFolder;
	static std::string ffmpegProgram = "ffmpeg";
	static std::string ffprobeProgram = "ffprobe";

	static bool dryrun = false;
	static bool verbose = false;
	static bool useFFprobe = false;
	static bool stopOnError = false;

	static bool encodeAudio = false;
	static bool extractSubs = false;
	static bool reorderAudio = false;

	static std::string targetCodec = "ac3";
	static std::string encoder = "ac3";
	static std::string selectionMode = "all";
	static std::vector<std::string> selectedCodecs = { "dts", "dca", "truehd", "mp3", "mp2", "aac" };
	static bool advancedEncoding = false;
	static std::string customOptions;
	static std::string mainOptions;
	static std::string advancedOptions;
	static int maxMuxingQueueSize = 2048;

	static std::string subtitleLanguages;
	static bool includeTitleInName = true;

	static std::string searchString = "eng";
	static bool useRadarr = false;
	static bool useSonarr = false;
	static std::string radarrUrl = "http://localhost:7878";
	static std::string radarrApiKey;
	static std::string sonarrUrl = "http://localhost:8989";
	static std::string sonarrApiKey;
	static int lookupTimeout = 10000;


	mapping::CodecPolicy getCodecPolicy()
	{
		mapping::CodecPolicy ret;
		ret.targetCodec         = targetCodec;
		ret.encoder             = encoder;
		ret.mode                = (selectionMode == "selected" ? mapping::SelectionMode::Selected : mapping::SelectionMode::All);
		ret.selectedCodecs      = selectedCodecs;
		ret.advanced            = advancedEncoding;
		ret.customOptions       = customOptions;
		ret.mainOptions         = mainOptions;
		ret.advancedOptions     = advancedOptions;
		ret.maxMuxingQueueSize  = maxMuxingQueueSize;

		return ret;
	}

	mapping::SubtitlePolicy getSubtitlePolicy()
	{
		mapping::SubtitlePolicy ret;
		ret.languages       = subtitleLanguages;
		ret.includeTitle    = includeTitleInName;

		return ret;
	}

	mapping::ReorderPolicy getReorderPolicy()
	{
		mapping::ReorderPolicy ret;
		ret.searchString = searchString;

		return ret;
	}

	lang::ResolverConfig getResolverConfig()
	{
		lang::ResolverConfig ret;
		ret.searchString    = searchString;
		ret.useRadarr       = useRadarr;
		ret.radarr          = { radarrUrl, radarrApiKey, lookupTimeout };
		ret.useSonarr       = useSonarr;
		ret.sonarr          = { sonarrUrl, sonarrApiKey, lookupTimeout };

		return ret;
	}


	std::string getConfigPath()                     { return configPath; }
	std::string getOutputFolder()                   { return outputFolder; }
	std::string getFFmpegProgram()                  { return ffmpegProgram; }
	std::string getFFprobeProgram()                 { return ffprobeProgram; }
	bool isDryRun()                                 { return dryrun; }
	bool isVerbose()                                { return verbose; }
	bool isUsingFFprobe()                           { return useFFprobe; }
	bool shouldStopOnError()                        { return stopOnError; }
	bool isEncodingAudio()                          { return encodeAudio; }
	bool isExtractingSubtitles()                    { return extractSubs; }
	bool isReorderingAudio()                        { return reorderAudio; }
	std::string getTargetCodec()                    { return targetCodec; }
	std::string getEncoder()                        { return encoder; }
	std::string getCodecSelectionMode()             { return selectionMode; }
	std::vector<std::string> getSelectedCodecs()    { return selectedCodecs; }
	bool isAdvancedEncoding()                       { return advancedEncoding; }
	std::string getCustomOptions()                  { return customOptions; }
	std::string getMainOptions()                    { return mainOptions; }
	std::string getAdvancedOptions()                { return advancedOptions; }
	int getMaxMuxingQueueSize()                     { return maxMuxingQueueSize; }
	std::string getSubtitleLanguages()              { return subtitleLanguages; }
	bool shouldIncludeTitleInFileName()             { return includeTitleInName; }
	std::string getSearchString()                   { return searchString; }
	bool isUsingRadarr()                            { return useRadarr; }
	bool isUsingSonarr()                            { return useSonarr; }
	std::string getRadarrUrl()                      { return radarrUrl; }
	std::string getRadarrApiKey()                   { return radarrApiKey; }
	std::string getSonarrUrl()                      { return sonarrUrl; }
	std::string getSonarrApiKey()                   { return sonarrApiKey; }
	int getLookupTimeout()                          { return lookupTimeout; }

	void setOutputFolder(const std::string& x)      { outputFolder = x; }
	void setFFmpegProgram(const std::string& x)     { ffmpegProgram = x; }
	void setFFprobeProgram(const std::string& x)    { ffprobeProgram = x; }
	void setIsDryRun(bool x)                        { dryrun = x; }
	void setIsVerbose(bool x)                       { verbose = x; }
	void setIsUsingFFprobe(bool x)                  { useFFprobe = x; }
	void setShouldStopOnError(bool x)               { stopOnError = x; }
	void setIsEncodingAudio(bool x)                 { encodeAudio = x; }
	void setIsExtractingSubtitles(bool x)           { extractSubs = x; }
	void setIsReorderingAudio(bool x)               { reorderAudio = x; }
	void setTargetCodec(const std::string& x)       { targetCodec = util::lowercase(util::trim(x)); }
	void setEncoder(const std::string& x)           { encoder = util::trim(x); }
	void setSelectedCodecs(const std::vector<std::string>& xs) { selectedCodecs = xs; }
	void setIsAdvancedEncoding(bool x)              { advancedEncoding = x; }
	void setCustomOptions(const std::string& x)     { customOptions = x; }
	void setMainOptions(const std::string& x)       { mainOptions = x; }
	void setAdvancedOptions(const std::string& x)   { advancedOptions = x; }
	void setSubtitleLanguages(const std::string& x) { subtitleLanguages = x; }
	void setShouldIncludeTitleInFileName(bool x)    { includeTitleInName = x; }
	void setSearchString(const std::string& x)      { searchString = x; }
	void setIsUsingRadarr(bool x)                   { useRadarr = x; }
	void setIsUsingSonarr(bool x)                   { useSonarr = x; }
	void setRadarrUrl(const std::string& x)         { radarrUrl = x; }
	void setRadarrApiKey(const std::string& x)      { radarrApiKey = x; }
	void setSonarrUrl(const std::string& x)         { sonarrUrl = x; }
	void setSonarrApiKey(const std::string& x)      { sonarrApiKey = x; }

	void setCodecSelectionMode(const std::string& x)
	{
		auto mode = util::lowercase(util::trim(x));
		if(!util::match(mode, "all", "selected"))
		{
			error("invalid codec selection mode '%s' (expected 'all' or 'selected')", x);
			return;
		}

		selectionMode = mode;
	}

	void setMaxMuxingQueueSize(int x)
	{
		// anything outside this is either useless or asking for trouble.
		if(x < 1024 || x > 10240)
			util::warn("max muxing queue size %d is out of range, clamping to [1024, 10240]", x);

		maxMuxingQueueSize = std::clamp(x, 1024, 10240);
	}

	void setLookupTimeout(int x)
	{
		if(x <= 0)
		{
			error("lookup timeout must be positive (got %d)", x);
			return;
		}

		lookupTimeout = x;
	}

	void setConfigPath(const std::string& x)
	{
		// this one is special. once we set it, we wanna re-read the config.
		configPath = x;
		readConfig();
	}
}
