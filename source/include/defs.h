// defs.h
// Copyright (c) 2014 - 2017, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once
#include <ctype.h>
#include <stdio.h>
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>
#include <filesystem>
#include <string_view>
#include <type_traits>

#include "zpr.h"
#include "observer.h"

#define COLOUR_RESET			"\033[0m"
#define COLOUR_BLACK			"\033[30m"			// Black
#define COLOUR_RED				"\033[31m"			// Red
#define COLOUR_GREEN			"\033[32m"			// Green
#define COLOUR_YELLOW			"\033[33m"			// Yellow
#define COLOUR_BLUE				"\033[34m"			// Blue
#define COLOUR_MAGENTA			"\033[35m"			// Magenta
#define COLOUR_CYAN				"\033[36m"			// Cyan
#define COLOUR_WHITE			"\033[37m"			// White
#define COLOUR_BLACK_BOLD		"\033[1m"			// Bold Black
#define COLOUR_RED_BOLD			"\033[1m\033[31m"	// Bold Red
#define COLOUR_GREEN_BOLD		"\033[1m\033[32m"	// Bold Green
#define COLOUR_YELLOW_BOLD		"\033[1m\033[33m"	// Bold Yellow
#define COLOUR_BLUE_BOLD		"\033[1m\033[34m"	// Bold Blue
#define COLOUR_MAGENTA_BOLD		"\033[1m\033[35m"	// Bold Magenta
#define COLOUR_CYAN_BOLD		"\033[1m\033[36m"	// Bold Cyan
#define COLOUR_WHITE_BOLD		"\033[1m\033[37m"	// Bold White
#define COLOUR_GREY_BOLD		"\033[30;1m"		// Bold Grey


namespace mapping
{
	struct CodecPolicy;
	struct SubtitlePolicy;
	struct ReorderPolicy;
}

namespace lang
{
	class LookupService;
	struct ResolverConfig;
}

namespace std
{
	namespace fs = filesystem;
}

namespace util
{
	void indent_log(int n = 1);
	void unindent_log(int n = 1);

	int get_log_indent();

	template <typename... Args>
	static void error(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			fprintf(stderr, "  ");

		fprintf(stderr, " %s*%s %s\n", COLOUR_RED_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void log(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_GREEN_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void info(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_BLUE_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void warn(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_YELLOW_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void debug(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_GREY_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	// forwards everything from the mapping core to the functions above.
	struct ConsoleObserver : Observer
	{
		explicit ConsoleObserver(bool verbose) : verbose(verbose) { }
		void message(LogLevel level, const std::string& msg) override;

		bool verbose = false;
	};


	size_t getFileSize(const std::string& path);
	std::pair<uint8_t*, size_t> readEntireFile(const std::string& path);

	static inline std::vector<std::string> splitString(std::string view, char delim = '\n')
	{
		std::vector<std::string> ret;

		while(true)
		{
			size_t ln = view.find(delim);

			if(ln != std::string_view::npos)
			{
				ret.emplace_back(view.data(), ln);
				view = view.substr(ln + 1);
			}
			else
			{
				break;
			}
		}

		// account for the case when there's no trailing newline, and we still have some stuff stuck in the view.
		if(!view.empty())
			ret.emplace_back(view.data(), view.length());

		return ret;
	}

	// like python's str.split() -- runs of whitespace separate, and there are no empty pieces.
	static inline std::vector<std::string> splitWhitespace(const std::string& s)
	{
		std::vector<std::string> ret;

		size_t i = 0;
		while(i < s.size())
		{
			while(i < s.size() && isspace(static_cast<unsigned char>(s[i])))
				i++;

			size_t start = i;
			while(i < s.size() && !isspace(static_cast<unsigned char>(s[i])))
				i++;

			if(i > start)
				ret.push_back(s.substr(start, i - start));
		}

		return ret;
	}

	static inline std::string trim(const std::string& s)
	{
		auto ltrim = [](std::string_view& s) -> std::string_view& {
			auto i = s.find_first_not_of(" \t\n\r\f\v");
			if(i != std::string::npos) s.remove_prefix(i);
			else                       s = s.substr(0, 0);

			return s;
		};

		auto rtrim = [](std::string_view& s) -> std::string_view& {
			auto i = s.find_last_not_of(" \t\n\r\f\v");
			if(i != std::string::npos) s = s.substr(0, i + 1);

			return s;
		};

		std::string_view sv = s;
		return std::string(ltrim(rtrim(sv)));
	}

	static inline std::string lowercase(std::string xs)
	{
		for(size_t i = 0; i < xs.size(); i++)
			xs[i] = static_cast<char>(tolower(static_cast<unsigned char>(xs[i])));

		return xs;
	}

	static inline std::string join(const std::vector<std::string>& xs, const std::string& sep)
	{
		std::string ret;
		for(size_t i = 0; i < xs.size(); i++)
			ret += (i == 0 ? "" : sep) + xs[i];

		return ret;
	}

	template <typename T, typename... Args>
	static bool match(const T& first, Args&&... rest)
	{
		return ((first == rest) || ...);
	}

	template <typename T>
	static bool contains(const std::vector<T>& xs, const T& x)
	{
		for(const auto& y : xs)
			if(y == x) return true;

		return false;
	}

	static inline std::string plural(const std::string& s, size_t n)
	{
		return n == 1 ? s : s + "s";
	}

	std::string getEnvironmentVar(const std::string& name);

	// quotes for /bin/sh, so a file name with spaces survives the trip.
	std::string shellQuote(const std::string& s);
	std::string commandString(const std::string& program, const std::vector<std::string>& args);
}

namespace args
{
	std::vector<std::string> parseCmdLineOpts(int argc, char** argv);
}

namespace config
{
	void readConfig();

	std::string getConfigPath();
	std::string getOutputFolder();
	std::string getFFmpegProgram();
	std::string getFFprobeProgram();

	bool isDryRun();
	bool isVerbose();
	bool shouldStopOnError();
	bool isUsingFFprobe();

	bool isEncodingAudio();
	bool isExtractingSubtitles();
	bool isReorderingAudio();

	mapping::CodecPolicy getCodecPolicy();
	mapping::SubtitlePolicy getSubtitlePolicy();
	mapping::ReorderPolicy getReorderPolicy();
	lang::ResolverConfig getResolverConfig();

	std::string getTargetCodec();
	std::string getEncoder();
	std::string getCodecSelectionMode();
	std::vector<std::string> getSelectedCodecs();
	bool isAdvancedEncoding();
	std::string getCustomOptions();
	std::string getMainOptions();
	std::string getAdvancedOptions();
	int getMaxMuxingQueueSize();

	std::string getSubtitleLanguages();
	bool shouldIncludeTitleInFileName();

	std::string getSearchString();
	bool isUsingRadarr();
	bool isUsingSonarr();
	std::string getRadarrUrl();
	std::string getRadarrApiKey();
	std::string getSonarrUrl();
	std::string getSonarrApiKey();
	int getLookupTimeout();


	void setConfigPath(const std::string& x);
	void setOutputFolder(const std::string& x);
	void setFFmpegProgram(const std::string& x);
	void setFFprobeProgram(const std::string& x);

	void setIsDryRun(bool x);
	void setIsVerbose(bool x);
	void setShouldStopOnError(bool x);
	void setIsUsingFFprobe(bool x);

	void setIsEncodingAudio(bool x);
	void setIsExtractingSubtitles(bool x);
	void setIsReorderingAudio(bool x);

	void setTargetCodec(const std::string& x);
	void setEncoder(const std::string& x);
	void setCodecSelectionMode(const std::string& x);
	void setSelectedCodecs(const std::vector<std::string>& xs);
	void setIsAdvancedEncoding(bool x);
	void setCustomOptions(const std::string& x);
	void setMainOptions(const std::string& x);
	void setAdvancedOptions(const std::string& x);
	void setMaxMuxingQueueSize(int x);

	void setSubtitleLanguages(const std::string& x);
	void setShouldIncludeTitleInFileName(bool x);

	void setSearchString(const std::string& x);
	void setIsUsingRadarr(bool x);
	void setIsUsingSonarr(bool x);
	void setRadarrUrl(const std::string& x);
	void setRadarrApiKey(const std::string& x);
	void setSonarrUrl(const std::string& x);
	void setSonarrApiKey(const std::string& x);
	void setLookupTimeout(int x);
}

namespace probe
{
	struct ProbeResult;
}

namespace driver
{
	void createOutputFolder();
	std::vector<std::fs::path> collectFiles(const std::vector<std::string>& files);
	bool processOneFile(const std::fs::path& filepath);

	// libavformat, or ffprobe if that's what was asked for.
	probe::ProbeResult probeStreams(const std::fs::path& filepath);

	// prints the command; runs it unless this is a dry run.
	bool runTranscoder(const std::vector<std::string>& args);

	// where a transcode of 'original' goes, given the file it's currently reading from.
	std::fs::path outputPath(const std::fs::path& original, const std::fs::path& current);
	bool finishOutput(const std::fs::path& written, const std::fs::path& original);
}

namespace plugins
{
	// 'original' is what the user gave us, 'current' is what the previous plugin left behind
	// (the same file if nothing ran yet). on success, current is updated to the new file.
	bool encodeAudio(const std::fs::path& original, std::fs::path& current);
	bool extractSubtitles(const std::fs::path& original, std::fs::path& current);
	bool reorderAudio(const std::fs::path& original, std::fs::path& current);

	// same, but with the given services instead of the configured radarr and sonarr.
	bool reorderAudio(const std::fs::path& original, std::fs::path& current, lang::LookupService* radarr,
		lang::LookupService* sonarr);
}





// defer implementation
// credit: gingerBill
// shamelessly stolen from https://github.com/gingerBill/gb


namespace __dontlook
{
	// NOTE(bill): Stupid fucking templates
	template <typename T> struct gbRemoveReference       { typedef T Type; };
	template <typename T> struct gbRemoveReference<T &>  { typedef T Type; };
	template <typename T> struct gbRemoveReference<T &&> { typedef T Type; };

	/// NOTE(bill): "Move" semantics - invented because the C++ committee are idiots (as a collective not as indiviuals (well a least some aren't))
	template <typename T> inline T &&gb_forward(typename gbRemoveReference<T>::Type &t)  { return static_cast<T &&>(t); }
	template <typename T> inline T &&gb_forward(typename gbRemoveReference<T>::Type &&t) { return static_cast<T &&>(t); }
	template <typename T> inline T &&gb_move   (T &&t)                                   { return static_cast<typename gbRemoveReference<T>::Type &&>(t); }
	template <typename F>
	struct gbprivDefer {
		F f;
		gbprivDefer(F &&f) : f(gb_forward<F>(f)) {}
		~gbprivDefer() { f(); }
	};
	template <typename F> gbprivDefer<F> gb__defer_func(F &&f) { return gbprivDefer<F>(gb_forward<F>(f)); }
}

#define GB_DEFER_1(x, y) x##y
#define GB_DEFER_2(x, y) GB_DEFER_1(x, y)
#define GB_DEFER_3(x)    GB_DEFER_2(x, __COUNTER__)
#define defer(code) auto GB_DEFER_3(_defer_) = __dontlook::gb__defer_func([&]()->void{code;})
