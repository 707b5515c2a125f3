// arguments.cpp
// Copyright (c) 2014 - 2017, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#define ARG_HELP                    "--help"
#define ARG_ENCODE_AUDIO            "--encode-audio"
#define ARG_EXTRACT_SUBS            "--extract-subs"
#define ARG_REORDER_AUDIO           "--reorder-audio"
#define ARG_CONFIG_PATH             "--config"
#define ARG_OUTPUT_FOLDER           "--output-folder"
#define ARG_DRY_RUN                 "--dry-run"
#define ARG_VERBOSE                 "--verbose"
#define ARG_STOP_ON_ERROR           "--stop-on-error"
#define ARG_USE_FFPROBE             "--use-ffprobe"
#define ARG_FFMPEG_PROGRAM          "--ffmpeg"
#define ARG_FFPROBE_PROGRAM         "--ffprobe"
#define ARG_TARGET_CODEC            "--target-codec"
#define ARG_ENCODER                 "--encoder"
#define ARG_SELECTION_MODE          "--selection-mode"
#define ARG_SELECTED_CODECS         "--selected-codecs"
#define ARG_ADVANCED                "--advanced"
#define ARG_CUSTOM_OPTIONS          "--custom-options"
#define ARG_MAIN_OPTIONS            "--main-options"
#define ARG_ADVANCED_OPTIONS        "--advanced-options"
#define ARG_MAX_MUXING_QUEUE        "--max-muxing-queue-size"
#define ARG_SUBTITLE_LANGS          "--subtitle-langs"
#define ARG_NO_TITLE_IN_NAME        "--no-title-in-name"
#define ARG_SEARCH_STRING           "--search-string"
#define ARG_USE_RADARR              "--use-radarr"
#define ARG_RADARR_URL              "--radarr-url"
#define ARG_RADARR_API_KEY          "--radarr-api-key"
#define ARG_USE_SONARR              "--use-sonarr"
#define ARG_SONARR_URL              "--sonarr-url"
#define ARG_SONARR_API_KEY          "--sonarr-api-key"
#define ARG_LOOKUP_TIMEOUT          "--lookup-timeout"


static std::vector<std::pair<std::string, std::string>> helpList;
static void setupMap()
{
	helpList.push_back({ ARG_HELP,
		"show this help"
	});

	helpList.push_back({ ARG_ENCODE_AUDIO,
		"re-encode audio streams that are not already in the target codec"
	});

	helpList.push_back({ ARG_EXTRACT_SUBS,
		"extract ass/ssa subtitle streams into .ass files next to the input"
	});

	helpList.push_back({ ARG_REORDER_AUDIO,
		"move audio streams matching the search language to the front, and make the first one default"
	});

	helpList.push_back({ ARG_CONFIG_PATH + std::string(" <path>"),
		"set the path to the configuration file to use"
	});

	helpList.push_back({ ARG_OUTPUT_FOLDER + std::string(" <path_to_folder>"),
		"specify the output folder for transcoded files; will be created if it doesn't exist"
		" (cannot be the same as the input)"
	});

	helpList.push_back({ ARG_DRY_RUN,
		"print the ffmpeg commands, but do not run them"
	});

	helpList.push_back({ ARG_VERBOSE,
		"print debug messages"
	});

	helpList.push_back({ ARG_STOP_ON_ERROR,
		"exit immediately without processing further files, if any error is encountered"
	});

	helpList.push_back({ ARG_USE_FFPROBE,
		"probe files by running ffprobe instead of reading them with libavformat"
	});

	helpList.push_back({ ARG_FFMPEG_PROGRAM + std::string(" <path>"),
		"the ffmpeg program to run (default 'ffmpeg')"
	});

	helpList.push_back({ ARG_FFPROBE_PROGRAM + std::string(" <path>"),
		"the ffprobe program to run (default 'ffprobe')"
	});

	helpList.push_back({ ARG_TARGET_CODEC + std::string(" <codec>"),
		"the audio codec to convert to (default 'ac3')"
	});

	helpList.push_back({ ARG_ENCODER + std::string(" <encoder>"),
		"the ffmpeg encoder to use for the target codec (default 'ac3')"
	});

	helpList.push_back({ ARG_SELECTION_MODE + std::string(" <all|selected>"),
		"convert every audio stream, or only those in the selected codec list"
	});

	helpList.push_back({ ARG_SELECTED_CODECS + std::string(" <list>"),
		"a comma-separated list of source codecs to convert (eg. 'dts,truehd'); 'other' matches unknown codecs."
		" implies '--selection-mode selected'"
	});

	helpList.push_back({ ARG_ADVANCED,
		"use the custom encoder options instead of picking a channel count and bitrate"
	});

	helpList.push_back({ ARG_CUSTOM_OPTIONS + std::string(" <options>"),
		"per-stream encoder options (advanced mode)"
	});

	helpList.push_back({ ARG_MAIN_OPTIONS + std::string(" <options>"),
		"options placed before the input (advanced mode)"
	});

	helpList.push_back({ ARG_ADVANCED_OPTIONS + std::string(" <options>"),
		"options placed after the input (advanced mode)"
	});

	helpList.push_back({ ARG_MAX_MUXING_QUEUE + std::string(" <n>"),
		"the max_muxing_queue_size to use (1024 - 10240, default 2048)"
	});

	helpList.push_back({ ARG_SUBTITLE_LANGS + std::string(" <list>"),
		"a comma-separated list of languages for subtitles to extract (eg. '--subtitle-langs eng,jpn')"
	});

	helpList.push_back({ ARG_NO_TITLE_IN_NAME,
		"do not include the stream title in extracted subtitle file names"
	});

	helpList.push_back({ ARG_SEARCH_STRING + std::string(" <lang>"),
		"the language to move to the front when reordering audio (default 'eng')"
	});

	helpList.push_back({ ARG_USE_RADARR,
		"look up the original language of movies with radarr"
	});

	helpList.push_back({ ARG_RADARR_URL + std::string(" <url>"),
		"the radarr base url (default 'http://localhost:7878')"
	});

	helpList.push_back({ ARG_RADARR_API_KEY + std::string(" <api_key>"),
		"specify the api key for authenticating with radarr"
	});

	helpList.push_back({ ARG_USE_SONARR,
		"look up the original language of series with sonarr"
	});

	helpList.push_back({ ARG_SONARR_URL + std::string(" <url>"),
		"the sonarr base url (default 'http://localhost:8989')"
	});

	helpList.push_back({ ARG_SONARR_API_KEY + std::string(" <api_key>"),
		"specify the api key for authenticating with sonarr"
	});

	helpList.push_back({ ARG_LOOKUP_TIMEOUT + std::string(" <ms>"),
		"timeout for radarr/sonarr requests, in milliseconds (default 10000)"
	});
}

static void printHelp()
{
	if(helpList.empty())
		setupMap();

	printf("usage: streamplan [options] <inputs>\n\n");

	printf("options:\n");

	size_t maxl = 0;
	for(const auto& p : helpList)
	{
		if(p.first.length() > maxl)
			maxl = p.first.length();
	}

	maxl += 4;

	// ok
	for(const auto& [ opt, desc ] : helpList)
		printf("  %s%s%s\n", opt.c_str(), std::string(maxl - opt.length(), ' ').c_str(), desc.c_str());

	printf("\n");
}






namespace args
{
	// consumes the value after argv[i], or dies.
	static std::string expect_value(int argc, char** argv, int& i, const char* what)
	{
		if(i != argc - 1)
		{
			i++;
			return argv[i];
		}

		util::error("%serror:%s expected %s after '%s' option", COLOUR_RED_BOLD, COLOUR_RESET,
			what, argv[i]);
		exit(-1);
	}

	static int expect_number(int argc, char** argv, int& i)
	{
		auto opt = argv[i];
		auto str = expect_value(argc, argv, i, "(positive) integer");

		if(str.empty() || str.size() > 9 || str.find_first_not_of("0123456789") != std::string::npos)
		{
			util::error("%serror:%s expected (positive) integer after '%s' option", COLOUR_RED_BOLD, COLOUR_RESET,
				opt);
			exit(-1);
		}

		return std::stoi(str);
	}

	static std::vector<std::string> parseCommaSep(const std::string& s)
	{
		std::vector<std::string> ret;
		for(const auto& x : util::splitString(s, ','))
		{
			if(auto t = util::lowercase(util::trim(x)); !t.empty())
				ret.push_back(t);
		}

		return ret;
	}

	std::vector<std::string> parseCmdLineOpts(int argc, char** argv)
	{
		// quick thing: usually programs will not do anything if --help or --version is anywhere in the flags.
		for(int i = 1; i < argc; i++)
		{
			if(!strcmp(argv[i], ARG_HELP))
			{
				printHelp();
				exit(0);
			}
		}

		// the config path has to be read first, so the flags can override what's in it.
		for(int i = 1; i < argc - 1; i++)
		{
			if(!strcmp(argv[i], ARG_CONFIG_PATH))
				config::setConfigPath(argv[i + 1]);
		}


		std::vector<std::string> filenames;

		if(argc > 1)
		{
			// parse the command line opts
			for(int i = 1; i < argc; i++)
			{
				if(!strcmp(argv[i], ARG_ENCODE_AUDIO))
				{
					config::setIsEncodingAudio(true);
				}
				else if(!strcmp(argv[i], ARG_EXTRACT_SUBS))
				{
					config::setIsExtractingSubtitles(true);
				}
				else if(!strcmp(argv[i], ARG_REORDER_AUDIO))
				{
					config::setIsReorderingAudio(true);
				}
				else if(!strcmp(argv[i], ARG_CONFIG_PATH))
				{
					// already handled above.
					expect_value(argc, argv, i, "path");
				}
				else if(!strcmp(argv[i], ARG_OUTPUT_FOLDER))
				{
					config::setOutputFolder(expect_value(argc, argv, i, "path"));
				}
				else if(!strcmp(argv[i], ARG_DRY_RUN))
				{
					config::setIsDryRun(true);
				}
				else if(!strcmp(argv[i], ARG_VERBOSE))
				{
					config::setIsVerbose(true);
				}
				else if(!strcmp(argv[i], ARG_STOP_ON_ERROR))
				{
					config::setShouldStopOnError(true);
				}
				else if(!strcmp(argv[i], ARG_USE_FFPROBE))
				{
					config::setIsUsingFFprobe(true);
				}
				else if(!strcmp(argv[i], ARG_FFMPEG_PROGRAM))
				{
					config::setFFmpegProgram(expect_value(argc, argv, i, "path"));
				}
				else if(!strcmp(argv[i], ARG_FFPROBE_PROGRAM))
				{
					config::setFFprobeProgram(expect_value(argc, argv, i, "path"));
				}
				else if(!strcmp(argv[i], ARG_TARGET_CODEC))
				{
					config::setTargetCodec(expect_value(argc, argv, i, "codec name"));
				}
				else if(!strcmp(argv[i], ARG_ENCODER))
				{
					config::setEncoder(expect_value(argc, argv, i, "encoder name"));
				}
				else if(!strcmp(argv[i], ARG_SELECTION_MODE))
				{
					config::setCodecSelectionMode(expect_value(argc, argv, i, "'all' or 'selected'"));
				}
				else if(!strcmp(argv[i], ARG_SELECTED_CODECS))
				{
					config::setSelectedCodecs(parseCommaSep(expect_value(argc, argv, i, "codec list")));
					config::setCodecSelectionMode("selected");
				}
				else if(!strcmp(argv[i], ARG_ADVANCED))
				{
					config::setIsAdvancedEncoding(true);
				}
				else if(!strcmp(argv[i], ARG_CUSTOM_OPTIONS))
				{
					config::setCustomOptions(expect_value(argc, argv, i, "string"));
				}
				else if(!strcmp(argv[i], ARG_MAIN_OPTIONS))
				{
					config::setMainOptions(expect_value(argc, argv, i, "string"));
				}
				else if(!strcmp(argv[i], ARG_ADVANCED_OPTIONS))
				{
					config::setAdvancedOptions(expect_value(argc, argv, i, "string"));
				}
				else if(!strcmp(argv[i], ARG_MAX_MUXING_QUEUE))
				{
					config::setMaxMuxingQueueSize(expect_number(argc, argv, i));
				}
				else if(!strcmp(argv[i], ARG_SUBTITLE_LANGS))
				{
					config::setSubtitleLanguages(expect_value(argc, argv, i, "language list"));
				}
				else if(!strcmp(argv[i], ARG_NO_TITLE_IN_NAME))
				{
					config::setShouldIncludeTitleInFileName(false);
				}
				else if(!strcmp(argv[i], ARG_SEARCH_STRING))
				{
					config::setSearchString(expect_value(argc, argv, i, "language"));
				}
				else if(!strcmp(argv[i], ARG_USE_RADARR))
				{
					config::setIsUsingRadarr(true);
				}
				else if(!strcmp(argv[i], ARG_RADARR_URL))
				{
					config::setRadarrUrl(expect_value(argc, argv, i, "url"));
				}
				else if(!strcmp(argv[i], ARG_RADARR_API_KEY))
				{
					config::setRadarrApiKey(expect_value(argc, argv, i, "string"));
				}
				else if(!strcmp(argv[i], ARG_USE_SONARR))
				{
					config::setIsUsingSonarr(true);
				}
				else if(!strcmp(argv[i], ARG_SONARR_URL))
				{
					config::setSonarrUrl(expect_value(argc, argv, i, "url"));
				}
				else if(!strcmp(argv[i], ARG_SONARR_API_KEY))
				{
					config::setSonarrApiKey(expect_value(argc, argv, i, "string"));
				}
				else if(!strcmp(argv[i], ARG_LOOKUP_TIMEOUT))
				{
					config::setLookupTimeout(expect_number(argc, argv, i));
				}
				else if(argv[i][0] == '-')
				{
					util::error("%serror:%s unrecognised option '%s'", COLOUR_RED_BOLD, COLOUR_RESET,
						argv[i]);
					exit(-1);
				}
				else
				{
					filenames.push_back(argv[i]);
				}
			}
		}

		if(filenames.empty())
		{
			util::error("%serror:%s no input files",
				COLOUR_RED_BOLD, COLOUR_RESET);
			exit(-1);
		}

		if(!config::isEncodingAudio() && !config::isExtractingSubtitles() && !config::isReorderingAudio())
		{
			util::error("%serror:%s at least one of '%s', '%s' or '%s' must be specified",
				COLOUR_RED_BOLD, COLOUR_RESET, ARG_ENCODE_AUDIO, ARG_EXTRACT_SUBS, ARG_REORDER_AUDIO);
			exit(-1);
		}
		else if(config::getOutputFolder().empty() && !config::isDryRun()
			&& (config::isEncodingAudio() || config::isReorderingAudio()))
		{
			util::error("%serror:%s output folder must be specified ('%s') when transcoding",
				COLOUR_RED_BOLD, COLOUR_RESET, ARG_OUTPUT_FOLDER);
			exit(-1);
		}

		return filenames;
	}
}
