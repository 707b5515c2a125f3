// utils.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#ifdef _WIN32
	#define WIN32_LEAN_AND_MEAN 1

	#ifndef NOMINMAX
		#define NOMINMAX
	#endif

	#include <windows.h>
#else
	#include <errno.h>
	#include <unistd.h>
	#include <sys/stat.h>
#endif

#include <stdlib.h>
#include <fstream>
#include <algorithm>

namespace util
{
	std::string getEnvironmentVar(const std::string& name)
	{
	#ifdef _WIN32
		char buffer[256] = { 0 };
		size_t len = 0;

		if(getenv_s(&len, buffer, name.c_str()) != 0)
			return "";

		else
			return std::string(buffer, len);
	#else
		if(char* val = getenv(name.c_str()); val)
			return std::string(val);

		else
			return "";
	#endif
	}


	size_t getFileSize(const std::string& path)
	{
		#ifdef _WIN32

			// note: jesus christ this thing is horrendous

			HANDLE hd = CreateFile((LPCSTR) path.c_str(), GENERIC_READ, FILE_SHARE_READ, 0, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, 0);
			if(hd == INVALID_HANDLE_VALUE)
			{
				util::error("failed to get filesize for '%s' (error code %d)", path, GetLastError());
				return -1;
			}

			// ok, presumably it exists. so, get the size
			LARGE_INTEGER sz;
			bool success = GetFileSizeEx(hd, &sz);
			CloseHandle(hd);

			if(!success)
			{
				util::error("failed to get filesize for '%s' (error code %d)", path, GetLastError());
				return -1;
			}

			return (size_t) sz.QuadPart;

		#else

			struct stat st;
			if(stat(path.c_str(), &st) != 0)
			{
				char buf[128] = { 0 };
				strerror_r(errno, buf, 127);
				util::error("failed to get filesize for '%s' (error code %d / %s)", path, errno, buf);

				return -1;
			}

			return st.st_size;

		#endif
	}

	std::pair<uint8_t*, size_t> readEntireFile(const std::string& path)
	{
		auto bad = std::pair<uint8_t*, size_t>(nullptr, 0);

		auto sz = getFileSize(path);
		if(sz == static_cast<size_t>(-1)) return bad;

		// i'm lazy, so just use fstreams.
		auto fs = std::ifstream(path, std::ios::in | std::ios::binary);
		if(!fs.good()) return bad;


		uint8_t* buf = new uint8_t[sz + 1];
		fs.read(reinterpret_cast<char*>(buf), sz);
		fs.close();

		return std::pair(buf, sz);
	}

	std::string shellQuote(const std::string& s)
	{
		// nothing funny in it, leave it alone.
		if(!s.empty() && std::all_of(s.begin(), s.end(), [](char c) -> bool {
			return isalnum(static_cast<unsigned char>(c)) || strchr("-_./:=,+@%", c) != nullptr;
		}))
		{
			return s;
		}

		std::string ret = "'";
		for(char c : s)
		{
			if(c == '\'')   ret += "'\\''";
			else            ret += c;
		}

		return ret + "'";
	}

	std::string commandString(const std::string& program, const std::vector<std::string>& args)
	{
		std::string ret = shellQuote(program);
		for(const auto& a : args)
			ret += " " + shellQuote(a);

		return ret;
	}

	void ConsoleObserver::message(LogLevel level, const std::string& msg)
	{
		switch(level)
		{
			case LogLevel::Debug:   if(this->verbose) util::debug("%s", msg); break;
			case LogLevel::Info:    util::info("%s", msg); break;
			case LogLevel::Warn:    util::warn("%s", msg); break;
			case LogLevel::Error:   util::error("%s", msg); break;
		}
	}




	static int log_indent = 0;
	void indent_log(int n)    { log_indent += n; }
	void unindent_log(int n)  { log_indent = std::max(0, log_indent - n); }
	int get_log_indent()      { return log_indent; }
}
