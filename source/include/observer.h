// observer.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <string>
#include <utility>

#include "zpr.h"

namespace util
{
	enum class LogLevel
	{
		Debug,
		Info,
		Warn,
		Error
	};

	// the mapping core does not print anything by itself; whoever runs it hands one of
	// these in, and decides what to do with the messages.
	struct Observer
	{
		virtual ~Observer() { }
		virtual void message(LogLevel level, const std::string& msg) = 0;
	};

	template <typename... Args>
	static void notify(Observer* obs, LogLevel level, const std::string& fmt, Args&&... args)
	{
		if(obs) obs->message(level, zpr::sprint(fmt, std::forward<Args>(args)...));
	}
}
