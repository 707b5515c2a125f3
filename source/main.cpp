// main.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

int main(int argc, char** argv)
{
	config::readConfig();
	auto files = args::parseCmdLineOpts(argc, argv);


	util::info("received %d %s", files.size(), util::plural("file", files.size()));

	if(config::isDryRun())
		util::info("dry run: nothing will be written");

	driver::createOutputFolder();

	auto paths = driver::collectFiles(files);

	size_t doneFiles = 0;
	for(const auto& filepath : paths)
	{
		auto ok = driver::processOneFile(filepath);

		if(ok) doneFiles += 1;
	}

	util::info("processed %d %s", doneFiles, util::plural("file", doneFiles));
	return (doneFiles == paths.size() ? 0 : 1);
}
