#include <vector>

#include "CLI/CLI.hpp"
#include "chunktools.hpp"


#ifndef APP_H
#define APP_H

/**
	* Configure the main command: description, config file option and one
	* subcommand per tool.
	**/
void prepare_app(CLI::App & app, const std::vector<ChunkTool *> & tools);

/**
	* Tool whose subcommand was parsed, nullptr if none.
	**/
ChunkTool * selected_tool(const std::vector<ChunkTool *> & tools);

#endif
