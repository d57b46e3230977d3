#include <string>
#include <iostream>

#include "CLI/CLI.hpp"
#include "chunktools.hpp"
#include "config.hpp"


#ifndef SPLIT_H
#define SPLIT_H

class Split: public ChunkTool {
private:
	ChunkConfig config;
	std::string type_name;
	bool quiet;

public:
	Split();
	void cli_prepare(CLI::App * subapp);
	int exec();

	/**
		* Configuration of the parsed command line, with the strategy resolved and
		* the default prefix applied.
		*
		* @throws ChunkError (setup) for an unknown strategy name.
		**/
	ChunkConfig resolved_config() const;
	bool is_quiet() const { return quiet; }

	/**
		* Chunk the input. Banner, progress and summary go to out, errors to err.
		*
		* @return 0 on success, 1 on any chunking error.
		**/
	int run(std::ostream & out, std::ostream & err) const;
};


#endif
