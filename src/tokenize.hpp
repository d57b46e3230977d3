#include <string>
#include <iostream>

#include "CLI/CLI.hpp"
#include "chunktools.hpp"


#ifndef TOKENIZE_H
#define TOKENIZE_H

class Tokenize: public ChunkTool {
private:
	std::string input_filename;
	bool count_only;

public:
	Tokenize();
	void cli_prepare(CLI::App * subapp);
	int exec();
	int run(std::ostream & out, std::ostream & err) const;
};

#endif
