#include "CLI/CLI.hpp"


#ifndef CHUNK_TOOLS
#define CHUNK_TOOLS


class ChunkTool {
public:
	CLI::App * subapp = nullptr;
	virtual ~ChunkTool() {}
	virtual void cli_prepare(CLI::App * subapp) = 0;
	/** Run the tool on stdout/stderr. @return The process exit status. **/
	virtual int exec() = 0;
};


#endif
