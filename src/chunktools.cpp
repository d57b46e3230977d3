#include <iostream>
#include <vector>

#include "CLI/CLI.hpp"
#include "app.hpp"

#include "split.hpp"
#include "tokenize.hpp"


using namespace std;


int main(int argc, char** argv) {
	// Remove interactive synchronization for speedup I/O
	ios_base::sync_with_stdio(false);

	// --- Prepare tools ---
	vector<ChunkTool *> tools;
	tools.push_back(new Split());
	tools.push_back(new Tokenize());

	CLI::App app;
	prepare_app(app, tools);

	// Help requests come back as a ParseError with a 0 exit code
	int status = 0;
	try {
		app.parse(argc, argv);
		ChunkTool * tool = selected_tool(tools);
		if (tool != nullptr)
			status = tool->exec();
	} catch (const CLI::ParseError &e) {
		status = app.exit(e);
	}

	for (ChunkTool * tool : tools)
		delete tool;

	return status;
}
