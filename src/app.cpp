#include "app.hpp"


using namespace std;


void prepare_app(CLI::App & app, const vector<ChunkTool *> & tools) {
	app.description("chunk-tools cuts large text files into smaller overlapping chunks, by lines, characters or tokens.");
	app.require_subcommand(1);
	// Options of a subcommand are read from the [<subcommand>] section of the file
	app.set_config("--config", "", "Read options from an INI or TOML configuration file");

	for (ChunkTool * tool : tools)
		tool->cli_prepare(&app);
}

ChunkTool * selected_tool(const vector<ChunkTool *> & tools) {
	for (ChunkTool * tool : tools)
		if (tool->subapp != nullptr and tool->subapp->parsed())
			return tool;
	return nullptr;
}
