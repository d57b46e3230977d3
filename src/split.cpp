#include <iostream>

#include "split.hpp"
#include "chunker.hpp"


using namespace std;


Split::Split() {
	// Paths
	config.input_filename = "";
	config.output_dirname = "chunks";
	// Cutting
	type_name = "lines";
	config.chunk_size = 1000;
	config.overlap = 50;
	config.metadata = true;
	config.prefix = "";
	quiet = false;
}

void Split::cli_prepare(CLI::App * app) {
	this->subapp = app->add_subcommand("split", "Cut a file into numbered chunk files, by lines, characters or tokens.");
	CLI::Option * input_option = subapp->add_option("-i, --input", config.input_filename, "Input file to chunk");
	input_option->required();
	input_option->check(CLI::ExistingFile);
	subapp->add_option("-o, --output", config.output_dirname, "Output directory for the chunks, created if absent (default chunks).");
	subapp->add_option("-t, --type", type_name, "Chunk type: lines, chars or tokens (default lines).")
		->check(CLI::IsMember({"lines", "chars", "tokens"}));
	subapp->add_option("-s, --size", config.chunk_size, "Size of each chunk in lines, characters or tokens (default 1000).")
		->check(CLI::PositiveNumber);
	subapp->add_option("-v, --overlap", config.overlap, "Overlap between consecutive chunks, in the same unit as the size (default 50).")
		->check(CLI::NonNegativeNumber);
	subapp->add_flag("--metadata, !--no-metadata", config.metadata, "Write a metadata header at the top of each chunk (default on)");
	subapp->add_option("-p, --prefix", config.prefix, "Prefix for the chunk file names (defaults to the input file name without extension)");
	subapp->add_flag("-q, --quiet", quiet, "Only print errors");
}

ChunkConfig Split::resolved_config() const {
	ChunkConfig resolved = config;
	resolved.type = parse_chunk_type(type_name);
	if (resolved.prefix.empty())
		resolved.prefix = default_prefix(resolved.input_filename);
	return resolved;
}

int Split::run(ostream & out, ostream & err) const {
	try {
		ChunkConfig resolved = resolved_config();

		if (not quiet) {
			out << "Chunking file: " << resolved.input_filename << endl;
			out << "Chunk type: " << chunk_type_name(resolved.type) << endl;
			out << "Chunk size: " << resolved.chunk_size << endl;
			out << "Overlap: " << resolved.overlap << endl;
			out << "Output directory: " << resolved.output_dirname << endl;
			out << endl;
		}

		RunSummary summary = process(resolved, quiet ? nullptr : &out);

		if (not quiet)
			out << endl << "Chunking completed successfully! " << summary.chunks << " chunk(s) written ("
			    << summary.bytes << " bytes)" << endl;
	} catch (const ChunkError & e) {
		err << "Error: " << e.what() << endl;
		return 1;
	}
	return 0;
}

int Split::exec() {
	return run(cout, cerr);
}
