#include <vector>
#include <string>

#include "tokenize.hpp"
#include "chunker.hpp"
#include "utils/tokenizer.hpp"


using namespace std;


Tokenize::Tokenize() {
	input_filename = "";
	count_only = false;
}

void Tokenize::cli_prepare(CLI::App * app) {
	this->subapp = app->add_subcommand("tokenize", "Output the tokens of a file on stdout, one token per line. Useful to choose a chunk size for 'split -t tokens'.");
	CLI::Option * input_option = subapp->add_option("-i, --input", input_filename, "The file to tokenize");
	input_option->required();
	input_option->check(CLI::ExistingFile);
	subapp->add_flag("-c, --count", count_only, "Only print the number of tokens");
}

int Tokenize::run(ostream & out, ostream & err) const {
	try {
		vector<string> tokens = tokenize(read_whole_file(input_filename));

		if (count_only) {
			out << tokens.size() << endl;
			return 0;
		}

		for (const string & token : tokens)
			out << token << '\n';
		out.flush();
	} catch (const ChunkError & e) {
		err << "Error: " << e.what() << endl;
		return 1;
	}
	return 0;
}

int Tokenize::exec() {
	return run(cout, cerr);
}
