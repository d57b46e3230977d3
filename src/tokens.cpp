#include <string>
#include <vector>
#include <algorithm>

#include "chunker.hpp"
#include "utils/tokenizer.hpp"


using namespace std;


TokenChunker::TokenChunker(const ChunkConfig & config, ChunkWriter & writer) : Chunker(config, writer) {}


vector<pair<size_t, size_t> > TokenChunker::windows(size_t nb_tokens, size_t chunk_size, size_t overlap) {
	vector<pair<size_t, size_t> > wins;
	size_t start = 0;

	while (start < nb_tokens) {
		size_t end = min(start + chunk_size, nb_tokens);
		wins.push_back(make_pair(start, end));
		if (end == nb_tokens)
			break;

		// overlap < chunk_size is checked by the configuration, keep the guard for direct callers
		if (overlap > 0 and end > overlap and end - overlap > start)
			start = end - overlap;
		else
			start = end;
	}

	return wins;
}


long TokenChunker::run() {
	vector<string> tokens = tokenize(read_whole_file(config.input_filename));

	long chunk_number = 1;
	for (const auto & win : windows(tokens.size(), config.chunk_size, config.overlap)) {
		ChunkRange range{ChunkRange::offsets, (long)win.first, (long)win.second};
		writer.write_text(join_tokens(tokens, win.first, win.second), chunk_number, range);
		chunk_number += 1;
	}

	return chunk_number - 1;
}
