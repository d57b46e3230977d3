#include <string>
#include <vector>
#include <algorithm>

#include "chunker.hpp"
#include "utils/tokenizer.hpp"
#include "utils/utf8.hpp"


using namespace std;


// Maximal backward distance searched for a word boundary
static const size_t BOUNDARY_LOOKBACK = 100;


CharChunker::CharChunker(const ChunkConfig & config, ChunkWriter & writer) : Chunker(config, writer) {}


vector<pair<size_t, size_t> > CharChunker::windows(const string & text, size_t chunk_size, size_t overlap) {
	vector<pair<size_t, size_t> > wins;
	const size_t length = text.size();
	size_t start = 0;

	while (start < length) {
		size_t end = min(start + chunk_size, length);
		bool found = false;

		// Try to break at a word boundary
		if (end < length) {
			size_t limit = end > BOUNDARY_LOOKBACK ? end - BOUNDARY_LOOKBACK : 0;
			if (limit < start)
				limit = start;

			for (size_t i=end ; i>limit ; i--) {
				if (is_token_space(text[i])) {
					end = i;
					found = true;
					break;
				}
			}

			// No boundary, at least do not split a multi-byte character.
			// A window narrower than the character it starts on takes the whole character.
			if (not found) {
				size_t aligned = utf8_floor(text, end, start);
				if (aligned > start)
					end = aligned;
				else
					end = utf8_ceil(text, end);
			}
		}

		wins.push_back(make_pair(start, end));
		if (end == length)
			break;

		// The whitespace a chunk was cut on separates the chunks and belongs to neither
		size_t next = found ? end + 1 : end;
		// Rewind into the previous chunk, always moving forward
		if (overlap > 0 and end > overlap) {
			next = utf8_floor(text, end - overlap, start);
			if (next <= start)
				next = found ? end + 1 : end;
		}
		start = next;
	}

	return wins;
}


long CharChunker::run() {
	string text = read_whole_file(config.input_filename);

	long chunk_number = 1;
	for (const auto & win : windows(text, config.chunk_size, config.overlap)) {
		ChunkRange range{ChunkRange::offsets, (long)win.first, (long)win.second};
		writer.write_text(text.substr(win.first, win.second - win.first), chunk_number, range);
		chunk_number += 1;
	}

	return chunk_number - 1;
}
