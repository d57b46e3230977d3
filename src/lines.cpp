#include <fstream>
#include <vector>
#include <string>

#include "chunker.hpp"


using namespace std;


LineChunker::LineChunker(const ChunkConfig & config, ChunkWriter & writer) : Chunker(config, writer) {}


long LineChunker::run() {
	ifstream in(config.input_filename, ios::binary);
	if (not in)
		throw ChunkError(ErrorKind::read, "error opening file " + config.input_filename);

	const size_t chunk_size = config.chunk_size;
	const size_t overlap = config.overlap;

	vector<string> current;
	vector<string> previous_overlap;
	long chunk_number = 1;
	long line_number = 0;

	string line;
	while (getline(in, line)) {
		line_number += 1;
		if (not line.empty() and line.back() == '\r')
			line.pop_back();

		// Start new chunk with the tail of the previous one
		if (current.empty() and not previous_overlap.empty())
			current.swap(previous_overlap);

		current.push_back(line);

		if (current.size() >= chunk_size) {
			ChunkRange range{ChunkRange::lines, line_number - (long)current.size() + 1, line_number};
			writer.write_lines(current, chunk_number, range);

			previous_overlap.clear();
			if (overlap > 0 and current.size() > overlap)
				previous_overlap.assign(current.end() - overlap, current.end());

			current.clear();
			chunk_number += 1;
		}
	}

	if (in.bad())
		throw ChunkError(ErrorKind::read, "error reading file " + config.input_filename);

	// Remaining lines form a shorter last chunk.
	// The carried tail alone is never flushed, it only enters current with a new line.
	if (not current.empty()) {
		ChunkRange range{ChunkRange::lines, line_number - (long)current.size() + 1, line_number};
		writer.write_lines(current, chunk_number, range);
		chunk_number += 1;
	}

	return chunk_number - 1;
}
