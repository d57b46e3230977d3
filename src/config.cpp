#include <filesystem>

#include "config.hpp"


using namespace std;
namespace fs = std::filesystem;


ChunkError::ChunkError(ErrorKind kind, const string & msg) : runtime_error(msg), kind(kind) {}


ChunkType parse_chunk_type(const string & name) {
	if (name == "lines")
		return ChunkType::lines;
	else if (name == "chars")
		return ChunkType::chars;
	else if (name == "tokens")
		return ChunkType::tokens;

	throw ChunkError(ErrorKind::setup, "unsupported chunk type: " + name);
}

string chunk_type_name(ChunkType type) {
	switch (type) {
		case ChunkType::lines:
			return "lines";
		case ChunkType::chars:
			return "chars";
		case ChunkType::tokens:
			return "tokens";
	}
	return "";
}


void ChunkConfig::validate() const {
	if (input_filename.empty())
		throw ChunkError(ErrorKind::setup, "input file is required");
	if (output_dirname.empty())
		throw ChunkError(ErrorKind::setup, "output directory is required");
	if (prefix.empty())
		throw ChunkError(ErrorKind::setup, "output prefix is empty");

	if (chunk_size <= 0)
		throw ChunkError(ErrorKind::setup, "chunk size must be positive (got " + to_string(chunk_size) + ")");
	if (overlap < 0)
		throw ChunkError(ErrorKind::setup, "overlap must not be negative (got " + to_string(overlap) + ")");

	// Windowed strategies rewind by the overlap, it has to be shorter than a window
	if (type != ChunkType::lines and overlap >= chunk_size)
		throw ChunkError(
			ErrorKind::setup,
			"overlap (" + to_string(overlap) + ") must be smaller than chunk size (" + to_string(chunk_size) + ") for " + chunk_type_name(type) + " chunking"
		);
}


string default_prefix(const string & input_filename) {
	return fs::path(input_filename).stem().string();
}
