#include <string>
#include <stdexcept>


#ifndef CONFIG_H
#define CONFIG_H

/** Strategy used to cut the input file. **/
enum class ChunkType { lines, chars, tokens };

/**
	* Category of a run failure.
	* setup errors happen before any chunk is written, read and write errors
	* can happen in the middle of a run.
	**/
enum class ErrorKind { setup, read, write };

class ChunkError: public std::runtime_error {
public:
	ErrorKind kind;

	ChunkError(ErrorKind kind, const std::string & msg);
};

/**
	* Parse a strategy name ("lines", "chars" or "tokens").
	*
	* @throws ChunkError (setup) for any other name.
	**/
ChunkType parse_chunk_type(const std::string & name);
std::string chunk_type_name(ChunkType type);

/**
	* Everything a chunking run needs. Built by the CLI, then validated once and
	* passed by const reference to the strategies.
	**/
struct ChunkConfig {
	std::string input_filename;
	std::string output_dirname = "chunks";
	ChunkType type = ChunkType::lines;
	long chunk_size = 1000;
	long overlap = 50;
	bool metadata = true;
	std::string prefix;

	/**
		* Check the invariants of the configuration.
		* The overlap must be strictly smaller than the chunk size for chars and
		* tokens. For lines a larger overlap only disables the carry-over.
		*
		* @throws ChunkError (setup) on the first broken invariant.
		**/
	void validate() const;
};

/**
	* Default output prefix for an input file: its file name without extension.
	**/
std::string default_prefix(const std::string & input_filename);

#endif
