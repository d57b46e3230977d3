#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <iostream>

#include "config.hpp"
#include "writer.hpp"


#ifndef CHUNKER_H
#define CHUNKER_H

/**
	* One chunking strategy. A strategy reads config.input_filename, cuts it and
	* hands every chunk to the writer, in order, numbered from 1.
	**/
class Chunker {
protected:
	const ChunkConfig & config;
	ChunkWriter & writer;

public:
	Chunker(const ChunkConfig & config, ChunkWriter & writer);
	virtual ~Chunker() {}

	/**
		* Cut the whole input.
		*
		* @return The number of chunks written.
		* @throws ChunkError (read or write) on the first I/O failure. Chunks already
		* written are kept.
		**/
	virtual long run() = 0;
};


/** Fixed number of lines per chunk, the last lines of a chunk are repeated at the start of the next one. **/
class LineChunker: public Chunker {
public:
	LineChunker(const ChunkConfig & config, ChunkWriter & writer);
	long run();
};

/** Fixed number of bytes per chunk, ends are moved back to the closest preceding whitespace. **/
class CharChunker: public Chunker {
public:
	CharChunker(const ChunkConfig & config, ChunkWriter & writer);
	long run();

	/**
		* Cut text into [start, end) windows.
		* Stops after the window that reaches the end of the text.
		*
		* @return The windows, in order.
		**/
	static std::vector<std::pair<size_t, size_t> > windows(const std::string & text, size_t chunk_size, size_t overlap);
};

/** Fixed number of tokens per chunk, see tokenize() for what a token is. **/
class TokenChunker: public Chunker {
public:
	TokenChunker(const ChunkConfig & config, ChunkWriter & writer);
	long run();

	static std::vector<std::pair<size_t, size_t> > windows(size_t nb_tokens, size_t chunk_size, size_t overlap);
};


/** Instantiate the strategy matching config.type. **/
std::unique_ptr<Chunker> make_chunker(const ChunkConfig & config, ChunkWriter & writer);

/** Read a whole file in memory. @throws ChunkError (read) **/
std::string read_whole_file(const std::string & filename);

/**
	* Create the output directory and its missing parents. Directories created
	* here get the rwxr-xr-x mode, restricted by the process umask.
	*
	* @throws ChunkError (setup) if the path can't be created or is not a directory.
	**/
void make_output_dir(const std::string & dirname);


struct RunSummary {
	long chunks;
	long bytes;
};

/**
	* Complete chunking run: validate the configuration, prepare the output
	* directory, then cut the input with the configured strategy.
	*
	* @param config Run configuration.
	* @param progress Receives the per chunk progress lines. nullptr for a silent run.
	* @throws ChunkError at the first failure.
	**/
RunSummary process(const ChunkConfig & config, std::ostream * progress);

#endif
