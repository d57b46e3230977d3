#include <string>
#include <vector>
#include <iostream>
#include <fstream>

#include "config.hpp"


#ifndef WRITER_H
#define WRITER_H

/**
	* Position of a chunk inside its source, only used for reporting.
	* Line ranges are 1-based and inclusive, offset ranges (bytes or tokens) are
	* 0-based and half open.
	**/
struct ChunkRange {
	enum Kind { lines, offsets };

	Kind kind;
	long start;
	long end;
};


/**
	* Writes the chunks of one run into numbered files of the output directory.
	* One file is opened, filled and closed per call. Any failure is thrown as a
	* ChunkError of kind write.
	**/
class ChunkWriter {
private:
	const ChunkConfig & config;
	std::ostream * progress;

	void write_header(std::ostream & out, long number, const ChunkRange & range, long nb_lines) const;
	void open(std::ofstream & out, const std::string & path) const;
	void close(std::ofstream & out, const std::string & path);

public:
	long chunks_written;
	long bytes_written;

	/**
		* @param config Run configuration, must outlive the writer.
		* @param progress Stream that receives one line per created chunk. nullptr
		* silences the progress.
		**/
	ChunkWriter(const ChunkConfig & config, std::ostream * progress);

	/** File name (without directory) of the chunk number. **/
	std::string chunk_filename(long number) const;
	/** Full path of the chunk number inside the output directory. **/
	std::string chunk_path(long number) const;

	/** Write a chunk made of lines. Each line is terminated by '\n'. **/
	void write_lines(const std::vector<std::string> & lines, long number, const ChunkRange & range);
	/** Write a chunk made of raw text, copied as is. **/
	void write_text(const std::string & content, long number, const ChunkRange & range);
};

#endif
