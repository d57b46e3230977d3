#include <fstream>
#include <sstream>
#include <iomanip>
#include <cstring>
#include <cerrno>
#include <filesystem>

#include "writer.hpp"


using namespace std;
namespace fs = std::filesystem;


ChunkWriter::ChunkWriter(const ChunkConfig & config, ostream * progress)
	: config(config), progress(progress), chunks_written(0), bytes_written(0)
{}


string ChunkWriter::chunk_filename(long number) const {
	stringstream ss;
	ss << config.prefix << "_chunk_" << setfill('0') << setw(3) << number << ".txt";
	return ss.str();
}

string ChunkWriter::chunk_path(long number) const {
	return (fs::path(config.output_dirname) / chunk_filename(number)).string();
}


void ChunkWriter::open(ofstream & out, const string & path) const {
	out.open(path, ios::binary | ios::trunc);
	if (not out.is_open())
		throw ChunkError(ErrorKind::write, "error creating chunk file " + path + ": " + strerror(errno));
}

void ChunkWriter::close(ofstream & out, const string & path) {
	streamoff size = out.tellp();
	out.close();
	if (out.fail() or size < 0)
		throw ChunkError(ErrorKind::write, "error writing chunk file " + path);

	bytes_written += (long)size;
	chunks_written += 1;
}


void ChunkWriter::write_header(ostream & out, long number, const ChunkRange & range, long nb_lines) const {
	out << "=== CHUNK " << number << " ===" << '\n';
	out << "Source: " << config.input_filename << '\n';
	if (range.kind == ChunkRange::lines) {
		out << "Lines: " << range.start << "-" << range.end << '\n';
		out << "Total lines in chunk: " << nb_lines << '\n';
	} else {
		out << "Range: " << range.start << "-" << range.end << '\n';
	}
	out << "=== CONTENT ===" << '\n' << '\n';
}


void ChunkWriter::write_lines(const vector<string> & lines, long number, const ChunkRange & range) {
	string path = chunk_path(number);
	ofstream out;
	this->open(out, path);

	if (config.metadata)
		write_header(out, number, range, (long)lines.size());
	for (const string & line : lines)
		out << line << '\n';

	this->close(out, path);

	if (progress != nullptr)
		*progress << "Created chunk " << number << ": " << chunk_filename(number)
		          << " (lines " << range.start << "-" << range.end << ")" << endl;
}


void ChunkWriter::write_text(const string & content, long number, const ChunkRange & range) {
	string path = chunk_path(number);
	ofstream out;
	this->open(out, path);

	if (config.metadata)
		write_header(out, number, range, 0);
	out.write(content.data(), content.size());

	this->close(out, path);

	if (progress != nullptr)
		*progress << "Created chunk " << number << ": " << chunk_filename(number)
		          << " (range " << range.start << "-" << range.end << ")" << endl;
}
