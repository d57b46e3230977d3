#include <fstream>
#include <sstream>
#include <filesystem>
#include <system_error>

#include "chunker.hpp"


using namespace std;
namespace fs = std::filesystem;


Chunker::Chunker(const ChunkConfig & config, ChunkWriter & writer) : config(config), writer(writer) {}


unique_ptr<Chunker> make_chunker(const ChunkConfig & config, ChunkWriter & writer) {
	switch (config.type) {
		case ChunkType::lines:
			return unique_ptr<Chunker>(new LineChunker(config, writer));
		case ChunkType::chars:
			return unique_ptr<Chunker>(new CharChunker(config, writer));
		case ChunkType::tokens:
			return unique_ptr<Chunker>(new TokenChunker(config, writer));
	}
	throw ChunkError(ErrorKind::setup, "unsupported chunk type");
}


string read_whole_file(const string & filename) {
	ifstream in(filename, ios::binary);
	if (not in)
		throw ChunkError(ErrorKind::read, "error reading file " + filename);

	stringstream ss;
	ss << in.rdbuf();
	if (in.bad())
		throw ChunkError(ErrorKind::read, "error reading file " + filename);
	return ss.str();
}


void make_output_dir(const string & dirname) {
	fs::path dir(dirname);
	error_code ec;

	if (fs::is_directory(dir, ec))
		return;

	// Remember the missing ancestors to set their permissions once created
	vector<fs::path> created;
	for (fs::path p = dir ; not p.empty() and not fs::exists(p, ec) ; p = p.parent_path()) {
		created.push_back(p);
		if (p == p.parent_path())
			break;
	}

	fs::create_directories(dir, ec);
	error_code status_ec;
	if (ec or not fs::is_directory(dir, status_ec))
		throw ChunkError(ErrorKind::setup, "error creating output directory " + dirname + (ec ? ": " + ec.message() : ""));

	// create_directories applied the umask to 0777, dropping group and others write gives 0755 & ~umask
	fs::perms write_bits = fs::perms::group_write | fs::perms::others_write;
	for (const fs::path & p : created) {
		fs::permissions(p, write_bits, fs::perm_options::remove, ec);
		if (ec)
			throw ChunkError(ErrorKind::setup, "error setting permissions of " + p.string() + ": " + ec.message());
	}
}


RunSummary process(const ChunkConfig & config, ostream * progress) {
	config.validate();
	make_output_dir(config.output_dirname);

	ChunkWriter writer(config, progress);
	unique_ptr<Chunker> chunker = make_chunker(config, writer);
	chunker->run();

	return RunSummary{writer.chunks_written, writer.bytes_written};
}
