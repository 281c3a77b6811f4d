#pragma once

#include <memory>
#include <string>
#include <vector>
#include "duckdb/main/client_context.hpp"
#include "duckdb/common/file_system.hpp"

// File utilities for regex_log.
//
// Functions implemented in file_utils.cpp:
// - ValidatePath: Reject empty, traversing or malformed path patterns
// - GetGlobFiles: Get files matching a single glob pattern
// - ResolveFiles: Expand a list of patterns into the ordered file set
// - LineReader: Line-by-line file reader for streaming support

namespace duckdb {
namespace regex_log {

/**
 * Validate a file path or glob pattern for basic security issues.
 * @return true if the path appears safe, false if it should be rejected
 */
bool ValidatePath(const std::string &path);

/**
 * Get files matching a glob pattern, sorted lexicographically.
 * Returns an empty list if the pattern has no glob characters or matches nothing.
 */
vector<std::string> GetGlobFiles(ClientContext &context, const std::string &pattern);

/**
 * Expand path patterns into the ordered, deduplicated set of files to read.
 *
 * Each pattern resolves to itself if it names an existing file, otherwise to
 * its sorted glob matches. Patterns are expanded in order and a file that was
 * already resolved by an earlier pattern is not repeated, so the result only
 * depends on the arguments and the state of the file system.
 *
 * @param context ClientContext for file system access
 * @param patterns Path or glob patterns
 * @param allow_empty If false, throw IOException when nothing resolves
 * @return Resolved file paths in canonical order
 */
vector<std::string> ResolveFiles(ClientContext &context, const vector<std::string> &patterns, bool allow_empty);

/**
 * LineReader provides buffered, line-by-line reading of files.
 * At most one buffer plus the current line is held in memory, so files
 * larger than memory can be streamed.
 *
 * Handles compression transparently via DuckDB's FileSystem.
 */
class LineReader {
public:
	/**
	 * Construct a LineReader for the given file.
	 * Throws IOException if the file cannot be opened.
	 * @param fs File system to open the file with
	 * @param source File path (supports compression via extension detection)
	 */
	LineReader(FileSystem &fs, const std::string &source);

	/**
	 * Check if there are more lines to read.
	 * @return true if more lines available, false at EOF
	 */
	bool HasNext();

	/**
	 * Read and return the next line.
	 * Does not include the newline character; a trailing '\r' is removed.
	 * Advances the line counter.
	 */
	std::string NextLine();

	// Number of lines returned so far
	idx_t LinesRead() const {
		return lines_read_;
	}

	bool IsEOF() const {
		return eof_ && buffer_pos_ >= buffer_end_;
	}

private:
	unique_ptr<FileHandle> file_handle_;
	std::string buffer_;
	size_t buffer_pos_ = 0;
	size_t buffer_end_ = 0;
	idx_t lines_read_ = 0;
	bool eof_ = false;

	static constexpr size_t BUFFER_SIZE = 65536; // 64KB buffer

	// Fill the buffer with more data from the file
	void FillBuffer();
	void FinishLine(std::string &line);
};

} // namespace regex_log
} // namespace duckdb
