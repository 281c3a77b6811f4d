#pragma once

#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"
#include "include/regex_log_types.hpp"
#include "file_utils.hpp"
#include <string>
#include <vector>

namespace duckdb {
namespace regex_log {

/**
 * Single-producer sequence of LineRecords in canonical order.
 * Only the dispatcher's coordinating thread reads from a source.
 */
class LineSource {
public:
	virtual ~LineSource() = default;

	/**
	 * Fill batch with up to max_lines records continuing where the previous
	 * call stopped. Returns false once the source is exhausted.
	 */
	virtual bool NextBatch(idx_t max_lines, LineBatch &batch) = 0;

	// Number of files the source covers
	virtual idx_t FileCount() const = 0;
	virtual std::string FileName(idx_t file_index) const = 0;

	idx_t LinesRead() const {
		return lines_read;
	}
	idx_t FilesUnreadable() const {
		return files_unreadable;
	}

protected:
	idx_t lines_read = 0;
	idx_t files_unreadable = 0;
};

/**
 * Streams the lines of resolved files, one file at a time.
 * File k+1 is not opened before file k is exhausted. A file that cannot be
 * opened or read yields one error record and the source moves on.
 */
class FileLineSource : public LineSource {
public:
	FileLineSource(FileSystem &fs, vector<std::string> files);

	bool NextBatch(idx_t max_lines, LineBatch &batch) override;

	idx_t FileCount() const override {
		return files.size();
	}
	std::string FileName(idx_t file_index) const override {
		return files[file_index];
	}

private:
	FileSystem &fs;
	vector<std::string> files;
	idx_t current_file = 0;
	unique_ptr<LineReader> reader;

	void CloseCurrent();
};

/**
 * Streams the lines of an in-memory string as file 0.
 * Lines split exactly as LineReader splits a file: on "\n", with a
 * trailing "\r" removed. A lone "\r" stays part of the line.
 */
class ContentLineSource : public LineSource {
public:
	explicit ContentLineSource(std::string content);

	bool NextBatch(idx_t max_lines, LineBatch &batch) override;

	idx_t FileCount() const override {
		return 1;
	}
	std::string FileName(idx_t file_index) const override {
		return "";
	}

private:
	std::string content;
	size_t position = 0;
};

} // namespace regex_log
} // namespace duckdb
