#include "file_utils.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/enums/file_glob_options.hpp"
#include "duckdb/common/enums/file_compression_type.hpp"
#include <algorithm>
#include <cstring>
#include <unordered_set>

// Detect DuckDB v1.5+ (GlobFiles context parameter removed)
#if __has_include("duckdb/common/column_index_map.hpp")
#define DUCKDB_GLOB_V15
#endif

namespace duckdb {
namespace regex_log {

bool ValidatePath(const std::string &path) {
	if (path.empty()) {
		return false;
	}

	constexpr size_t MAX_PATH_LENGTH = 4096;
	if (path.length() > MAX_PATH_LENGTH) {
		return false;
	}

	// Null bytes can truncate paths
	if (path.find('\0') != std::string::npos) {
		return false;
	}

	// Allow ".." only inside a longer segment like "...log"
	if (path.find("..") != std::string::npos) {
		if (path.find("../") != std::string::npos || path.find("..\\") != std::string::npos || path == ".." ||
		    (path.length() >= 3 && (path.compare(path.length() - 3, 3, "/..") == 0 ||
		                            path.compare(path.length() - 3, 3, "\\..") == 0))) {
			return false;
		}
	}

	return true;
}

// ============================================================================
// LineReader Implementation
// ============================================================================

LineReader::LineReader(FileSystem &fs, const std::string &source) {
	auto flags = FileFlags::FILE_FLAGS_READ | FileCompressionType::AUTO_DETECT;
	file_handle_ = fs.OpenFile(source, flags);
	buffer_.resize(BUFFER_SIZE);
}

void LineReader::FillBuffer() {
	if (eof_) {
		return;
	}

	// Move any remaining data to the beginning of the buffer
	if (buffer_pos_ < buffer_end_) {
		size_t remaining = buffer_end_ - buffer_pos_;
		std::memmove(&buffer_[0], &buffer_[buffer_pos_], remaining);
		buffer_end_ = remaining;
	} else {
		buffer_end_ = 0;
	}
	buffer_pos_ = 0;

	size_t space_available = buffer_.size() - buffer_end_;
	if (space_available > 0) {
		auto bytes_read = file_handle_->Read(&buffer_[buffer_end_], space_available);
		if (bytes_read == 0) {
			eof_ = true;
		} else {
			buffer_end_ += static_cast<size_t>(bytes_read);
		}
	}
}

bool LineReader::HasNext() {
	if (buffer_pos_ < buffer_end_) {
		return true;
	}
	if (!eof_) {
		FillBuffer();
	}
	return buffer_pos_ < buffer_end_;
}

void LineReader::FinishLine(std::string &line) {
	lines_read_++;
	// Windows line endings
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
}

std::string LineReader::NextLine() {
	std::string line;

	while (true) {
		auto begin = buffer_.data() + buffer_pos_;
		auto newline = static_cast<const char *>(std::memchr(begin, '\n', buffer_end_ - buffer_pos_));
		if (newline) {
			size_t length = static_cast<size_t>(newline - begin);
			line.append(begin, length);
			buffer_pos_ += length + 1;
			FinishLine(line);
			return line;
		}

		// No newline in buffer - keep what we have and read more
		line.append(begin, buffer_end_ - buffer_pos_);
		buffer_pos_ = buffer_end_;

		FillBuffer();
		if (buffer_pos_ >= buffer_end_ && eof_) {
			// Last line without a trailing newline
			FinishLine(line);
			return line;
		}
	}
}

// ============================================================================
// File resolution
// ============================================================================

vector<std::string> GetGlobFiles(ClientContext &context, const std::string &pattern) {
	auto &fs = FileSystem::GetFileSystem(context);
	vector<std::string> result;

	if (!fs.HasGlob(pattern)) {
		return result;
	}

#ifdef DUCKDB_GLOB_V15
	auto glob_files = fs.GlobFiles(pattern, FileGlobOptions::ALLOW_EMPTY);
#else
	auto glob_files = fs.GlobFiles(pattern, context, FileGlobOptions::ALLOW_EMPTY);
#endif
	for (auto &file : glob_files) {
		result.push_back(file.path);
	}
	std::sort(result.begin(), result.end());
	return result;
}

vector<std::string> ResolveFiles(ClientContext &context, const vector<std::string> &patterns, bool allow_empty) {
	auto &fs = FileSystem::GetFileSystem(context);
	vector<std::string> result;
	std::unordered_set<std::string> seen;

	auto add_file = [&](const std::string &file_path) {
		if (seen.insert(file_path).second) {
			result.push_back(file_path);
		}
	};

	for (const auto &pattern : patterns) {
		if (!ValidatePath(pattern)) {
			throw InvalidInputException("Invalid file path or glob pattern: '%s'", pattern);
		}

		// A plain existing file resolves to itself
		if (!fs.HasGlob(pattern) && fs.FileExists(pattern)) {
			add_file(pattern);
			continue;
		}

		for (auto &file : GetGlobFiles(context, pattern)) {
			add_file(file);
		}
	}

	if (result.empty() && !allow_empty) {
		throw IOException("No files found that match the pattern \"%s\"", StringUtil::Join(patterns, ", "));
	}
	return result;
}

} // namespace regex_log
} // namespace duckdb
