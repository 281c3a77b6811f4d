#pragma once

#include "duckdb.hpp"
#include "duckdb/common/types.hpp"
#include <string>
#include <vector>

namespace duckdb {
namespace regex_log {

// Outcome of matching a single line
enum class MatchStatus : uint8_t {
	SUCCESS = 0,
	NO_MATCH = 1,
	SCHEMA_MISMATCH = 2,
	DECODE_ERROR = 3,
	UNREADABLE_FILE = 4,
	WORKER_ERROR = 5
};

// What to do with a failed line
enum class ErrorMode : uint8_t { RAISE = 0, SKIP = 1, INCLUDE = 2 };

// Execution substrate for the dispatcher
enum class BackendType : uint8_t {
	LOCAL = 0,    // pool owned by the invocation
	SCHEDULER = 1 // DuckDB's task scheduler
};

/**
 * One raw line together with its canonical position.
 * file_index ranks the file in resolution order, line_index is 0-based
 * within the file. A record with a non-empty read_error stands for a file
 * that could not be (fully) read; line_index is where reading stopped.
 */
struct LineRecord {
	idx_t file_index;
	idx_t line_index;
	std::string text;
	std::string read_error;

	LineRecord() : file_index(0), line_index(0) {
	}
	LineRecord(idx_t file_index_p, idx_t line_index_p, std::string text_p)
	    : file_index(file_index_p), line_index(line_index_p), text(std::move(text_p)) {
	}

	bool IsReadError() const {
		return !read_error.empty();
	}
};

// A contiguous run of records dispatched together
struct LineBatch {
	idx_t sequence;
	std::vector<LineRecord> records;

	LineBatch() : sequence(0) {
	}
};

struct MatchResult {
	idx_t file_index;
	idx_t line_index;
	MatchStatus status;
	std::vector<std::string> values; // only for SUCCESS
	std::string raw_text;            // only for failures
	std::string message;             // human readable failure detail

	MatchResult() : file_index(0), line_index(0), status(MatchStatus::SUCCESS) {
	}

	bool IsSuccess() const {
		return status == MatchStatus::SUCCESS;
	}
};

struct BatchResult {
	idx_t sequence;
	bool cancelled;
	std::vector<MatchResult> results;

	BatchResult() : sequence(0), cancelled(false) {
	}

	bool HasFailure() const;
};

// Diagnostic marker written to the parse_error column
std::string MatchStatusToMarker(MatchStatus status);

std::string ErrorModeToString(ErrorMode mode);
// Returns false if the string names no known mode
bool TryParseErrorMode(const std::string &str, ErrorMode &result);

std::string BackendTypeToString(BackendType backend);
bool TryParseBackendType(const std::string &str, BackendType &result);

} // namespace regex_log
} // namespace duckdb
