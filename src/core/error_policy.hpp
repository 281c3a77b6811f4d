#pragma once

#include "duckdb.hpp"
#include "include/regex_log_types.hpp"
#include "line_source.hpp"

namespace duckdb {
namespace regex_log {

/**
 * Applies the configured on_error mode to each result in the order the
 * dispatcher releases them, and counts what happened to every line.
 *
 * - RAISE: the first failure throws (see Raise for the exception mapping)
 * - SKIP: failures are dropped and counted as skipped
 * - INCLUDE: failures are kept as diagnostic rows and counted as flagged
 */
class ErrorPolicy {
public:
	ErrorPolicy(ErrorMode mode, const LineSource &source);

	/**
	 * Decide whether a result becomes a row.
	 * Throws under RAISE if the result is a failure.
	 */
	bool Admit(const MatchResult &result);

	/**
	 * Throw the exception for a failure: IOException for unreadable files,
	 * InvalidInputException otherwise. The message names the file, the
	 * 1-based line number and the raw text.
	 */
	void Raise(const MatchResult &result) const;

	ErrorMode Mode() const {
		return mode;
	}
	idx_t LinesMatched() const {
		return lines_matched;
	}
	idx_t LinesSkipped() const {
		return lines_skipped;
	}
	idx_t LinesFlagged() const {
		return lines_flagged;
	}

private:
	ErrorMode mode;
	const LineSource &source;
	idx_t lines_matched = 0;
	idx_t lines_skipped = 0;
	idx_t lines_flagged = 0;
};

} // namespace regex_log
} // namespace duckdb
