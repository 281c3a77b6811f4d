#pragma once

#include "duckdb.hpp"
#include "include/regex_log_types.hpp"
#include "compiled_pattern.hpp"
#include "safe_parsing.hpp"
#include <atomic>
#include <functional>

namespace duckdb {
namespace regex_log {

/**
 * Cooperative cancellation shared between the dispatcher and its workers.
 * Once CancelAfter(k) is called, batches with a sequence number above k are
 * abandoned; batches at or below k still run to completion.
 */
class CancellationToken {
public:
	CancellationToken() : cancel_after(DConstants::INVALID_INDEX) {
	}

	// Keeps the smallest sequence seen
	void CancelAfter(idx_t sequence) {
		idx_t current = cancel_after.load();
		while (sequence < current && !cancel_after.compare_exchange_weak(current, sequence)) {
		}
	}

	bool IsCancelled(idx_t sequence) const {
		return sequence > cancel_after.load();
	}

	bool AnyCancelled() const {
		return cancel_after.load() != DConstants::INVALID_INDEX;
	}

private:
	std::atomic<idx_t> cancel_after;
};

/**
 * Match one line. Pure: depends only on its arguments and never throws for
 * bad input; every problem becomes a failure result.
 *
 * @param pattern Compiled user pattern
 * @param column_count Number of configured output columns
 * @param record The line and its canonical position
 * @param max_line_length Longer lines are a WORKER_ERROR and never reach the regex engine
 */
MatchResult MatchLine(const CompiledPattern &pattern, idx_t column_count, const LineRecord &record,
                      idx_t max_line_length = SafeParsing::MAX_REGEX_LINE_LENGTH);

typedef std::function<MatchResult(const LineRecord &record)> line_match_function_t;

/**
 * Match every line of a batch. An exception escaping the per-line matching
 * is turned into WORKER_ERROR results for every line of the batch. If the
 * batch is cancelled part way, the returned result is marked cancelled.
 */
BatchResult MatchBatch(const LineBatch &batch, const CancellationToken &token, const line_match_function_t &match_line);

// MatchBatch with MatchLine as the per-line function
BatchResult MatchBatch(const CompiledPattern &pattern, idx_t column_count, const LineBatch &batch,
                       const CancellationToken &token, idx_t max_line_length = SafeParsing::MAX_REGEX_LINE_LENGTH);

// Failure result for every record of a batch that could not be processed
BatchResult FailBatch(const LineBatch &batch, const std::string &message);

} // namespace regex_log
} // namespace duckdb
