#pragma once

#include "duckdb.hpp"
#include "include/regex_log_types.hpp"
#include "batch_executor.hpp"
#include "error_policy.hpp"
#include "line_source.hpp"
#include "table_assembler.hpp"
#include <map>

namespace duckdb {
namespace regex_log {

struct DispatchOptions {
	idx_t batch_size = 2048;
	idx_t max_inflight_batches = 2;
	bool ordered = true;
};

struct DispatchStats {
	idx_t batches_dispatched = 0;
	idx_t batches_cancelled = 0;
	idx_t lines_dispatched = 0;
	// Production stopped early because of a failure under raise
	bool stopped = false;
};

/**
 * Bounded producer/consumer pipeline between a line source and the table.
 *
 * The coordinating thread (the caller of Run) is the only reader of the
 * source. It cuts the line stream into batches, keeps at most
 * max_inflight_batches of them between submission and release, and hands
 * the results of each batch to the error policy and the assembler, in
 * sequence order when ordered and in completion order otherwise.
 *
 * Under raise, the first failing batch k stops production and cancels every
 * batch after k. Batches before k still complete, so the failure that is
 * thrown is the first one in canonical order.
 */
class Dispatcher {
public:
	Dispatcher(ClientContext &context, LineSource &source, BatchExecutor &executor, DispatchOptions options);

	void Run(ErrorPolicy &policy, TableAssembler &assembler);

	const DispatchStats &Stats() const {
		return stats;
	}

private:
	ClientContext &context;
	LineSource &source;
	BatchExecutor &executor;
	DispatchOptions options;
	DispatchStats stats;

	idx_t in_flight = 0;
	idx_t next_release = 0;
	// Completed batches waiting for their predecessors
	std::map<idx_t, BatchResult> reorder_buffer;

	void Stop(idx_t sequence);
	void Release(BatchResult &result, ErrorPolicy &policy, TableAssembler &assembler);
};

} // namespace regex_log
} // namespace duckdb
