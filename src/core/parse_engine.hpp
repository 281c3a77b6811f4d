#pragma once

#include "duckdb.hpp"
#include "duckdb/common/types/column/column_data_collection.hpp"
#include "duckdb/main/client_context_state.hpp"
#include "compiled_pattern.hpp"
#include "line_source.hpp"
#include "parse_options.hpp"
#include <string>

namespace duckdb {
namespace regex_log {

// Counters of one completed parse invocation
struct RunSummary {
	std::string source;
	std::string backend;
	std::string on_error;
	idx_t threads = 0;
	idx_t batch_size = 0;
	idx_t files_resolved = 0;
	idx_t files_unreadable = 0;
	idx_t lines_read = 0;
	idx_t rows_emitted = 0;
	idx_t lines_matched = 0;
	idx_t lines_skipped = 0;
	idx_t lines_flagged = 0;
	idx_t batches_dispatched = 0;
};

// Per-connection home of the last run summary
class RegexLogRunState : public ClientContextState {
public:
	void Record(RunSummary summary_p) {
		summary = std::move(summary_p);
		has_run = true;
	}
	bool HasRun() const {
		return has_run;
	}
	const RunSummary &Summary() const {
		return summary;
	}

private:
	RunSummary summary;
	bool has_run = false;
};

RegexLogRunState &GetRunState(ClientContext &context);

struct ParseRun {
	unique_ptr<ColumnDataCollection> table;
	RunSummary summary;
};

/**
 * Run one parse: stream the source through the dispatcher on the chosen
 * backend, apply the error policy and assemble the result table.
 *
 * The executor and its threads live only for the duration of the call. On
 * success the run summary is recorded for regex_log_summary().
 *
 * @param description Human readable name of the input for the summary
 */
ParseRun RunParse(ClientContext &context, const CompiledPattern &pattern, const ParseOptions &options,
                  LineSource &source, const std::string &description);

} // namespace regex_log
} // namespace duckdb
