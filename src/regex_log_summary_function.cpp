#include "include/regex_log_summary_function.hpp"
#include "core/parse_engine.hpp"

namespace duckdb {

struct RegexLogSummaryBindData : public TableFunctionData {
	bool has_run = false;
	regex_log::RunSummary summary;
};

struct RegexLogSummaryGlobalState : public GlobalTableFunctionState {
	bool finished = false;
};

static unique_ptr<FunctionData> RegexLogSummaryBind(ClientContext &context, TableFunctionBindInput &input,
                                                    vector<LogicalType> &return_types, vector<string> &names) {
	return_types = {
	    LogicalType::VARCHAR, // source
	    LogicalType::VARCHAR, // backend
	    LogicalType::VARCHAR, // on_error
	    LogicalType::BIGINT,  // threads
	    LogicalType::BIGINT,  // batch_size
	    LogicalType::BIGINT,  // files_resolved
	    LogicalType::BIGINT,  // files_unreadable
	    LogicalType::BIGINT,  // lines_read
	    LogicalType::BIGINT,  // rows_emitted
	    LogicalType::BIGINT,  // lines_matched
	    LogicalType::BIGINT,  // lines_skipped
	    LogicalType::BIGINT,  // lines_flagged
	    LogicalType::BIGINT   // batches_dispatched
	};
	names = {"source",       "backend",        "on_error",      "threads",       "batch_size",
	         "files_resolved", "files_unreadable", "lines_read", "rows_emitted",  "lines_matched",
	         "lines_skipped", "lines_flagged",  "batches_dispatched"};

	auto bind_data = make_uniq<RegexLogSummaryBindData>();
	auto &state = regex_log::GetRunState(context);
	bind_data->has_run = state.HasRun();
	bind_data->summary = state.Summary();
	return std::move(bind_data);
}

static unique_ptr<GlobalTableFunctionState> RegexLogSummaryInitGlobal(ClientContext &context,
                                                                      TableFunctionInitInput &input) {
	return make_uniq<RegexLogSummaryGlobalState>();
}

static Value Count(idx_t value) {
	return Value::BIGINT(static_cast<int64_t>(value));
}

static void RegexLogSummaryFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<RegexLogSummaryBindData>();
	auto &state = data_p.global_state->Cast<RegexLogSummaryGlobalState>();

	if (state.finished || !bind_data.has_run) {
		output.SetCardinality(0);
		return;
	}

	auto &summary = bind_data.summary;
	output.SetValue(0, 0, Value(summary.source));
	output.SetValue(1, 0, Value(summary.backend));
	output.SetValue(2, 0, Value(summary.on_error));
	output.SetValue(3, 0, Count(summary.threads));
	output.SetValue(4, 0, Count(summary.batch_size));
	output.SetValue(5, 0, Count(summary.files_resolved));
	output.SetValue(6, 0, Count(summary.files_unreadable));
	output.SetValue(7, 0, Count(summary.lines_read));
	output.SetValue(8, 0, Count(summary.rows_emitted));
	output.SetValue(9, 0, Count(summary.lines_matched));
	output.SetValue(10, 0, Count(summary.lines_skipped));
	output.SetValue(11, 0, Count(summary.lines_flagged));
	output.SetValue(12, 0, Count(summary.batches_dispatched));
	output.SetCardinality(1);
	state.finished = true;
}

TableFunction GetRegexLogSummaryFunction() {
	TableFunction func("regex_log_summary", {}, RegexLogSummaryFunction, RegexLogSummaryBind,
	                   RegexLogSummaryInitGlobal);
	return func;
}

} // namespace duckdb
