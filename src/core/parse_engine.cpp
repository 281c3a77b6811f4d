#include "parse_engine.hpp"
#include "batch_executor.hpp"
#include "dispatcher.hpp"
#include "error_policy.hpp"
#include "table_assembler.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/client_context.hpp"

namespace duckdb {
namespace regex_log {

RegexLogRunState &GetRunState(ClientContext &context) {
	return *context.registered_state->GetOrCreate<RegexLogRunState>("regex_log");
}

ParseRun RunParse(ClientContext &context, const CompiledPattern &pattern, const ParseOptions &options,
                  LineSource &source, const std::string &description) {
	idx_t column_count = options.column_names.size();
	auto executor = CreateBatchExecutor(context, options.backend, pattern, column_count, options.threads,
	                                    options.max_line_length);

	DUCKDB_LOG_DEBUG(context,
	                 StringUtil::Format("regex_log: parsing %s (%s files) with backend=%s concurrency=%s "
	                                    "batch_size=%s max_inflight_batches=%s ordered=%s on_error=%s",
	                                    description, std::to_string(source.FileCount()), executor->Name(),
	                                    std::to_string(executor->Concurrency()), std::to_string(options.batch_size),
	                                    std::to_string(options.max_inflight_batches),
	                                    options.ordered ? "true" : "false", ErrorModeToString(options.error_mode)));

	ErrorPolicy policy(options.error_mode, source);
	idx_t budget = options.max_result_bytes > 0 ? options.max_result_bytes : DefaultResultBudget(context);
	TableAssembler assembler(context, options.Layout(), source, budget);

	DispatchOptions dispatch_options;
	dispatch_options.batch_size = options.batch_size;
	dispatch_options.max_inflight_batches = options.max_inflight_batches;
	dispatch_options.ordered = options.ordered;
	Dispatcher dispatcher(context, source, *executor, dispatch_options);
	dispatcher.Run(policy, assembler);

	ParseRun run;
	run.table = assembler.Finish();

	auto &summary = run.summary;
	summary.source = description;
	summary.backend = executor->Name();
	summary.on_error = ErrorModeToString(options.error_mode);
	summary.threads = executor->Concurrency();
	summary.batch_size = options.batch_size;
	summary.files_resolved = source.FileCount();
	summary.files_unreadable = source.FilesUnreadable();
	summary.lines_read = source.LinesRead();
	summary.rows_emitted = assembler.RowCount();
	summary.lines_matched = policy.LinesMatched();
	summary.lines_skipped = policy.LinesSkipped();
	summary.lines_flagged = policy.LinesFlagged();
	summary.batches_dispatched = dispatcher.Stats().batches_dispatched;

	DUCKDB_LOG_DEBUG(context, StringUtil::Format("regex_log: finished %s: %s lines read, %s rows, %s skipped, "
	                                             "%s flagged, %s unreadable files, %s batches",
	                                             description, std::to_string(summary.lines_read),
	                                             std::to_string(summary.rows_emitted),
	                                             std::to_string(summary.lines_skipped),
	                                             std::to_string(summary.lines_flagged),
	                                             std::to_string(summary.files_unreadable),
	                                             std::to_string(summary.batches_dispatched)));

	GetRunState(context).Record(run.summary);
	return run;
}

} // namespace regex_log
} // namespace duckdb
