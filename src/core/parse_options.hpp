#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/config.hpp"
#include "include/regex_log_types.hpp"
#include "compiled_pattern.hpp"
#include "safe_parsing.hpp"
#include "table_assembler.hpp"
#include <string>
#include <vector>

namespace duckdb {
namespace regex_log {

// Session settings registered by the extension
constexpr const char *THREADS_SETTING = "regex_log_threads";
constexpr const char *BATCH_SIZE_SETTING = "regex_log_batch_size";
constexpr const char *MAX_INFLIGHT_SETTING = "regex_log_max_inflight_batches";
constexpr const char *BACKEND_SETTING = "regex_log_backend";
constexpr const char *MAX_LINE_LENGTH_SETTING = "regex_log_max_line_length";

constexpr idx_t DEFAULT_BATCH_SIZE = 2048;

/**
 * Everything a parse invocation needs besides its input, fully defaulted
 * and validated at bind time.
 */
struct ParseOptions {
	vector<std::string> column_names;
	ErrorMode error_mode = ErrorMode::RAISE;
	bool allow_empty = false;
	idx_t threads = 1;
	idx_t batch_size = DEFAULT_BATCH_SIZE;
	idx_t max_inflight_batches = 2;
	bool ordered = true;
	BackendType backend = BackendType::LOCAL;
	bool filename = false;
	bool line_number = false;
	// 0 means the database memory limit
	idx_t max_result_bytes = 0;
	idx_t max_line_length = SafeParsing::MAX_REGEX_LINE_LENGTH;

	TableLayout Layout() const;
};

// Add the regex_log_* settings to a database configuration
void RegisterSettings(DBConfig &config);

// Number of threads to use when neither parameter nor setting gives one
idx_t DefaultThreadCount();

/**
 * Read settings and named parameters into ParseOptions.
 *
 * Named parameters override settings. Every problem with the options, the
 * column names or their agreement with the pattern's group count raises a
 * BinderException; nothing here touches the file system.
 *
 * @param function_name Used as the prefix of error messages
 */
ParseOptions BindParseOptions(ClientContext &context, const named_parameter_map_t &named_parameters,
                              const CompiledPattern &pattern, const std::string &function_name);

// Register the named parameters understood by BindParseOptions
void AddNamedParameters(TableFunction &function, bool reads_files);

} // namespace regex_log
} // namespace duckdb
