#pragma once

#include "duckdb.hpp"
#include "duckdb/common/types/column/column_data_collection.hpp"
#include "duckdb/function/table_function.hpp"
#include "core/compiled_pattern.hpp"
#include "core/parse_options.hpp"
#include <memory>
#include <string>
#include <vector>

namespace duckdb {

// Bind data shared by read_regex_log and parse_regex_log
struct RegexLogBindData : public TableFunctionData {
	// Compiled once at bind, read by every worker
	std::shared_ptr<regex_log::CompiledPattern> pattern;
	regex_log::ParseOptions options;

	// read_regex_log: files resolved at bind time, in canonical order
	vector<std::string> patterns;
	vector<std::string> files;

	// parse_regex_log: the text to parse
	bool from_content = false;
	std::string content;
};

// The whole result is built in InitGlobal and scanned out chunk by chunk
struct RegexLogGlobalState : public GlobalTableFunctionState {
	unique_ptr<ColumnDataCollection> table;
	ColumnDataScanState scan_state;

	idx_t MaxThreads() const override {
		return 1;
	}
};

// read_regex_log(path VARCHAR | VARCHAR[], regex VARCHAR, ...)
TableFunctionSet GetReadRegexLogFunction();

// parse_regex_log(content VARCHAR, regex VARCHAR, ...)
TableFunction GetParseRegexLogFunction();

unique_ptr<FunctionData> ReadRegexLogBind(ClientContext &context, TableFunctionBindInput &input,
                                          vector<LogicalType> &return_types, vector<string> &names);

unique_ptr<FunctionData> ParseRegexLogBind(ClientContext &context, TableFunctionBindInput &input,
                                           vector<LogicalType> &return_types, vector<string> &names);

unique_ptr<GlobalTableFunctionState> RegexLogInitGlobal(ClientContext &context, TableFunctionInitInput &input);

void RegexLogFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output);

} // namespace duckdb
