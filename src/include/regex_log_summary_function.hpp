#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"

namespace duckdb {

// regex_log_summary(): counters of the last completed parse on this connection
TableFunction GetRegexLogSummaryFunction();

} // namespace duckdb
