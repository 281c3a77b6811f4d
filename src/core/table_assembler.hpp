#pragma once

#include "duckdb.hpp"
#include "duckdb/common/types/column/column_data_collection.hpp"
#include "duckdb/common/types/data_chunk.hpp"
#include "include/regex_log_types.hpp"
#include "line_source.hpp"
#include <string>
#include <vector>

namespace duckdb {
namespace regex_log {

// Names of the optional columns appended after the capture columns
constexpr const char *PARSE_ERROR_COLUMN = "parse_error";
constexpr const char *RAW_LINE_COLUMN = "raw_line";
constexpr const char *FILENAME_COLUMN = "filename";
constexpr const char *LINE_NUMBER_COLUMN = "line_number";

/**
 * Column layout of the result table:
 *   capture columns (VARCHAR, in the requested order)
 *   parse_error, raw_line (VARCHAR, include mode only)
 *   filename (VARCHAR, optional)
 *   line_number (BIGINT, 1-based, optional)
 */
struct TableLayout {
	vector<std::string> column_names;
	bool diagnostics = false;
	bool filename = false;
	bool line_number = false;

	vector<std::string> Names() const;
	vector<LogicalType> Types() const;
};

/**
 * Builds the result table from released match results.
 *
 * Rows are staged in a DataChunk and appended to a ColumnDataCollection one
 * vector at a time. The collection is kept under a byte budget; going over
 * it throws OutOfMemoryException instead of truncating the result.
 */
class TableAssembler {
public:
	/**
	 * @param max_result_bytes Budget for the assembled table
	 */
	TableAssembler(ClientContext &context, TableLayout layout, const LineSource &source, idx_t max_result_bytes);

	// Add one retained result as a row
	void Append(const MatchResult &result);

	// Flush staged rows and hand over the finished table
	unique_ptr<ColumnDataCollection> Finish();

	idx_t RowCount() const {
		return rows;
	}

private:
	TableLayout layout;
	const LineSource &source;
	idx_t max_result_bytes;
	idx_t rows = 0;

	unique_ptr<ColumnDataCollection> collection;
	ColumnDataAppendState append_state;
	DataChunk chunk;

	void Flush();
};

// Byte budget used when the caller gives none: the database memory limit
idx_t DefaultResultBudget(ClientContext &context);

} // namespace regex_log
} // namespace duckdb
