#include "table_assembler.hpp"
#include "safe_parsing.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/storage/buffer_manager.hpp"

namespace duckdb {
namespace regex_log {

vector<std::string> TableLayout::Names() const {
	vector<std::string> names = column_names;
	if (diagnostics) {
		names.push_back(PARSE_ERROR_COLUMN);
		names.push_back(RAW_LINE_COLUMN);
	}
	if (filename) {
		names.push_back(FILENAME_COLUMN);
	}
	if (line_number) {
		names.push_back(LINE_NUMBER_COLUMN);
	}
	return names;
}

vector<LogicalType> TableLayout::Types() const {
	vector<LogicalType> types(column_names.size(), LogicalType::VARCHAR);
	if (diagnostics) {
		types.push_back(LogicalType::VARCHAR);
		types.push_back(LogicalType::VARCHAR);
	}
	if (filename) {
		types.push_back(LogicalType::VARCHAR);
	}
	if (line_number) {
		types.push_back(LogicalType::BIGINT);
	}
	return types;
}

idx_t DefaultResultBudget(ClientContext &context) {
	return BufferManager::GetBufferManager(context).GetMaxMemory();
}

TableAssembler::TableAssembler(ClientContext &context, TableLayout layout_p, const LineSource &source_p,
                               idx_t max_result_bytes_p)
    : layout(std::move(layout_p)), source(source_p), max_result_bytes(max_result_bytes_p) {
	auto types = layout.Types();
	collection = make_uniq<ColumnDataCollection>(Allocator::Get(context), types);
	collection->InitializeAppend(append_state);
	chunk.Initialize(Allocator::Get(context), types);
}

void TableAssembler::Append(const MatchResult &result) {
	idx_t row = chunk.size();
	idx_t col = 0;

	if (result.IsSuccess()) {
		for (const auto &value : result.values) {
			chunk.SetValue(col++, row, Value(value));
		}
	} else {
		// Diagnostic row: every capture column gets the sentinel
		for (idx_t i = 0; i < layout.column_names.size(); i++) {
			chunk.SetValue(col++, row, Value(""));
		}
	}

	if (layout.diagnostics) {
		if (result.IsSuccess()) {
			chunk.SetValue(col++, row, Value());
			chunk.SetValue(col++, row, Value());
		} else {
			chunk.SetValue(col++, row, Value(MatchStatusToMarker(result.status)));
			chunk.SetValue(col++, row, Value(SafeParsing::SanitizeUtf8(result.raw_text)));
		}
	}
	if (layout.filename) {
		auto name = source.FileName(result.file_index);
		chunk.SetValue(col++, row, name.empty() ? Value() : Value(name));
	}
	if (layout.line_number) {
		chunk.SetValue(col++, row, Value::BIGINT(static_cast<int64_t>(result.line_index + 1)));
	}

	chunk.SetCardinality(row + 1);
	rows++;
	if (chunk.size() == STANDARD_VECTOR_SIZE) {
		Flush();
	}
}

void TableAssembler::Flush() {
	if (chunk.size() == 0) {
		return;
	}
	collection->Append(append_state, chunk);
	chunk.Reset();

	auto size = collection->SizeInBytes();
	if (size > max_result_bytes) {
		throw OutOfMemoryException("regex_log result of %s rows needs %s, exceeding the limit of %s", std::to_string(rows),
		                           StringUtil::BytesToHumanReadableString(size),
		                           StringUtil::BytesToHumanReadableString(max_result_bytes));
	}
}

unique_ptr<ColumnDataCollection> TableAssembler::Finish() {
	Flush();
	return std::move(collection);
}

} // namespace regex_log
} // namespace duckdb
