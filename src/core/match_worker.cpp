#include "match_worker.hpp"
#include "safe_parsing.hpp"
#include "duckdb/common/error_data.hpp"

namespace duckdb {
namespace regex_log {

static MatchResult MakeFailure(const LineRecord &record, MatchStatus status, std::string message) {
	MatchResult result;
	result.file_index = record.file_index;
	result.line_index = record.line_index;
	result.status = status;
	result.raw_text = record.text;
	result.message = std::move(message);
	return result;
}

MatchResult MatchLine(const CompiledPattern &pattern, idx_t column_count, const LineRecord &record,
                      idx_t max_line_length) {
	if (record.IsReadError()) {
		return MakeFailure(record, MatchStatus::UNREADABLE_FILE, record.read_error);
	}
	if (!SafeParsing::IsValidUtf8(record.text)) {
		return MakeFailure(record, MatchStatus::DECODE_ERROR, "line is not valid UTF-8");
	}

	std::smatch match;
	bool too_long = false;
	try {
		if (!SafeParsing::SafeRegexSearch(record.text, match, pattern.Regex(), max_line_length, too_long)) {
			if (too_long) {
				return MakeFailure(record, MatchStatus::WORKER_ERROR,
				                   "line exceeds " + std::to_string(max_line_length) + " bytes");
			}
			return MakeFailure(record, MatchStatus::NO_MATCH, "regex failed to match");
		}
	} catch (const std::regex_error &e) {
		// Complexity or stack limits on pathological input
		return MakeFailure(record, MatchStatus::WORKER_ERROR, std::string("regex evaluation failed: ") + e.what());
	}

	idx_t group_count = match.size() - 1;
	if (group_count != column_count) {
		return MakeFailure(record, MatchStatus::SCHEMA_MISMATCH,
		                   "match produced " + std::to_string(group_count) + " groups but " +
		                       std::to_string(column_count) + " columns are configured");
	}

	MatchResult result;
	result.file_index = record.file_index;
	result.line_index = record.line_index;
	result.status = MatchStatus::SUCCESS;
	result.values.reserve(group_count);
	for (idx_t i = 1; i <= group_count; i++) {
		// Optional groups that did not participate map to ""
		result.values.push_back(match[i].matched ? match[i].str() : std::string());
		// std::regex works on bytes and can cut a multi-byte character in half
		if (!SafeParsing::IsValidUtf8(result.values.back())) {
			return MakeFailure(record, MatchStatus::DECODE_ERROR,
			                   "group " + std::to_string(i) + " splits a multi-byte character");
		}
	}
	return result;
}

BatchResult FailBatch(const LineBatch &batch, const std::string &message) {
	BatchResult result;
	result.sequence = batch.sequence;
	result.results.reserve(batch.records.size());
	for (const auto &record : batch.records) {
		result.results.push_back(MakeFailure(record, MatchStatus::WORKER_ERROR, message));
	}
	return result;
}

BatchResult MatchBatch(const LineBatch &batch, const CancellationToken &token, const line_match_function_t &match_line) {
	BatchResult result;
	result.sequence = batch.sequence;
	try {
		result.results.reserve(batch.records.size());
		for (const auto &record : batch.records) {
			if (token.IsCancelled(batch.sequence)) {
				result.cancelled = true;
				result.results.clear();
				return result;
			}
			result.results.push_back(match_line(record));
		}
	} catch (const std::exception &e) {
		return FailBatch(batch, "worker failed: " + ErrorData(e).RawMessage());
	}
	return result;
}

BatchResult MatchBatch(const CompiledPattern &pattern, idx_t column_count, const LineBatch &batch,
                       const CancellationToken &token, idx_t max_line_length) {
	return MatchBatch(batch, token, [&](const LineRecord &record) {
		return MatchLine(pattern, column_count, record, max_line_length);
	});
}

} // namespace regex_log
} // namespace duckdb
