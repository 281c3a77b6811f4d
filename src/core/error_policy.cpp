#include "error_policy.hpp"
#include "safe_parsing.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {
namespace regex_log {

ErrorPolicy::ErrorPolicy(ErrorMode mode_p, const LineSource &source_p) : mode(mode_p), source(source_p) {
}

bool ErrorPolicy::Admit(const MatchResult &result) {
	if (result.IsSuccess()) {
		lines_matched++;
		return true;
	}
	if (mode == ErrorMode::RAISE) {
		Raise(result);
	}
	if (mode == ErrorMode::SKIP) {
		lines_skipped++;
		return false;
	}
	lines_flagged++;
	return true;
}

void ErrorPolicy::Raise(const MatchResult &result) const {
	std::string location = source.FileName(result.file_index);
	if (location.empty()) {
		location = "<content>";
	}
	auto marker = MatchStatusToMarker(result.status);

	if (result.status == MatchStatus::UNREADABLE_FILE) {
		throw IOException("%s: could not read '%s' after line %s: %s", marker, location,
		                  std::to_string(result.line_index), result.message);
	}
	throw InvalidInputException("%s: %s at %s:%s: \"%s\"", marker, result.message, location,
	                            std::to_string(result.line_index + 1), SafeParsing::ExcerptForMessage(result.raw_text));
}

} // namespace regex_log
} // namespace duckdb
