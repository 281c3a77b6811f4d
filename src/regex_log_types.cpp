#include "include/regex_log_types.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {
namespace regex_log {

bool BatchResult::HasFailure() const {
	for (const auto &result : results) {
		if (!result.IsSuccess()) {
			return true;
		}
	}
	return false;
}

std::string MatchStatusToMarker(MatchStatus status) {
	switch (status) {
	case MatchStatus::SUCCESS:
		return "";
	case MatchStatus::NO_MATCH:
		return "NoMatchError";
	case MatchStatus::SCHEMA_MISMATCH:
		return "SchemaMismatchError";
	case MatchStatus::DECODE_ERROR:
		return "DecodeError";
	case MatchStatus::UNREADABLE_FILE:
		return "UnreadableFileError";
	case MatchStatus::WORKER_ERROR:
		return "WorkerError";
	default:
		return "UnknownError";
	}
}

std::string ErrorModeToString(ErrorMode mode) {
	switch (mode) {
	case ErrorMode::RAISE:
		return "raise";
	case ErrorMode::SKIP:
		return "skip";
	case ErrorMode::INCLUDE:
		return "include";
	default:
		return "unknown";
	}
}

bool TryParseErrorMode(const std::string &str, ErrorMode &result) {
	std::string lower = StringUtil::Lower(str);
	if (lower == "raise") {
		result = ErrorMode::RAISE;
		return true;
	}
	if (lower == "skip" || lower == "ignore") {
		result = ErrorMode::SKIP;
		return true;
	}
	if (lower == "include") {
		result = ErrorMode::INCLUDE;
		return true;
	}
	return false;
}

std::string BackendTypeToString(BackendType backend) {
	switch (backend) {
	case BackendType::LOCAL:
		return "local";
	case BackendType::SCHEDULER:
		return "scheduler";
	default:
		return "unknown";
	}
}

bool TryParseBackendType(const std::string &str, BackendType &result) {
	std::string lower = StringUtil::Lower(str);
	if (lower == "local") {
		result = BackendType::LOCAL;
		return true;
	}
	if (lower == "scheduler") {
		result = BackendType::SCHEDULER;
		return true;
	}
	return false;
}

} // namespace regex_log
} // namespace duckdb
