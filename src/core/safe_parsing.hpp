#pragma once

#include "duckdb.hpp"
#include "utf8proc_wrapper.hpp"
#include <regex>
#include <string>

namespace duckdb {
namespace regex_log {

/**
 * Guards for running user patterns over raw log lines.
 *
 * Log files are read as bytes: nothing guarantees a line is valid UTF-8,
 * while DuckDB VARCHAR values must be. Validation and repair go through
 * DuckDB's Utf8Proc so the rules are exactly the ones VARCHAR enforces.
 */
namespace SafeParsing {

// Maximum number of raw-text bytes quoted in an error message
constexpr size_t MAX_MESSAGE_LINE_LENGTH = 256;

// Default longest line handed to std::regex
// libstdc++ matches recursively, one stack frame per character consumed
constexpr idx_t MAX_REGEX_LINE_LENGTH = 8192;

// Upper bound accepted for max_line_length; keeps recursion well inside a thread stack
constexpr idx_t MAX_REGEX_LINE_LENGTH_LIMIT = 16384;

inline bool IsValidUtf8(const std::string &text) {
	return Utf8Proc::Analyze(text.c_str(), text.size()) != UnicodeType::INVALID;
}

/**
 * Copy of text with every invalid UTF-8 sequence replaced by '?'.
 */
inline std::string SanitizeUtf8(const std::string &text) {
	if (IsValidUtf8(text)) {
		return text;
	}
	std::string result = text;
	Utf8Proc::MakeValid(&result[0], result.size(), '?');
	return result;
}

/**
 * Printable excerpt of a raw line for error messages.
 */
inline std::string ExcerptForMessage(const std::string &text, size_t max_length = MAX_MESSAGE_LINE_LENGTH) {
	if (text.size() <= max_length) {
		return SanitizeUtf8(text);
	}
	return SanitizeUtf8(text.substr(0, max_length)) + "...";
}

/**
 * std::regex_search that refuses lines longer than max_length.
 *
 * @return false if the line is too long; too_long tells the two cases apart
 */
inline bool SafeRegexSearch(const std::string &line, std::smatch &match, const std::regex &pattern,
                            idx_t max_length, bool &too_long) {
	too_long = line.length() > max_length;
	if (too_long) {
		return false;
	}
	return std::regex_search(line, match, pattern);
}

} // namespace SafeParsing
} // namespace regex_log
} // namespace duckdb
