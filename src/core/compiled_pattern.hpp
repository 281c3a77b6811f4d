#pragma once

#include "duckdb.hpp"
#include <regex>
#include <string>
#include <vector>

namespace duckdb {
namespace regex_log {

/**
 * A user regular expression compiled once per invocation and shared
 * read-only by every worker.
 *
 * Named groups written Python-style (?P<name>...) or ECMAScript-style
 * (?<name>...) are accepted: std::regex has no named groups, so they are
 * rewritten to plain capture groups and their names remembered by index.
 */
class CompiledPattern {
public:
	/**
	 * Compile a pattern.
	 * Throws BinderException if the pattern is empty or invalid.
	 */
	explicit CompiledPattern(const std::string &pattern);

	const std::string &Pattern() const {
		return pattern;
	}
	const std::regex &Regex() const {
		return regex;
	}
	// Number of capture groups
	idx_t GroupCount() const {
		return group_names.size();
	}
	// Name of each capture group, "" for unnamed groups
	const vector<std::string> &GroupNames() const {
		return group_names;
	}

	// Column names to use when the caller gives none
	vector<std::string> DefaultColumnNames() const;

	/**
	 * Rewrite named groups to plain groups and collect one entry per
	 * capture group (the name, or "" when unnamed) in declaration order.
	 */
	static std::string StripNamedGroups(const std::string &pattern, vector<std::string> &group_names);

private:
	std::string pattern;
	std::regex regex;
	vector<std::string> group_names;
};

} // namespace regex_log
} // namespace duckdb
