#include "compiled_pattern.hpp"
#include "duckdb/common/exception.hpp"
#include <cctype>

namespace duckdb {
namespace regex_log {

static bool IsGroupName(const std::string &name) {
	if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
		return false;
	}
	for (auto c : name) {
		if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
			return false;
		}
	}
	return true;
}

std::string CompiledPattern::StripNamedGroups(const std::string &pattern, vector<std::string> &group_names) {
	std::string result;
	result.reserve(pattern.size());
	group_names.clear();

	bool in_class = false;
	size_t i = 0;
	while (i < pattern.size()) {
		char c = pattern[i];
		if (c == '\\') {
			result += pattern.substr(i, 2);
			i += 2;
			continue;
		}
		if (in_class) {
			if (c == ']') {
				in_class = false;
			}
			result += c;
			i++;
			continue;
		}
		if (c == '[') {
			in_class = true;
			result += c;
			i++;
			continue;
		}
		if (c != '(') {
			result += c;
			i++;
			continue;
		}

		if (i + 1 < pattern.size() && pattern[i + 1] == '?') {
			// (?P<name> or (?<name> but not the lookbehinds (?<= and (?<!
			size_t name_start = 0;
			if (pattern.compare(i, 4, "(?P<") == 0) {
				name_start = i + 4;
			} else if (pattern.compare(i, 3, "(?<") == 0 && i + 3 < pattern.size() && pattern[i + 3] != '=' &&
			           pattern[i + 3] != '!') {
				name_start = i + 3;
			}
			if (name_start > 0) {
				size_t close = pattern.find('>', name_start);
				if (close != std::string::npos) {
					std::string name = pattern.substr(name_start, close - name_start);
					if (IsGroupName(name)) {
						group_names.push_back(name);
						result += '(';
						i = close + 1;
						continue;
					}
				}
			}
			// Non-capturing construct, left for std::regex to interpret
			result += c;
			i++;
			continue;
		}

		group_names.push_back("");
		result += c;
		i++;
	}
	return result;
}

CompiledPattern::CompiledPattern(const std::string &pattern_p) : pattern(pattern_p) {
	if (pattern.empty()) {
		throw BinderException("regex must not be empty");
	}

	std::string plain_pattern = StripNamedGroups(pattern, group_names);
	try {
		regex = std::regex(plain_pattern, std::regex::ECMAScript);
	} catch (const std::regex_error &e) {
		throw BinderException("Invalid regex pattern '%s': %s", pattern, e.what());
	}

	// The scan above is a heuristic; the compiled regex is authoritative
	if (regex.mark_count() != group_names.size()) {
		group_names.resize(regex.mark_count());
	}
}

vector<std::string> CompiledPattern::DefaultColumnNames() const {
	vector<std::string> names;
	for (idx_t i = 0; i < group_names.size(); i++) {
		if (group_names[i].empty()) {
			names.push_back("group_" + std::to_string(i + 1));
		} else {
			names.push_back(group_names[i]);
		}
	}
	return names;
}

} // namespace regex_log
} // namespace duckdb
