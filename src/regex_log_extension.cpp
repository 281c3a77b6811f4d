#define DUCKDB_EXTENSION_MAIN

#include "regex_log_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include "include/read_regex_log_function.hpp"
#include "include/regex_log_summary_function.hpp"
#include "core/parse_options.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());
	regex_log::RegisterSettings(config);

	auto read_regex_log_function = GetReadRegexLogFunction();
	loader.RegisterFunction(read_regex_log_function);

	auto parse_regex_log_function = GetParseRegexLogFunction();
	loader.RegisterFunction(parse_regex_log_function);

	auto regex_log_summary_function = GetRegexLogSummaryFunction();
	loader.RegisterFunction(regex_log_summary_function);
}

void RegexLogExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string RegexLogExtension::Name() {
	return "regex_log";
}

std::string RegexLogExtension::Version() const {
#ifdef EXT_VERSION_REGEX_LOG
	return EXT_VERSION_REGEX_LOG;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(regex_log, loader) {
	duckdb::LoadInternal(loader);
}

DUCKDB_EXTENSION_API const char *regex_log_version() {
	return duckdb::DuckDB::LibraryVersion();
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
