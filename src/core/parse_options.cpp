#include "parse_options.hpp"
#include "duckdb/common/case_insensitive_map.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/main/client_context.hpp"
#include <thread>

namespace duckdb {
namespace regex_log {

TableLayout ParseOptions::Layout() const {
	TableLayout layout;
	layout.column_names = column_names;
	layout.diagnostics = error_mode == ErrorMode::INCLUDE;
	layout.filename = filename;
	layout.line_number = line_number;
	return layout;
}

void RegisterSettings(DBConfig &config) {
	config.AddExtensionOption(THREADS_SETTING, "Worker threads used by regex_log functions (0 = number of cores)",
	                          LogicalType::BIGINT, Value::BIGINT(0));
	config.AddExtensionOption(BATCH_SIZE_SETTING, "Lines per batch dispatched by regex_log functions",
	                          LogicalType::BIGINT, Value::BIGINT(static_cast<int64_t>(DEFAULT_BATCH_SIZE)));
	config.AddExtensionOption(MAX_INFLIGHT_SETTING,
	                          "Batches regex_log keeps in flight at once (0 = twice the thread count)",
	                          LogicalType::BIGINT, Value::BIGINT(0));
	config.AddExtensionOption(BACKEND_SETTING, "Execution backend of regex_log functions: 'local' or 'scheduler'",
	                          LogicalType::VARCHAR, Value("local"));
	config.AddExtensionOption(MAX_LINE_LENGTH_SETTING,
	                          "Longest line in bytes regex_log matches; longer lines are worker errors",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(static_cast<int64_t>(SafeParsing::MAX_REGEX_LINE_LENGTH)));
}

idx_t DefaultThreadCount() {
	auto cores = std::thread::hardware_concurrency();
	return cores == 0 ? 1 : static_cast<idx_t>(cores);
}

// A positive count from a named parameter
static idx_t GetPositive(const std::string &function_name, const std::string &name, const Value &value) {
	if (value.IsNull()) {
		throw BinderException("%s: %s cannot be NULL", function_name, name);
	}
	auto number = value.GetValue<int64_t>();
	if (number < 1) {
		throw BinderException("%s: %s must be at least 1, got %s", function_name, name, std::to_string(number));
	}
	return static_cast<idx_t>(number);
}

static bool GetFlag(const std::string &function_name, const std::string &name, const Value &value) {
	if (value.IsNull()) {
		throw BinderException("%s: %s cannot be NULL", function_name, name);
	}
	return value.GetValue<bool>();
}

// Setting value, where 0 asks for the computed default
static idx_t GetCountSetting(ClientContext &context, const char *setting, idx_t fallback) {
	Value value;
	if (!context.TryGetCurrentSetting(setting, value) || value.IsNull()) {
		return fallback;
	}
	auto number = value.GetValue<int64_t>();
	if (number < 0) {
		throw BinderException("Setting %s must not be negative, got %s", setting, std::to_string(number));
	}
	return number == 0 ? fallback : static_cast<idx_t>(number);
}

static void CheckMaxLineLength(const std::string &source, idx_t max_line_length) {
	if (max_line_length > SafeParsing::MAX_REGEX_LINE_LENGTH_LIMIT) {
		throw BinderException("%s: max_line_length must be at most %s, got %s", source,
		                      std::to_string(SafeParsing::MAX_REGEX_LINE_LENGTH_LIMIT), std::to_string(max_line_length));
	}
}

static vector<std::string> GetColumnNames(const std::string &function_name, const Value &value) {
	if (value.IsNull()) {
		throw BinderException("%s: col_names cannot be NULL", function_name);
	}
	vector<std::string> names;
	for (auto &child : ListValue::GetChildren(value)) {
		if (child.IsNull()) {
			throw BinderException("%s: col_names cannot contain NULL", function_name);
		}
		names.push_back(StringValue::Get(child));
	}
	return names;
}

static void ValidateColumnNames(const std::string &function_name, const ParseOptions &options) {
	for (auto &name : options.column_names) {
		if (name.empty()) {
			throw BinderException("%s: column names cannot be empty", function_name);
		}
	}
	// Capture columns share one namespace with the optional columns
	auto names = options.Layout().Names();
	case_insensitive_set_t seen;
	for (auto &name : names) {
		if (!seen.insert(name).second) {
			throw BinderException("%s: duplicate column name \"%s\"", function_name, name);
		}
	}
}

ParseOptions BindParseOptions(ClientContext &context, const named_parameter_map_t &named_parameters,
                              const CompiledPattern &pattern, const std::string &function_name) {
	ParseOptions options;

	// Settings first
	options.threads = GetCountSetting(context, THREADS_SETTING, DefaultThreadCount());
	options.batch_size = GetCountSetting(context, BATCH_SIZE_SETTING, DEFAULT_BATCH_SIZE);
	idx_t inflight_setting = GetCountSetting(context, MAX_INFLIGHT_SETTING, 0);
	options.max_line_length = GetCountSetting(context, MAX_LINE_LENGTH_SETTING, SafeParsing::MAX_REGEX_LINE_LENGTH);
	CheckMaxLineLength(std::string("Setting ") + MAX_LINE_LENGTH_SETTING, options.max_line_length);
	Value backend_setting;
	if (context.TryGetCurrentSetting(BACKEND_SETTING, backend_setting) && !backend_setting.IsNull()) {
		auto backend_str = StringUtil::Lower(backend_setting.ToString());
		if (!TryParseBackendType(backend_str, options.backend)) {
			throw BinderException("Setting %s: unknown backend '%s'. Supported: local, scheduler", BACKEND_SETTING,
			                      backend_str);
		}
	}

	bool explicit_columns = false;
	idx_t explicit_inflight = 0;
	for (auto &kv : named_parameters) {
		auto loption = StringUtil::Lower(kv.first);
		auto &value = kv.second;
		if (loption == "col_names") {
			options.column_names = GetColumnNames(function_name, value);
			explicit_columns = true;
		} else if (loption == "on_error") {
			auto mode = value.IsNull() ? std::string() : StringUtil::Lower(value.ToString());
			if (!TryParseErrorMode(mode, options.error_mode)) {
				throw BinderException("%s: unknown on_error mode '%s'. Supported: raise, skip, ignore, include",
				                      function_name, mode);
			}
		} else if (loption == "allow_empty") {
			options.allow_empty = GetFlag(function_name, loption, value);
		} else if (loption == "threads") {
			options.threads = GetPositive(function_name, loption, value);
		} else if (loption == "batch_size") {
			options.batch_size = GetPositive(function_name, loption, value);
		} else if (loption == "max_inflight_batches") {
			explicit_inflight = GetPositive(function_name, loption, value);
		} else if (loption == "ordered") {
			options.ordered = GetFlag(function_name, loption, value);
		} else if (loption == "backend") {
			auto backend = value.IsNull() ? std::string() : StringUtil::Lower(value.ToString());
			if (!TryParseBackendType(backend, options.backend)) {
				throw BinderException("%s: unknown backend '%s'. Supported: local, scheduler", function_name,
				                      backend);
			}
		} else if (loption == "filename") {
			options.filename = GetFlag(function_name, loption, value);
		} else if (loption == "line_number") {
			options.line_number = GetFlag(function_name, loption, value);
		} else if (loption == "max_result_bytes") {
			options.max_result_bytes = GetPositive(function_name, loption, value);
		} else if (loption == "max_line_length") {
			options.max_line_length = GetPositive(function_name, loption, value);
			CheckMaxLineLength(function_name, options.max_line_length);
		} else {
			throw BinderException("%s: unknown parameter '%s'", function_name, kv.first);
		}
	}

	if (explicit_inflight > 0) {
		options.max_inflight_batches = explicit_inflight;
	} else if (inflight_setting > 0) {
		options.max_inflight_batches = inflight_setting;
	} else {
		options.max_inflight_batches = 2 * options.threads;
	}

	if (pattern.GroupCount() == 0) {
		throw BinderException("%s: regex \"%s\" has no capture groups", function_name, pattern.Pattern());
	}
	if (!explicit_columns) {
		options.column_names = pattern.DefaultColumnNames();
	} else if (options.column_names.size() != pattern.GroupCount()) {
		throw BinderException("%s: regex has %s capture groups but %s column names were given", function_name,
		                      std::to_string(pattern.GroupCount()), std::to_string(options.column_names.size()));
	}
	ValidateColumnNames(function_name, options);
	return options;
}

void AddNamedParameters(TableFunction &function, bool reads_files) {
	function.named_parameters["col_names"] = LogicalType::LIST(LogicalType::VARCHAR);
	function.named_parameters["on_error"] = LogicalType::VARCHAR;
	function.named_parameters["threads"] = LogicalType::BIGINT;
	function.named_parameters["batch_size"] = LogicalType::BIGINT;
	function.named_parameters["max_inflight_batches"] = LogicalType::BIGINT;
	function.named_parameters["ordered"] = LogicalType::BOOLEAN;
	function.named_parameters["backend"] = LogicalType::VARCHAR;
	function.named_parameters["line_number"] = LogicalType::BOOLEAN;
	function.named_parameters["max_result_bytes"] = LogicalType::BIGINT;
	function.named_parameters["max_line_length"] = LogicalType::BIGINT;
	if (reads_files) {
		function.named_parameters["allow_empty"] = LogicalType::BOOLEAN;
		function.named_parameters["filename"] = LogicalType::BOOLEAN;
	}
}

} // namespace regex_log
} // namespace duckdb
