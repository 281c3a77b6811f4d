#include "include/read_regex_log_function.hpp"
#include "core/file_utils.hpp"
#include "core/line_source.hpp"
#include "core/parse_engine.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"

namespace duckdb {

// First argument of read_regex_log: one path pattern or a list of them
static vector<std::string> GetPathPatterns(const Value &value) {
	if (value.IsNull()) {
		throw BinderException("read_regex_log: path cannot be NULL");
	}
	vector<std::string> patterns;
	if (value.type().id() == LogicalTypeId::LIST) {
		for (auto &child : ListValue::GetChildren(value)) {
			if (child.IsNull()) {
				throw BinderException("read_regex_log: path list cannot contain NULL");
			}
			patterns.push_back(StringValue::Get(child));
		}
		if (patterns.empty()) {
			throw BinderException("read_regex_log: path list cannot be empty");
		}
	} else {
		patterns.push_back(value.ToString());
	}
	return patterns;
}

static std::shared_ptr<regex_log::CompiledPattern> GetPattern(const std::string &function_name, const Value &value) {
	if (value.IsNull()) {
		throw BinderException("%s: regex cannot be NULL", function_name);
	}
	return std::make_shared<regex_log::CompiledPattern>(value.ToString());
}

static void SetReturnSchema(const RegexLogBindData &bind_data, vector<LogicalType> &return_types,
                            vector<string> &names) {
	auto layout = bind_data.options.Layout();
	return_types = layout.Types();
	names = layout.Names();
}

unique_ptr<FunctionData> ReadRegexLogBind(ClientContext &context, TableFunctionBindInput &input,
                                          vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<RegexLogBindData>();

	if (input.inputs.size() < 2) {
		throw BinderException("read_regex_log requires two parameters (path, regex)");
	}
	bind_data->patterns = GetPathPatterns(input.inputs[0]);
	bind_data->pattern = GetPattern("read_regex_log", input.inputs[1]);
	bind_data->options =
	    regex_log::BindParseOptions(context, input.named_parameters, *bind_data->pattern, "read_regex_log");

	// Only once the configuration is known to be valid do we look at the file system
	bind_data->files = regex_log::ResolveFiles(context, bind_data->patterns, bind_data->options.allow_empty);
	DUCKDB_LOG_DEBUG(context, StringUtil::Format("regex_log: %s resolved to %s files",
	                                             StringUtil::Join(bind_data->patterns, ", "),
	                                             std::to_string(bind_data->files.size())));

	SetReturnSchema(*bind_data, return_types, names);
	return std::move(bind_data);
}

unique_ptr<FunctionData> ParseRegexLogBind(ClientContext &context, TableFunctionBindInput &input,
                                           vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<RegexLogBindData>();

	if (input.inputs.size() < 2) {
		throw BinderException("parse_regex_log requires two parameters (content, regex)");
	}
	bind_data->from_content = true;
	// NULL content parses like empty content
	if (!input.inputs[0].IsNull()) {
		bind_data->content = input.inputs[0].ToString();
	}
	bind_data->pattern = GetPattern("parse_regex_log", input.inputs[1]);
	bind_data->options =
	    regex_log::BindParseOptions(context, input.named_parameters, *bind_data->pattern, "parse_regex_log");

	SetReturnSchema(*bind_data, return_types, names);
	return std::move(bind_data);
}

unique_ptr<GlobalTableFunctionState> RegexLogInitGlobal(ClientContext &context, TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<RegexLogBindData>();
	auto global_state = make_uniq<RegexLogGlobalState>();

	unique_ptr<regex_log::LineSource> source;
	std::string description;
	if (bind_data.from_content) {
		source = make_uniq<regex_log::ContentLineSource>(bind_data.content);
		description = "<content>";
	} else {
		source = make_uniq<regex_log::FileLineSource>(FileSystem::GetFileSystem(context), bind_data.files);
		description = StringUtil::Join(bind_data.patterns, ", ");
	}

	auto run = regex_log::RunParse(context, *bind_data.pattern, bind_data.options, *source, description);
	global_state->table = std::move(run.table);
	global_state->table->InitializeScan(global_state->scan_state);
	return std::move(global_state);
}

void RegexLogFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &global_state = data_p.global_state->Cast<RegexLogGlobalState>();
	global_state.table->Scan(global_state.scan_state, output);
}

TableFunctionSet GetReadRegexLogFunction() {
	TableFunctionSet set("read_regex_log");

	// read_regex_log(path, regex)
	TableFunction single_path("read_regex_log", {LogicalType::VARCHAR, LogicalType::VARCHAR}, RegexLogFunction,
	                          ReadRegexLogBind, RegexLogInitGlobal);
	regex_log::AddNamedParameters(single_path, true);
	set.AddFunction(single_path);

	// read_regex_log([path, ...], regex)
	TableFunction path_list("read_regex_log", {LogicalType::LIST(LogicalType::VARCHAR), LogicalType::VARCHAR},
	                        RegexLogFunction, ReadRegexLogBind, RegexLogInitGlobal);
	regex_log::AddNamedParameters(path_list, true);
	set.AddFunction(path_list);

	return set;
}

TableFunction GetParseRegexLogFunction() {
	TableFunction func("parse_regex_log", {LogicalType::VARCHAR, LogicalType::VARCHAR}, RegexLogFunction,
	                   ParseRegexLogBind, RegexLogInitGlobal);
	regex_log::AddNamedParameters(func, false);
	return func;
}

} // namespace duckdb
