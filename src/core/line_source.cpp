#include "line_source.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {
namespace regex_log {

FileLineSource::FileLineSource(FileSystem &fs_p, vector<std::string> files_p)
    : fs(fs_p), files(std::move(files_p)) {
}

void FileLineSource::CloseCurrent() {
	reader.reset();
	current_file++;
}

bool FileLineSource::NextBatch(idx_t max_lines, LineBatch &batch) {
	batch.records.clear();
	while (batch.records.size() < max_lines && current_file < files.size()) {
		idx_t line_index = reader ? reader->LinesRead() : 0;
		try {
			if (!reader) {
				reader = make_uniq<LineReader>(fs, files[current_file]);
			}
			if (!reader->HasNext()) {
				CloseCurrent();
				continue;
			}
			line_index = reader->LinesRead();
			batch.records.emplace_back(current_file, line_index, reader->NextLine());
			lines_read++;
		} catch (const IOException &e) {
			// The file stops here; report it in-line so the policy sees it in canonical order
			LineRecord record(current_file, line_index, std::string());
			record.read_error = ErrorData(e).RawMessage();
			batch.records.push_back(std::move(record));
			files_unreadable++;
			CloseCurrent();
		}
	}
	return !batch.records.empty();
}

ContentLineSource::ContentLineSource(std::string content_p) : content(std::move(content_p)) {
}

bool ContentLineSource::NextBatch(idx_t max_lines, LineBatch &batch) {
	batch.records.clear();
	while (batch.records.size() < max_lines && position < content.size()) {
		size_t end = content.find('\n', position);
		if (end == std::string::npos) {
			end = content.size();
		}
		auto line = content.substr(position, end - position);
		// Same rule as LineReader: "\n" ends a line and a "\r" before it is dropped
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		batch.records.emplace_back(0, lines_read, std::move(line));
		lines_read++;
		position = end + 1;
	}
	return !batch.records.empty();
}

} // namespace regex_log
} // namespace duckdb
