#include "test_helpers.hpp"

#include "core/file_utils.hpp"
#include "core/line_source.hpp"

using namespace duckdb;
using namespace duckdb::regex_log;

// Drain a source batch by batch, returning every record
static std::vector<LineRecord> ReadAll(LineSource &source, idx_t batch_size) {
	std::vector<LineRecord> records;
	LineBatch batch;
	while (source.NextBatch(batch_size, batch)) {
		EXPECT_LE(batch.records.size(), batch_size);
		for (auto &record : batch.records) {
			records.push_back(record);
		}
	}
	return records;
}

class LineReaderTest : public RegexLogTest {};

TEST_F(LineReaderTest, ReadsLinesWithoutTerminators) {
	auto path = WriteFile("plain.log", "first\nsecond\r\nthird");
	LineReader reader(*fs, path);

	std::vector<std::string> lines;
	while (reader.HasNext()) {
		lines.push_back(reader.NextLine());
	}
	EXPECT_EQ(lines, (std::vector<std::string> {"first", "second", "third"}));
	EXPECT_EQ(reader.LinesRead(), 3u);
	EXPECT_TRUE(reader.IsEOF());
}

TEST_F(LineReaderTest, EmptyLinesAreKept) {
	auto path = WriteFile("blank.log", "a\n\nb\n");
	LineReader reader(*fs, path);

	std::vector<std::string> lines;
	while (reader.HasNext()) {
		lines.push_back(reader.NextLine());
	}
	EXPECT_EQ(lines, (std::vector<std::string> {"a", "", "b"}));
}

TEST_F(LineReaderTest, LineLongerThanBuffer) {
	std::string long_line(200000, 'x');
	auto path = WriteFile("long.log", long_line + "\nshort\n");
	LineReader reader(*fs, path);

	ASSERT_TRUE(reader.HasNext());
	EXPECT_EQ(reader.NextLine(), long_line);
	ASSERT_TRUE(reader.HasNext());
	EXPECT_EQ(reader.NextLine(), "short");
	EXPECT_FALSE(reader.HasNext());
}

TEST_F(LineReaderTest, EmptyFileHasNoLines) {
	auto path = WriteFile("empty.log", "");
	LineReader reader(*fs, path);
	EXPECT_FALSE(reader.HasNext());
	EXPECT_EQ(reader.LinesRead(), 0u);
}

TEST_F(LineReaderTest, MissingFileThrows) {
	EXPECT_THROW(LineReader(*fs, TempPath("missing.log")), IOException);
}

class FileLineSourceTest : public RegexLogTest {};

TEST_F(FileLineSourceTest, WalksFilesInOrder) {
	auto a = WriteFile("a.log", "A 1\nB 2\n");
	auto b = WriteFile("b.log", "C 3\n");
	FileLineSource source(*fs, {a, b});

	auto records = ReadAll(source, 2);
	ASSERT_EQ(records.size(), 3u);
	EXPECT_EQ(records[0].file_index, 0u);
	EXPECT_EQ(records[0].line_index, 0u);
	EXPECT_EQ(records[1].text, "B 2");
	EXPECT_EQ(records[1].line_index, 1u);
	EXPECT_EQ(records[2].file_index, 1u);
	EXPECT_EQ(records[2].line_index, 0u);
	EXPECT_EQ(records[2].text, "C 3");

	EXPECT_EQ(source.FileCount(), 2u);
	EXPECT_EQ(source.FileName(1), b);
	EXPECT_EQ(source.LinesRead(), 3u);
	EXPECT_EQ(source.FilesUnreadable(), 0u);
}

TEST_F(FileLineSourceTest, BatchesSpanFileBoundaries) {
	auto a = WriteFile("a.log", "1\n2\n3\n");
	auto b = WriteFile("b.log", "4\n5\n");
	FileLineSource source(*fs, {a, b});

	LineBatch batch;
	ASSERT_TRUE(source.NextBatch(4, batch));
	ASSERT_EQ(batch.records.size(), 4u);
	EXPECT_EQ(batch.records[3].text, "4");
	EXPECT_EQ(batch.records[3].file_index, 1u);
	ASSERT_TRUE(source.NextBatch(4, batch));
	EXPECT_EQ(batch.records.size(), 1u);
	EXPECT_FALSE(source.NextBatch(4, batch));
}

TEST_F(FileLineSourceTest, UnreadableFileBecomesErrorRecord) {
	auto a = WriteFile("a.log", "A 1\n");
	auto c = WriteFile("c.log", "C 3\n");
	FileLineSource source(*fs, {a, TempPath("vanished.log"), c});

	auto records = ReadAll(source, 10);
	ASSERT_EQ(records.size(), 3u);
	EXPECT_FALSE(records[0].IsReadError());
	EXPECT_TRUE(records[1].IsReadError());
	EXPECT_EQ(records[1].file_index, 1u);
	EXPECT_EQ(records[1].line_index, 0u);
	EXPECT_EQ(records[2].text, "C 3");
	EXPECT_EQ(records[2].file_index, 2u);

	EXPECT_EQ(source.FilesUnreadable(), 1u);
	EXPECT_EQ(source.LinesRead(), 2u);
}

TEST(ContentLineSourceTest, SplitsLikeFiles) {
	ContentLineSource source("a\nb\r\nc\rd\ne\r");
	auto records = ReadAll(source, 3);
	ASSERT_EQ(records.size(), 4u);
	EXPECT_EQ(records[0].text, "a");
	EXPECT_EQ(records[1].text, "b");
	// A lone carriage return does not end a line
	EXPECT_EQ(records[2].text, "c\rd");
	EXPECT_EQ(records[3].text, "e");
	EXPECT_EQ(records[3].line_index, 3u);
	EXPECT_EQ(source.FileName(0), "");
}

TEST_F(FileLineSourceTest, ContentAndFileSplitTheSameBytes) {
	std::string bytes = "x 1\r\ny\r2\n\nz 3\r";
	auto path = WriteFile("same.log", bytes);
	FileLineSource file_source(*fs, {path});
	ContentLineSource content_source(bytes);

	auto from_file = ReadAll(file_source, 2);
	auto from_content = ReadAll(content_source, 2);
	ASSERT_EQ(from_file.size(), 4u);
	ASSERT_EQ(from_content.size(), from_file.size());
	for (idx_t i = 0; i < from_file.size(); i++) {
		EXPECT_EQ(from_content[i].text, from_file[i].text) << "line " << i;
		EXPECT_EQ(from_content[i].line_index, from_file[i].line_index);
	}
	EXPECT_EQ(from_file[1].text, "y\r2");
	EXPECT_EQ(from_file[2].text, "");
}

TEST(ContentLineSourceTest, TrailingNewlineAddsNoLine) {
	ContentLineSource source("x\ny\n");
	EXPECT_EQ(ReadAll(source, 10).size(), 2u);
	EXPECT_EQ(source.LinesRead(), 2u);
}

TEST(ContentLineSourceTest, EmptyContent) {
	ContentLineSource source("");
	LineBatch batch;
	EXPECT_FALSE(source.NextBatch(10, batch));
	EXPECT_TRUE(batch.records.empty());
}
