#include <gtest/gtest.h>

#include "core/match_worker.hpp"

#include <stdexcept>
#include <thread>

using namespace duckdb;
using namespace duckdb::regex_log;

static LineRecord Line(const std::string &text, idx_t line_index = 0) {
	return LineRecord(0, line_index, text);
}

static LineBatch Batch(idx_t sequence, const std::vector<std::string> &lines) {
	LineBatch batch;
	batch.sequence = sequence;
	for (idx_t i = 0; i < lines.size(); i++) {
		batch.records.emplace_back(0, i, lines[i]);
	}
	return batch;
}

class MatchWorkerTest : public ::testing::Test {
protected:
	MatchWorkerTest() : pattern("^([A-Z]) (\\d+)$") {
	}

	CompiledPattern pattern;
};

TEST_F(MatchWorkerTest, SuccessReturnsCapturesInOrder) {
	auto result = MatchLine(pattern, 2, Line("A 1", 7));
	ASSERT_TRUE(result.IsSuccess());
	EXPECT_EQ(result.values, (std::vector<std::string> {"A", "1"}));
	EXPECT_EQ(result.line_index, 7u);
	EXPECT_TRUE(result.raw_text.empty());
}

TEST_F(MatchWorkerTest, NoMatchKeepsRawLine) {
	auto result = MatchLine(pattern, 2, Line("garbage"));
	EXPECT_EQ(result.status, MatchStatus::NO_MATCH);
	EXPECT_EQ(result.raw_text, "garbage");
	EXPECT_TRUE(result.values.empty());
}

TEST_F(MatchWorkerTest, SearchMatchesAnywhereUnlessAnchored) {
	CompiledPattern unanchored("id=(\\d+)");
	auto result = MatchLine(unanchored, 1, Line("request id=42 done"));
	ASSERT_TRUE(result.IsSuccess());
	EXPECT_EQ(result.values[0], "42");
}

TEST_F(MatchWorkerTest, UnmatchedOptionalGroupIsEmptyString) {
	CompiledPattern optional("^(\\w+)(?: \\[(\\w+)\\])?$");
	auto with_tag = MatchLine(optional, 2, Line("job [nightly]"));
	ASSERT_TRUE(with_tag.IsSuccess());
	EXPECT_EQ(with_tag.values, (std::vector<std::string> {"job", "nightly"}));

	auto without_tag = MatchLine(optional, 2, Line("job"));
	ASSERT_TRUE(without_tag.IsSuccess());
	EXPECT_EQ(without_tag.values, (std::vector<std::string> {"job", ""}));
}

TEST_F(MatchWorkerTest, GroupCountMismatchIsSchemaError) {
	auto result = MatchLine(pattern, 3, Line("A 1"));
	EXPECT_EQ(result.status, MatchStatus::SCHEMA_MISMATCH);
	EXPECT_EQ(result.raw_text, "A 1");
}

TEST_F(MatchWorkerTest, InvalidUtf8IsDecodeError) {
	auto result = MatchLine(pattern, 2, Line("A \xff\xfe"));
	EXPECT_EQ(result.status, MatchStatus::DECODE_ERROR);
}

TEST_F(MatchWorkerTest, CaptureSplittingCharacterIsDecodeError) {
	// "é" is two bytes; the single-byte group takes only the first one
	CompiledPattern byte_group("^(.)");
	auto result = MatchLine(byte_group, 1, Line("\xc3\xa9t\xc3\xa9"));
	EXPECT_EQ(result.status, MatchStatus::DECODE_ERROR);
}

TEST_F(MatchWorkerTest, OverlongLineIsWorkerErrorWithoutMatching) {
	CompiledPattern greedy("^([A-Z]) (.*)$");
	// Far beyond what recursive matching survives on a thread stack
	std::string line = "A " + std::string(2 * 1024 * 1024, 'x');
	auto result = MatchLine(greedy, 2, Line(line, 4));
	EXPECT_EQ(result.status, MatchStatus::WORKER_ERROR);
	EXPECT_EQ(result.message, "line exceeds " + std::to_string(SafeParsing::MAX_REGEX_LINE_LENGTH) + " bytes");
	EXPECT_EQ(result.raw_text.size(), line.size());
	EXPECT_EQ(result.line_index, 4u);
}

TEST_F(MatchWorkerTest, LineLengthLimitIsInclusive) {
	CompiledPattern greedy("^([A-Z]) (.*)$");
	std::string line = "A " + std::string(98, 'x');
	EXPECT_TRUE(MatchLine(greedy, 2, Line(line), 100).IsSuccess());
	EXPECT_EQ(MatchLine(greedy, 2, Line(line + "x"), 100).status, MatchStatus::WORKER_ERROR);
}

TEST_F(MatchWorkerTest, OverlongLinesOnPoolThreadsDoNotStopTheBatch) {
	CompiledPattern greedy("^([A-Z]) (.*)$");
	CancellationToken token;
	auto batch = Batch(0, {"A 1", "B " + std::string(1024 * 1024, 'y'), "C 3"});
	BatchResult result;
	std::thread worker([&] { result = MatchBatch(greedy, 2, batch, token); });
	worker.join();
	ASSERT_EQ(result.results.size(), 3u);
	EXPECT_TRUE(result.results[0].IsSuccess());
	EXPECT_EQ(result.results[1].status, MatchStatus::WORKER_ERROR);
	EXPECT_EQ(result.results[2].values[1], "3");
}

TEST_F(MatchWorkerTest, ReadErrorRecordPassesThrough) {
	LineRecord record(3, 12, std::string());
	record.read_error = "permission denied";
	auto result = MatchLine(pattern, 2, record);
	EXPECT_EQ(result.status, MatchStatus::UNREADABLE_FILE);
	EXPECT_EQ(result.file_index, 3u);
	EXPECT_EQ(result.line_index, 12u);
	EXPECT_EQ(result.message, "permission denied");
}

TEST_F(MatchWorkerTest, BatchKeepsRecordOrder) {
	CancellationToken token;
	auto result = MatchBatch(pattern, 2, Batch(5, {"A 1", "nope", "B 2"}), token);
	EXPECT_EQ(result.sequence, 5u);
	EXPECT_FALSE(result.cancelled);
	ASSERT_EQ(result.results.size(), 3u);
	EXPECT_TRUE(result.results[0].IsSuccess());
	EXPECT_EQ(result.results[1].status, MatchStatus::NO_MATCH);
	EXPECT_EQ(result.results[2].values[0], "B");
	EXPECT_TRUE(result.HasFailure());
}

TEST_F(MatchWorkerTest, CancelledBatchReturnsNoResults) {
	CancellationToken token;
	token.CancelAfter(3);
	auto cancelled = MatchBatch(pattern, 2, Batch(4, {"A 1"}), token);
	EXPECT_TRUE(cancelled.cancelled);
	EXPECT_TRUE(cancelled.results.empty());

	// At or below the cut still runs
	auto kept = MatchBatch(pattern, 2, Batch(3, {"A 1"}), token);
	EXPECT_FALSE(kept.cancelled);
	EXPECT_EQ(kept.results.size(), 1u);
}

TEST_F(MatchWorkerTest, ExceptionInBatchFailsEveryLine) {
	CancellationToken token;
	auto batch = Batch(6, {"A 1", "B 2", "C 3"});
	auto result = MatchBatch(batch, token, [&](const LineRecord &record) {
		if (record.text == "B 2") {
			throw std::runtime_error("out of scratch space");
		}
		return MatchLine(pattern, 2, record);
	});
	EXPECT_EQ(result.sequence, 6u);
	EXPECT_FALSE(result.cancelled);
	ASSERT_EQ(result.results.size(), 3u);
	for (idx_t i = 0; i < result.results.size(); i++) {
		EXPECT_EQ(result.results[i].status, MatchStatus::WORKER_ERROR);
		EXPECT_EQ(result.results[i].message, "worker failed: out of scratch space");
		EXPECT_EQ(result.results[i].line_index, i);
	}
	EXPECT_EQ(result.results[0].raw_text, "A 1");
}

TEST(CancellationTokenTest, KeepsSmallestCut) {
	CancellationToken token;
	EXPECT_FALSE(token.AnyCancelled());
	EXPECT_FALSE(token.IsCancelled(100));

	token.CancelAfter(10);
	token.CancelAfter(20);
	token.CancelAfter(4);
	EXPECT_TRUE(token.AnyCancelled());
	EXPECT_FALSE(token.IsCancelled(4));
	EXPECT_TRUE(token.IsCancelled(5));
}

TEST(FailBatchTest, EveryLineBecomesWorkerError) {
	auto result = FailBatch(Batch(2, {"A 1", "B 2"}), "boom");
	ASSERT_EQ(result.results.size(), 2u);
	for (auto &match : result.results) {
		EXPECT_EQ(match.status, MatchStatus::WORKER_ERROR);
		EXPECT_EQ(match.message, "boom");
	}
	EXPECT_EQ(result.results[1].raw_text, "B 2");
}
