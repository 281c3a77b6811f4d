#include "test_helpers.hpp"

#include "core/file_utils.hpp"

using namespace duckdb;
using namespace duckdb::regex_log;

TEST(ValidatePathTest, RejectsUnsafePaths) {
	EXPECT_FALSE(ValidatePath(""));
	EXPECT_FALSE(ValidatePath("../etc/passwd"));
	EXPECT_FALSE(ValidatePath("logs/../../secret"));
	EXPECT_FALSE(ValidatePath("logs/.."));
	EXPECT_FALSE(ValidatePath(std::string("a\0b", 3)));
	EXPECT_FALSE(ValidatePath(std::string(5000, 'a')));
}

TEST(ValidatePathTest, AcceptsOrdinaryPaths) {
	EXPECT_TRUE(ValidatePath("logs/app.log"));
	EXPECT_TRUE(ValidatePath("/var/log/*.log"));
	EXPECT_TRUE(ValidatePath("logs/weird...name.log"));
}

class ResolveFilesTest : public RegexLogTest {};

TEST_F(ResolveFilesTest, GlobMatchesAreSorted) {
	auto b = WriteFile("b.log", "");
	auto a = WriteFile("a.log", "");
	auto c = WriteFile("c.log", "");
	WriteFile("notes.txt", "");

	auto files = ResolveFiles(Context(), {TempPath("*.log")}, false);
	EXPECT_EQ(files, (vector<std::string> {a, b, c}));
}

TEST_F(ResolveFilesTest, PatternsKeepArgumentOrderAndDropDuplicates) {
	auto a = WriteFile("a.log", "");
	auto b = WriteFile("b.log", "");

	auto files = ResolveFiles(Context(), {b, TempPath("*.log")}, false);
	EXPECT_EQ(files, (vector<std::string> {b, a}));
}

TEST_F(ResolveFilesTest, PlainFileResolvesToItself) {
	auto a = WriteFile("single.log", "x\n");
	auto files = ResolveFiles(Context(), {a}, false);
	ASSERT_EQ(files.size(), 1u);
	EXPECT_EQ(files[0], a);
}

TEST_F(ResolveFilesTest, NothingFoundThrows) {
	EXPECT_THROW(ResolveFiles(Context(), {TempPath("*.missing")}, false), IOException);
	EXPECT_THROW(ResolveFiles(Context(), {TempPath("missing.log")}, false), IOException);
}

TEST_F(ResolveFilesTest, NothingFoundAllowedWhenEmptyIsAllowed) {
	auto files = ResolveFiles(Context(), {TempPath("*.missing")}, true);
	EXPECT_TRUE(files.empty());
}

TEST_F(ResolveFilesTest, InvalidPatternIsRejected) {
	EXPECT_THROW(ResolveFiles(Context(), {"../outside/*.log"}, true), InvalidInputException);
}

TEST_F(ResolveFilesTest, SameStateSameResult) {
	WriteFile("x1.log", "");
	WriteFile("x2.log", "");
	auto first = ResolveFiles(Context(), {TempPath("x*.log")}, false);
	auto second = ResolveFiles(Context(), {TempPath("x*.log")}, false);
	EXPECT_EQ(first, second);
	EXPECT_EQ(first.size(), 2u);
}
