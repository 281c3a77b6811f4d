#pragma once

#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>

#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/main/client_context.hpp"
#include "regex_log_extension.hpp"

namespace duckdb {
namespace regex_log {

// In-memory database with the extension loaded and a scratch directory
class RegexLogTest : public ::testing::Test {
protected:
	RegexLogTest() : db(nullptr), con(db), fs(FileSystem::CreateLocal()) {
	}

	void SetUp() override {
		db.LoadStaticExtension<RegexLogExtension>();

		auto info = ::testing::UnitTest::GetInstance()->current_test_info();
		const char *tmp = std::getenv("TMPDIR");
		temp_dir = fs->JoinPath(tmp ? tmp : "/tmp",
		                        std::string("regex_log_") + info->test_suite_name() + "_" + info->name());
		if (fs->DirectoryExists(temp_dir)) {
			fs->RemoveDirectory(temp_dir);
		}
		fs->CreateDirectory(temp_dir);
	}

	void TearDown() override {
		if (fs->DirectoryExists(temp_dir)) {
			fs->RemoveDirectory(temp_dir);
		}
	}

	ClientContext &Context() {
		return *con.context;
	}

	std::string TempPath(const std::string &name) {
		return fs->JoinPath(temp_dir, name);
	}

	// Write content to a file in the scratch directory and return its path
	std::string WriteFile(const std::string &name, const std::string &content) {
		auto path = TempPath(name);
		auto handle = fs->OpenFile(path, FileFlags::FILE_FLAGS_WRITE | FileFlags::FILE_FLAGS_FILE_CREATE_NEW);
		if (!content.empty()) {
			handle->Write(const_cast<char *>(content.data()), content.size());
		}
		handle->Sync();
		return path;
	}

	// Run a query that must succeed and return its materialized result
	unique_ptr<MaterializedQueryResult> Query(const std::string &sql) {
		auto result = con.Query(sql);
		EXPECT_FALSE(result->HasError()) << sql << "\n" << result->GetError();
		return result;
	}

	// Run a query that must fail and return its error message
	std::string QueryError(const std::string &sql) {
		auto result = con.Query(sql);
		EXPECT_TRUE(result->HasError()) << "expected failure: " << sql;
		return result->HasError() ? result->GetError() : std::string();
	}

	// One string per row, columns joined by '|', NULL as "NULL"
	static std::vector<std::string> Rows(MaterializedQueryResult &result) {
		std::vector<std::string> rows;
		for (idx_t row = 0; row < result.RowCount(); row++) {
			std::string line;
			for (idx_t col = 0; col < result.ColumnCount(); col++) {
				if (col > 0) {
					line += "|";
				}
				auto value = result.GetValue(col, row);
				line += value.IsNull() ? "NULL" : value.ToString();
			}
			rows.push_back(line);
		}
		return rows;
	}

	DuckDB db;
	Connection con;
	unique_ptr<FileSystem> fs;
	std::string temp_dir;
};

} // namespace regex_log
} // namespace duckdb
