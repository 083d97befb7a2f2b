#include <gtest/gtest.h>
#include <filesystem>
#include <docindex/metadata/database.h>
#include "../../common/test_helpers.h"

using namespace docindex;
using namespace docindex::metadata;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::makeTempDir("docindex_db");
        dbPath_ = dir_ / "test.db";
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
    std::filesystem::path dbPath_;
};

TEST_F(DatabaseTest, OpenClose) {
    Database db;
    ASSERT_FALSE(db.isOpen());

    auto result = db.open(dbPath_.string(), ConnectionMode::Create);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(db.isOpen());
    EXPECT_EQ(db.path(), dbPath_.string());

    db.close();
    ASSERT_FALSE(db.isOpen());
}

TEST_F(DatabaseTest, ReadOnlyOpenOfMissingFileFails) {
    Database db;
    auto result = db.open((dir_ / "missing.db").string(), ConnectionMode::ReadOnly);
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(db.isOpen());
}

TEST_F(DatabaseTest, PrepareOnClosedDatabaseFails) {
    Database db;
    auto stmt = db.prepare("SELECT 1");
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().code, ErrorCode::InvalidState);
}

TEST_F(DatabaseTest, VerifyFTS5Support) {
    EXPECT_TRUE(Database::hasFTS5()) << "FTS5 support is required";
}

TEST_F(DatabaseTest, BindAndStep) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, size INTEGER, "
                           "score REAL)")
                    .has_value());

    {
        auto stmtResult = db.prepare("INSERT INTO t (name, size, score) VALUES (?, ?, ?)");
        ASSERT_TRUE(stmtResult.has_value());
        Statement stmt = std::move(stmtResult).value();
        ASSERT_TRUE(stmt.bindAll(std::string("readme.md"), int64_t{1} << 40, 0.5).has_value());
        ASSERT_TRUE(stmt.execute().has_value());
    }
    EXPECT_EQ(db.lastInsertRowId(), 1);
    EXPECT_EQ(db.changes(), 1);

    auto stmtResult = db.prepare("SELECT name, size, score, NULL FROM t WHERE id = ?");
    ASSERT_TRUE(stmtResult.has_value());
    Statement stmt = std::move(stmtResult).value();
    ASSERT_TRUE(stmt.bind(1, 1).has_value());

    auto step = stmt.step();
    ASSERT_TRUE(step.has_value());
    ASSERT_TRUE(step.value());
    EXPECT_EQ(stmt.columnCount(), 4);
    EXPECT_EQ(stmt.getString(0), "readme.md");
    EXPECT_EQ(stmt.getInt64(1), int64_t{1} << 40);
    EXPECT_DOUBLE_EQ(stmt.getDouble(2), 0.5);
    EXPECT_TRUE(stmt.isNull(3));

    step = stmt.step();
    ASSERT_TRUE(step.has_value());
    EXPECT_FALSE(step.value());
}

TEST_F(DatabaseTest, TransactionRollsBackOnFailure) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (id INTEGER PRIMARY KEY)").has_value());

    auto result = db.transaction([&]() -> Result<void> {
        auto insert = db.execute("INSERT INTO t (id) VALUES (1)");
        if (!insert)
            return insert;
        return Error{ErrorCode::InvalidData, "abort"};
    });
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(db.inTransaction());

    auto stmtResult = db.prepare("SELECT COUNT(*) FROM t");
    ASSERT_TRUE(stmtResult.has_value());
    Statement stmt = std::move(stmtResult).value();
    ASSERT_TRUE(stmt.step().value());
    EXPECT_EQ(stmt.getInt(0), 0);
}

TEST_F(DatabaseTest, TransactionCommits) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.execute("CREATE TABLE t (id INTEGER PRIMARY KEY)").has_value());

    auto result =
        db.transaction([&]() -> Result<void> { return db.execute("INSERT INTO t VALUES (7)"); });
    ASSERT_TRUE(result.has_value());

    auto exists = db.tableExists("t");
    ASSERT_TRUE(exists.has_value());
    EXPECT_TRUE(exists.value());
    EXPECT_FALSE(db.tableExists("nope").value());
}

TEST_F(DatabaseTest, NestedBeginIsRejected) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    ASSERT_TRUE(db.beginTransaction().has_value());

    auto nested = db.beginTransaction();
    ASSERT_FALSE(nested.has_value());
    EXPECT_EQ(nested.error().code, ErrorCode::InvalidState);

    EXPECT_TRUE(db.rollback().has_value());
    EXPECT_FALSE(db.commit().has_value());
}

TEST_F(DatabaseTest, InvalidSqlReportsDatabaseError) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());

    auto stmt = db.prepare("SELEC nonsense");
    ASSERT_FALSE(stmt.has_value());
    EXPECT_EQ(stmt.error().code, ErrorCode::DatabaseError);

    EXPECT_FALSE(db.execute("DROP TABLE missing_table").has_value());
}

TEST_F(DatabaseTest, EnableWAL) {
    Database db;
    ASSERT_TRUE(db.open(dbPath_.string(), ConnectionMode::Create).has_value());
    EXPECT_TRUE(db.enableWAL().has_value());
    EXPECT_FALSE(Database::version().empty());
}
