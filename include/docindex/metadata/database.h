#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <docindex/core/types.h>

namespace docindex::metadata {

enum class ConnectionMode {
    ReadWrite, ///< Existing database only
    ReadOnly,
    Create ///< Create the file when missing
};

/**
 * @brief Prepared statement owning its sqlite3_stmt
 *
 * Parameters are 1-based, result columns 0-based. Stepping retries with
 * exponential backoff while the database reports SQLITE_BUSY or SQLITE_LOCKED.
 */
class Statement {
public:
    Statement() = default;

    /// Throws std::runtime_error when the SQL does not compile
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind args to parameters 1..N, stopping at the first failure
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> result;
        ((result ? (void)(result = bind(++index, std::forward<Args>(args))) : (void)0), ...);
        return result;
    }

    /**
     * @brief Run a statement that produces no rows of interest
     */
    Result<void> execute();

    /**
     * @return true while a row is available
     */
    Result<bool> step();

    int getInt(int column) const { return sqlite3_column_int(stmt_, column); }
    int64_t getInt64(int column) const { return sqlite3_column_int64(stmt_, column); }
    double getDouble(int column) const { return sqlite3_column_double(stmt_, column); }
    std::string getString(int column) const;
    bool isNull(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }
    int columnCount() const { return sqlite3_column_count(stmt_); }

private:
    Result<void> checkBind(int rc, const char* kind) const;

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Single SQLite connection
 *
 * Owners serialize access; the connection is opened with SQLITE_OPEN_NOMUTEX.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Run one or more parameterless statements
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Run func inside BEGIN IMMEDIATE / COMMIT
     *
     * A failed result or an exception from func rolls the transaction back; the
     * exception is rethrown.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        if (auto begun = beginTransaction(); !begun)
            return begun;

        Result<void> result;
        try {
            result = func();
        } catch (...) {
            (void)rollback();
            throw;
        }

        if (!result) {
            (void)rollback();
            return result;
        }
        return commit();
    }

    int64_t lastInsertRowId() const { return db_ ? sqlite3_last_insert_rowid(db_) : 0; }
    int changes() const { return db_ ? sqlite3_changes(db_) : 0; }

    Result<bool> tableExists(const std::string& table);

    /**
     * @brief Whether the linked SQLite was compiled with FTS5
     */
    static bool hasFTS5();

    Result<void> enableWAL();

    static std::string version() { return sqlite3_libversion(); }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace docindex::metadata
