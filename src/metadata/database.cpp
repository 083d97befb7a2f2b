#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <docindex/metadata/database.h>

namespace docindex::metadata {

namespace {

constexpr int kStepAttempts = 5;
constexpr auto kFirstBackoff = std::chrono::milliseconds(10);
constexpr int kBusyTimeoutMs = 5000;
constexpr size_t kSqlSnippetLength = 100;

bool isContention(int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

// sqlite3_step with backoff while another connection holds the lock
int stepWithRetry(sqlite3_stmt* stmt) {
    auto delay = kFirstBackoff;
    int rc = sqlite3_step(stmt);
    for (int attempt = 1; attempt < kStepAttempts && isContention(rc); ++attempt) {
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(delay);
        delay *= 2;
        rc = sqlite3_step(stmt);
    }
    return rc;
}

std::string describeFailure(sqlite3_stmt* stmt, int rc) {
    std::string message = sqlite3_errstr(rc);
    if (sqlite3* db = sqlite3_db_handle(stmt)) {
        message += ": ";
        message += sqlite3_errmsg(db);
    }
    if (rc == SQLITE_CONSTRAINT) {
        if (const char* sql = sqlite3_sql(stmt)) {
            std::string_view text(sql);
            message += " [SQL: ";
            message += text.substr(0, kSqlSnippetLength);
            if (text.size() > kSqlSnippetLength)
                message += "...";
            message += "]";
        }
    }
    return message;
}

int openFlags(ConnectionMode mode) {
    int flags = SQLITE_OPEN_NOMUTEX;
    switch (mode) {
        case ConnectionMode::ReadOnly:
            return flags | SQLITE_OPEN_READONLY;
        case ConnectionMode::ReadWrite:
            return flags | SQLITE_OPEN_READWRITE;
        case ConnectionMode::Create:
            return flags | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }
    return flags | SQLITE_OPEN_READWRITE;
}

} // namespace

Statement::Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr) !=
        SQLITE_OK) {
        std::string reason = sqlite3_errmsg(db);
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw std::runtime_error("Failed to prepare statement: " + reason);
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> Statement::checkBind(int rc, const char* kind) const {
    if (rc == SQLITE_OK)
        return {};
    return Error{ErrorCode::DatabaseError,
                 std::string("Failed to bind ") + kind + ": " + describeFailure(stmt_, rc)};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), "null");
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value), "int64");
}

Result<void> Statement::bind(int index, double value) {
    return checkBind(sqlite3_bind_double(stmt_, index, value), "double");
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                       SQLITE_TRANSIENT),
                     "text");
}

Result<void> Statement::execute() {
    const int rc = stepWithRetry(stmt_);
    // Pragmas and RETURNING clauses report a row; the write still happened
    if (rc == SQLITE_DONE || rc == SQLITE_ROW)
        return {};
    return Error{ErrorCode::DatabaseError,
                 "Failed to execute statement: " + describeFailure(stmt_, rc)};
}

Result<bool> Statement::step() {
    const int rc = stepWithRetry(stmt_);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return Error{ErrorCode::DatabaseError,
                 "Failed to step statement: " + describeFailure(stmt_, rc)};
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    close();

    const int rc = sqlite3_open_v2(path.c_str(), &db_, openFlags(mode), nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::DatabaseError, "Failed to open database " + path + ": " + reason};
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        if (inTransaction_) {
            spdlog::warn("Closing {} with an open transaction; it will be rolled back", path_);
        }
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string reason = errMsg ? errMsg : sqlite3_errmsg(db_);
        sqlite3_free(errMsg);
        spdlog::debug("SQL failed ({}): {}", reason, sql);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + reason};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }
    auto result = execute("BEGIN IMMEDIATE");
    inTransaction_ = result.has_value();
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("COMMIT");
    if (!result) {
        // A failed COMMIT leaves the transaction open
        (void)rollback();
        return Error{ErrorCode::TransactionFailed, result.error().message};
    }
    inTransaction_ = false;
    return {};
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }
    inTransaction_ = false;
    return execute("ROLLBACK");
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmtResult =
        prepare("SELECT 1 FROM sqlite_master WHERE type IN ('table', 'view') AND name = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto bound = stmt.bind(1, table); !bound)
        return bound.error();

    return stmt.step();
}

bool Database::hasFTS5() {
    return sqlite3_compileoption_used("ENABLE_FTS5") == 1;
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

} // namespace docindex::metadata
