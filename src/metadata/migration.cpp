#include <spdlog/spdlog.h>
#include <docindex/metadata/migration.h>

namespace docindex::metadata {

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        )
    )");
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM schema_migrations WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0;
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    const int targetVersion = getLatestVersion();
    if (currentVersion >= targetVersion) {
        spdlog::debug("Catalog schema already at version {}", currentVersion);
        return {};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion) {
            continue;
        }
        spdlog::debug("Applying migration {} '{}'", version, migration.name);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("Could not record failed migration {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;

        currentVersion = version;
    }

    spdlog::info("Catalog schema migrated to version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM schema_migrations ORDER BY id");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::seconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);
        history.push_back(std::move(entry));
    }

    return history;
}

Result<void> MigrationManager::verifyIntegrity(const std::string& ftsTable) {
    auto stmtResult = db_.prepare("PRAGMA integrity_check");
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (stepResult.value() && stmt.getString(0) != "ok") {
        return Error{ErrorCode::CorruptedData, "Integrity check failed: " + stmt.getString(0)};
    }

    auto ftsCheck = db_.tableExists(ftsTable);
    if (ftsCheck && ftsCheck.value()) {
        auto ftsResult = db_.execute("INSERT INTO " + ftsTable + "(" + ftsTable +
                                     ") VALUES('integrity-check')");
        if (!ftsResult) {
            return Error{ErrorCode::CorruptedData, "FTS5 integrity check failed"};
        }
    }

    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        }
        return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT INTO schema_migrations "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    int64_t durationMs = duration.count();

    auto bindResult = stmt.bindAll(version, name, seconds, durationMs, success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

// CatalogMigrations implementation
std::vector<Migration> CatalogMigrations::getAllMigrations() {
    return {createFilesTable(), createFilesFts(), backfillFilesFts()};
}

Migration CatalogMigrations::createFilesTable() {
    Migration m;
    m.version = 1;
    m.name = "Create files table";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS files (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_path TEXT NOT NULL UNIQUE,
            file_name TEXT NOT NULL,
            resource_name TEXT NOT NULL,
            directory TEXT NOT NULL,
            size INTEGER,
            modified_time REAL,
            indexed_time REAL NOT NULL,
            content_hash TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_file_path ON files(file_path);
        CREATE INDEX IF NOT EXISTS idx_file_name ON files(file_name);
        CREATE INDEX IF NOT EXISTS idx_directory ON files(directory);
    )";
    return m;
}

Migration CatalogMigrations::createFilesFts() {
    Migration m;
    m.version = 2;
    m.name = "Create files_fts projection";
    // External-content table: rows are written explicitly next to every files mutation
    m.upSQL = R"(
        CREATE VIRTUAL TABLE IF NOT EXISTS files_fts USING fts5(
            file_path,
            file_name,
            resource_name,
            directory,
            content='files',
            content_rowid='id'
        );
    )";
    return m;
}

Migration CatalogMigrations::backfillFilesFts() {
    Migration m;
    m.version = 3;
    m.name = "Rebuild files_fts from files";
    m.upSQL = "INSERT INTO files_fts(files_fts) VALUES('rebuild');";
    return m;
}

} // namespace docindex::metadata
