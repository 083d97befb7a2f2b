#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <docindex/metadata/database.h>

namespace docindex::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version = 0;  ///< Migration version number
    std::string name; ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for migrations that need statements)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Migration history entry
 */
struct MigrationHistory {
    int version = 0;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration{0};
    bool success = false;
    std::string error;
};

/**
 * @brief Forward-only schema migration manager
 *
 * Each migration runs in its own transaction and is recorded in
 * schema_migrations. Failed attempts are recorded with their error.
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations in version order
     */
    Result<void> migrate();

    Result<std::vector<MigrationHistory>> getHistory();

    /**
     * @brief Run PRAGMA integrity_check plus the FTS5 integrity-check of ftsTable
     */
    Result<void> verifyIntegrity(const std::string& ftsTable);

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
};

/**
 * @brief Schema of the file catalog
 */
class CatalogMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    static Migration createFilesTable();
    static Migration createFilesFts();
    static Migration backfillFilesFts();
};

} // namespace docindex::metadata
