#include <spdlog/spdlog.h>
#include <chrono>
#include <system_error>
#include <docindex/common/pattern_utils.h>
#include <docindex/metadata/file_catalog.h>
#include <docindex/metadata/fts_query.h>
#include <docindex/metadata/migration.h>

namespace fs = std::filesystem;

namespace docindex::metadata {

namespace {

constexpr const char* kFileColumns = "f.id, f.file_path, f.file_name, f.resource_name, f.directory, "
                                     "f.size, f.modified_time, f.indexed_time, f.content_hash";

IndexedFile mapFileRow(const Statement& stmt) {
    IndexedFile file;
    file.id = stmt.getInt64(0);
    file.filePath = stmt.getString(1);
    file.fileName = stmt.getString(2);
    file.resourceName = stmt.getString(3);
    file.directory = stmt.getString(4);
    file.size = stmt.getInt64(5);
    file.modifiedTime = stmt.getDouble(6);
    file.indexedTime = stmt.getDouble(7);
    file.contentHash = stmt.getString(8);
    return file;
}

Result<std::vector<IndexedFile>> collectRows(Statement& stmt) {
    std::vector<IndexedFile> files;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        files.push_back(mapFileRow(stmt));
    }
    return files;
}

double toEpochSeconds(fs::file_time_type t) {
    auto sys = std::chrono::file_clock::to_sys(t);
    return std::chrono::duration<double>(sys.time_since_epoch()).count();
}

double nowSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Escape LIKE metacharacters so the filter is a literal substring
std::string likeContains(const std::string& text) {
    std::string out = "%";
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('%');
    return out;
}

// Absolute, normalized and without a trailing separator
fs::path normalizeRoot(const fs::path& root) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec)
        abs = root;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path())
        abs = abs.parent_path();
    return abs;
}

bool hasHiddenComponent(const fs::path& relative) {
    for (const auto& part : relative) {
        auto name = part.string();
        if (name.size() > 1 && name[0] == '.' && name != "..")
            return true;
    }
    return false;
}

Result<void> ftsInsert(Database& db, const IndexedFile& file) {
    auto stmtResult = db.prepare(R"(
        INSERT INTO files_fts (rowid, file_path, file_name, resource_name, directory)
        VALUES (?, ?, ?, ?, ?)
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(file.id, file.filePath, file.fileName, file.resourceName,
                                   file.directory);
    if (!bindResult)
        return bindResult.error();
    return stmt.execute();
}

// External-content tables need the old column values to drop index entries
Result<void> ftsDelete(Database& db, const IndexedFile& file) {
    auto stmtResult = db.prepare(R"(
        INSERT INTO files_fts (files_fts, rowid, file_path, file_name, resource_name, directory)
        VALUES ('delete', ?, ?, ?, ?, ?)
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(file.id, file.filePath, file.fileName, file.resourceName,
                                   file.directory);
    if (!bindResult)
        return bindResult.error();
    return stmt.execute();
}

Result<std::optional<IndexedFile>> findByPath(Database& db, const std::string& filePath) {
    auto stmtResult =
        db.prepare(std::string("SELECT ") + kFileColumns + " FROM files f WHERE f.file_path = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, filePath);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (!stepResult.value()) {
        return std::optional<IndexedFile>{};
    }
    return std::optional<IndexedFile>{mapFileRow(stmt)};
}

Result<void> insertFile(Database& db, IndexedFile& file) {
    auto stmtResult = db.prepare(R"(
        INSERT INTO files (file_path, file_name, resource_name, directory, size,
                           modified_time, indexed_time, content_hash)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult =
        stmt.bindAll(file.filePath, file.fileName, file.resourceName, file.directory, file.size,
                     file.modifiedTime, file.indexedTime, file.contentHash);
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult;

    file.id = db.lastInsertRowId();
    return ftsInsert(db, file);
}

Result<void> updateFile(Database& db, const IndexedFile& previous, const IndexedFile& file) {
    auto deleteResult = ftsDelete(db, previous);
    if (!deleteResult)
        return deleteResult;

    auto stmtResult = db.prepare(R"(
        UPDATE files SET
            file_name = ?, resource_name = ?, directory = ?, size = ?,
            modified_time = ?, indexed_time = ?, content_hash = ?
        WHERE id = ?
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(file.fileName, file.resourceName, file.directory, file.size,
                                   file.modifiedTime, file.indexedTime, file.contentHash, file.id);
    if (!bindResult)
        return bindResult.error();

    auto execResult = stmt.execute();
    if (!execResult)
        return execResult;

    return ftsInsert(db, file);
}

} // namespace

FileCatalog::FileCatalog(fs::path databasePath)
    : FileCatalog(std::move(databasePath), nullptr) {}

FileCatalog::FileCatalog(fs::path databasePath, std::unique_ptr<crypto::IContentHasher> hasher)
    : databasePath_(std::move(databasePath)),
      hasher_(hasher ? std::move(hasher) : crypto::createSHA256Hasher()) {}

FileCatalog::~FileCatalog() {
    close();
}

Result<void> FileCatalog::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_.isOpen())
        return {};

    auto parent = databasePath_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::DatabaseError,
                         "Failed to create catalog directory " + parent.string() + ": " +
                             ec.message()};
        }
    }

    auto openResult = db_.open(databasePath_.string(), ConnectionMode::Create);
    if (!openResult)
        return openResult;

    if (!Database::hasFTS5()) {
        db_.close();
        return Error{ErrorCode::NotSupported, "SQLite was built without FTS5"};
    }

    if (auto walResult = db_.enableWAL(); !walResult) {
        spdlog::warn("Catalog: WAL unavailable, using default journal: {}",
                     walResult.error().message);
    }

    MigrationManager migrations(db_);
    auto initResult = migrations.initialize();
    if (!initResult) {
        db_.close();
        return initResult;
    }
    migrations.registerMigrations(CatalogMigrations::getAllMigrations());

    auto migrateResult = migrations.migrate();
    if (!migrateResult) {
        spdlog::error("Catalog: migration failed: {}", migrateResult.error().message);
        db_.close();
        return migrateResult;
    }

    spdlog::debug("Catalog opened at {} (SQLite {})", databasePath_.string(), Database::version());
    return {};
}

void FileCatalog::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.close();
}

bool FileCatalog::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.isOpen();
}

template <typename T>
Result<T> FileCatalog::executeQuery(std::function<Result<T>(Database&)> func) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen()) {
        return Error{ErrorCode::NotInitialized, "Catalog is not open"};
    }
    return func(db_);
}

Result<ScanResult> FileCatalog::indexDirectory(const fs::path& root, const ScanOptions& options) {
    return executeQuery<ScanResult>(
        [&](Database&) -> Result<ScanResult> { return scanLocked(root, options); });
}

Result<ScanResult> FileCatalog::scanLocked(const fs::path& rootIn, const ScanOptions& options) {
    ScanResult result;

    std::error_code ec;
    if (!fs::is_directory(rootIn, ec)) {
        spdlog::warn("Catalog: scan root {} does not exist or is not a directory",
                     rootIn.string());
        return result;
    }

    const fs::path root = normalizeRoot(rootIn);
    const double scanTime = nowSeconds();

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Catalog: cannot walk {}: {}", root.string(), ec.message());
        return result;
    }

    fs::recursive_directory_iterator end;
    auto txResult = db_.transaction([&]() -> Result<void> {
        for (; it != end; it.increment(ec)) {
            if (ec)
                break;

            const auto& entry = *it;
            const fs::path& path = entry.path();
            const std::string name = path.filename().string();
            const bool hidden = !name.empty() && name[0] == '.';

            std::error_code typeEc;
            if (entry.is_directory(typeEc)) {
                if ((options.excludeHidden && hidden) ||
                    (options.maxDepth && it.depth() >= *options.maxDepth)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!entry.is_regular_file(typeEc))
                continue;

            const fs::path relative = path.lexically_relative(root);
            if (options.excludeHidden && hasHiddenComponent(relative))
                continue;
            if (options.maxDepth && it.depth() > *options.maxDepth)
                continue;
            if (!common::glob_match(name, options.pattern))
                continue;

            const std::string relativeStr = relative.generic_string();
            if (common::matches_any(relativeStr, options.excludePatterns) ||
                common::matches_any(name, options.excludePatterns)) {
                ++result.counts.skipped;
                continue;
            }

            std::error_code statEc;
            auto size = entry.file_size(statEc);
            fs::file_time_type mtime{};
            if (!statEc)
                mtime = entry.last_write_time(statEc);
            if (statEc) {
                spdlog::warn("Catalog: cannot stat {}: {}", path.string(), statEc.message());
                ++result.counts.skipped;
                continue;
            }
            if (options.maxFileSize > 0 && size > options.maxFileSize) {
                spdlog::debug("Catalog: skipping {} ({} bytes exceeds limit)", path.string(),
                              size);
                ++result.counts.skipped;
                continue;
            }

            IndexedFile file;
            file.filePath = path.string();
            file.fileName = name;
            file.resourceName = fs::path(relative).replace_extension().generic_string();
            file.directory = path.parent_path().string();
            file.size = static_cast<int64_t>(size);
            file.modifiedTime = toEpochSeconds(mtime);
            file.indexedTime = scanTime;

            bool readable = true;
            try {
                file.contentHash = hasher_->hashFile(path);
            } catch (const std::exception& e) {
                spdlog::warn("Catalog: cannot read {}: {}", path.string(), e.what());
                readable = false;
            }

            auto existingResult = findByPath(db_, file.filePath);
            if (!existingResult)
                return existingResult.error();
            const auto& existing = existingResult.value();

            if (!existing) {
                auto insertResult = insertFile(db_, file);
                if (!insertResult)
                    return insertResult;
                if (readable) {
                    ++result.counts.added;
                    result.changedFiles.push_back(file);
                } else {
                    ++result.counts.skipped;
                }
                continue;
            }

            if (!readable) {
                ++result.counts.skipped;
                continue;
            }

            if (file.contentHash != existing->contentHash ||
                file.modifiedTime > existing->modifiedTime) {
                file.id = existing->id;
                auto updateResult = updateFile(db_, *existing, file);
                if (!updateResult)
                    return updateResult;
                ++result.counts.updated;
                result.changedFiles.push_back(file);
            } else {
                ++result.counts.skipped;
            }
        }

        if (ec) {
            spdlog::warn("Catalog: directory walk stopped early under {}: {}", root.string(),
                         ec.message());
        }
        return {};
    });

    if (!txResult)
        return txResult.error();

    spdlog::info("Catalog: scanned {} (added={}, updated={}, skipped={})", root.string(),
                 result.counts.added, result.counts.updated, result.counts.skipped);
    return result;
}

Result<std::vector<IndexedFile>>
FileCatalog::search(const std::string& query, int limit,
                    const std::optional<std::string>& directoryFilter) {
    if (limit <= 0)
        return std::vector<IndexedFile>{};

    const std::string ftsQuery = buildFtsQuery(query);

    return executeQuery<std::vector<IndexedFile>>(
        [&](Database& db) -> Result<std::vector<IndexedFile>> {
            if (ftsQuery.empty())
                return listFiles(limit, directoryFilter);

            std::string sql = std::string("SELECT ") + kFileColumns + R"(
                FROM files_fts
                JOIN files f ON f.id = files_fts.rowid
                WHERE files_fts MATCH ?)";
            if (directoryFilter)
                sql += " AND f.directory LIKE ? ESCAPE '\\'";
            sql += " ORDER BY files_fts.rank, f.id LIMIT ?";

            auto stmtResult = db.prepare(sql);
            if (!stmtResult)
                return stmtResult.error();

            Statement stmt = std::move(stmtResult).value();
            int index = 1;
            auto bindResult = stmt.bind(index++, ftsQuery);
            if (bindResult && directoryFilter)
                bindResult = stmt.bind(index++, likeContains(*directoryFilter));
            if (bindResult)
                bindResult = stmt.bind(index++, limit);
            if (!bindResult)
                return bindResult.error();

            auto rows = collectRows(stmt);
            if (!rows) {
                spdlog::debug("Catalog: FTS query '{}' failed: {}", ftsQuery,
                              rows.error().message);
            } else if (!rows.value().empty()) {
                return rows;
            }

            return likeFallback(std::string(common::trim(query)), limit, directoryFilter);
        });
}

Result<std::vector<IndexedFile>>
FileCatalog::likeFallback(const std::string& query, int limit,
                          const std::optional<std::string>& directoryFilter) {
    std::string sql = std::string("SELECT ") + kFileColumns + R"(
        FROM files f
        WHERE (f.file_name LIKE ? ESCAPE '\' OR f.file_path LIKE ? ESCAPE '\'))";
    if (directoryFilter)
        sql += " AND f.directory LIKE ? ESCAPE '\\'";
    sql += " ORDER BY f.file_path LIMIT ?";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    const std::string pattern = likeContains(query);
    auto bindResult = stmt.bindAll(pattern, pattern);
    int index = 3;
    if (bindResult && directoryFilter)
        bindResult = stmt.bind(index++, likeContains(*directoryFilter));
    if (bindResult)
        bindResult = stmt.bind(index++, limit);
    if (!bindResult)
        return bindResult.error();

    return collectRows(stmt);
}

Result<std::vector<IndexedFile>>
FileCatalog::listFiles(int limit, const std::optional<std::string>& directoryFilter) {
    std::string sql = std::string("SELECT ") + kFileColumns + " FROM files f";
    if (directoryFilter)
        sql += " WHERE f.directory LIKE ? ESCAPE '\\'";
    sql += " ORDER BY f.file_path";
    if (limit > 0)
        sql += " LIMIT ?";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    int index = 1;
    Result<void> bindResult;
    if (directoryFilter)
        bindResult = stmt.bind(index++, likeContains(*directoryFilter));
    if (bindResult && limit > 0)
        bindResult = stmt.bind(index++, limit);
    if (!bindResult)
        return bindResult.error();

    return collectRows(stmt);
}

Result<std::optional<IndexedFile>> FileCatalog::getFileByPath(const std::string& filePath) {
    return executeQuery<std::optional<IndexedFile>>(
        [&](Database& db) -> Result<std::optional<IndexedFile>> {
            return findByPath(db, filePath);
        });
}

Result<std::vector<IndexedFile>>
FileCatalog::getAllFiles(const std::optional<std::string>& directoryFilter) {
    return executeQuery<std::vector<IndexedFile>>(
        [&](Database&) -> Result<std::vector<IndexedFile>> {
            return listFiles(0, directoryFilter);
        });
}

Result<std::vector<std::string>> FileCatalog::removeDirectory(const fs::path& root) {
    const std::string prefix = (normalizeRoot(root) / "").string();

    return executeQuery<std::vector<std::string>>(
        [&](Database& db) -> Result<std::vector<std::string>> {
            std::vector<std::string> removed;

            auto txResult = db.transaction([&]() -> Result<void> {
                auto stmtResult = db.prepare(std::string("SELECT ") + kFileColumns +
                                             " FROM files f WHERE instr(f.file_path, ?) = 1");
                if (!stmtResult)
                    return stmtResult.error();

                Statement stmt = std::move(stmtResult).value();
                auto bindResult = stmt.bind(1, prefix);
                if (!bindResult)
                    return bindResult;

                auto rows = collectRows(stmt);
                if (!rows)
                    return rows.error();

                for (const auto& file : rows.value()) {
                    auto ftsResult = ftsDelete(db, file);
                    if (!ftsResult)
                        return ftsResult;
                    removed.push_back(file.filePath);
                }

                auto deleteResult = db.prepare("DELETE FROM files WHERE instr(file_path, ?) = 1");
                if (!deleteResult)
                    return deleteResult.error();

                Statement del = std::move(deleteResult).value();
                bindResult = del.bind(1, prefix);
                if (!bindResult)
                    return bindResult;
                return del.execute();
            });

            if (!txResult)
                return txResult.error();

            spdlog::info("Catalog: removed {} files under {}", removed.size(), prefix);
            return removed;
        });
}

Result<void> FileCatalog::clear() {
    return executeQuery<void>([&](Database& db) -> Result<void> {
        return db.transaction([&]() -> Result<void> {
            auto result = db.execute("DELETE FROM files");
            if (!result)
                return result;
            return db.execute("INSERT INTO files_fts(files_fts) VALUES('delete-all')");
        });
    });
}

Result<CatalogStats> FileCatalog::getStats() {
    return executeQuery<CatalogStats>([&](Database& db) -> Result<CatalogStats> {
        auto stmtResult = db.prepare(
            "SELECT COUNT(*), COALESCE(SUM(size), 0), COUNT(DISTINCT directory) FROM files");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();

        CatalogStats stats;
        stats.databasePath = databasePath_.string();
        if (stepResult.value()) {
            stats.totalFiles = stmt.getInt64(0);
            stats.totalSize = stmt.getInt64(1);
            stats.totalDirectories = stmt.getInt64(2);
        }
        return stats;
    });
}

} // namespace docindex::metadata
