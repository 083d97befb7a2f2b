#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <docindex/core/types.h>
#include <docindex/crypto/hasher.h>
#include <docindex/metadata/database.h>

namespace docindex::metadata {

/**
 * @brief One catalogued file
 */
struct IndexedFile {
    FileId id = 0;
    std::string filePath;     ///< Absolute path, unique key
    std::string fileName;     ///< Base name including extension
    std::string resourceName; ///< Path relative to the scan root without extension
    std::string directory;    ///< Parent directory of filePath
    int64_t size = 0;
    double modifiedTime = 0.0; ///< Seconds since epoch
    double indexedTime = 0.0;  ///< Seconds since epoch
    std::string contentHash;   ///< Hex SHA-256, empty when the content could not be read
};

/**
 * @brief Filters applied while walking a directory tree
 */
struct ScanOptions {
    std::string pattern = "*.md"; ///< Glob matched against the file name
    bool excludeHidden = true;    ///< Skip dot-files and anything below a dot-directory
    std::optional<int> maxDepth;  ///< 0 means files directly under the root only
    std::vector<std::string> excludePatterns; ///< Globs tried on the relative path and the file name
    uint64_t maxFileSize = 0;                 ///< 0 disables the limit
};

struct ScanCounts {
    size_t added = 0;
    size_t updated = 0;
    size_t skipped = 0;

    [[nodiscard]] size_t changed() const { return added + updated; }
};

/**
 * @brief Outcome of a directory scan
 *
 * changedFiles lists the readable files that were added or updated, in scan order.
 */
struct ScanResult {
    ScanCounts counts;
    std::vector<IndexedFile> changedFiles;
};

struct CatalogStats {
    int64_t totalFiles = 0;
    int64_t totalSize = 0;
    int64_t totalDirectories = 0;
    std::string databasePath;
};

/**
 * @brief File catalog persisted in SQLite with an FTS5 mirror
 *
 * The files table is authoritative; files_fts is an external-content FTS5 table
 * kept in step by explicit inserts and 'delete' commands in the same transaction
 * as the row change. All public methods are serialized by an internal mutex.
 */
class FileCatalog {
public:
    explicit FileCatalog(std::filesystem::path databasePath);

    /// Uses hasher for change detection; a null hasher falls back to SHA-256
    FileCatalog(std::filesystem::path databasePath, std::unique_ptr<crypto::IContentHasher> hasher);
    ~FileCatalog();

    FileCatalog(const FileCatalog&) = delete;
    FileCatalog& operator=(const FileCatalog&) = delete;

    /**
     * @brief Create the parent directory, open the database and apply migrations
     */
    Result<void> open();
    void close();

    [[nodiscard]] bool isOpen() const;

    /**
     * @brief Walk a tree and add or update matching files
     *
     * A row is rewritten when its content hash changed or its mtime advanced. Every other
     * matching file counts as skipped.
     * A missing root yields empty counts. The whole scan commits as one transaction.
     */
    Result<ScanResult> indexDirectory(const std::filesystem::path& root,
                                      const ScanOptions& options = {});

    /**
     * @brief Ranked keyword search over path, name, resource name and directory
     *
     * Tokens become OR-combined prefix terms. A blank query lists files. If a
     * non-blank query finds nothing, a substring match on name and path is tried.
     */
    Result<std::vector<IndexedFile>>
    search(const std::string& query, int limit = 50,
           const std::optional<std::string>& directoryFilter = std::nullopt);

    Result<std::optional<IndexedFile>> getFileByPath(const std::string& filePath);

    /**
     * @brief All files ordered by path, optionally restricted to directories containing the filter
     */
    Result<std::vector<IndexedFile>>
    getAllFiles(const std::optional<std::string>& directoryFilter = std::nullopt);

    /**
     * @brief Delete every row under root
     * @return Paths of the removed rows
     */
    Result<std::vector<std::string>> removeDirectory(const std::filesystem::path& root);

    Result<void> clear();

    Result<CatalogStats> getStats();

    [[nodiscard]] const std::filesystem::path& databasePath() const { return databasePath_; }

private:
    template <typename T> Result<T> executeQuery(std::function<Result<T>(Database&)> func);

    Result<ScanResult> scanLocked(const std::filesystem::path& root, const ScanOptions& options);
    Result<std::vector<IndexedFile>> likeFallback(const std::string& query, int limit,
                                                  const std::optional<std::string>& directoryFilter);
    Result<std::vector<IndexedFile>> listFiles(int limit,
                                               const std::optional<std::string>& directoryFilter);

    std::filesystem::path databasePath_;
    mutable std::mutex mutex_;
    Database db_;
    std::unique_ptr<crypto::IContentHasher> hasher_;
};

} // namespace docindex::metadata
