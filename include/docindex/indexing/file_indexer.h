#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <docindex/config/indexer_config.h>
#include <docindex/core/types.h>
#include <docindex/metadata/file_catalog.h>
#include <docindex/ml/provider.h>
#include <docindex/vector/markdown_chunker.h>
#include <docindex/vector/vector_store.h>

namespace docindex::indexing {

/**
 * @brief One chunk returned by hybrid search, joined with its file record
 */
struct SemanticSearchResult {
    std::string filePath;
    std::string fileName;
    std::string resourceName;
    std::string directory;
    size_t chunkIndex = 0;
    std::string content;
    size_t startPos = 0;
    size_t endPos = 0;
    float score = 0.0f; ///< Vector distance, lower is better; 0 for keyword-only results
};

struct IndexerStats {
    int64_t totalFiles = 0;
    int64_t totalSize = 0;
    int64_t totalDirectories = 0;
    std::string databasePath;
    bool semanticSearchEnabled = false;
    std::optional<vector::VectorStoreStats> vectors; ///< Present when semantic search is enabled
};

/**
 * @brief Hybrid keyword and vector index over a tree of markdown files
 *
 * Owns the file catalog and the vector store. The embedding provider is either
 * injected or created from the configured registry name, and is initialised once
 * on first use. If it cannot be created or initialised, the indexer keeps working
 * on keywords alone.
 */
class FileIndexer {
public:
    explicit FileIndexer(config::IndexerConfig config,
                         std::shared_ptr<ml::IEmbeddingProvider> provider = nullptr);
    ~FileIndexer();

    FileIndexer(const FileIndexer&) = delete;
    FileIndexer& operator=(const FileIndexer&) = delete;

    /**
     * @brief Open the catalog and load the vector store
     */
    Result<void> open();

    /**
     * @brief Catalog a tree, then chunk and embed every added or updated file
     *
     * A file whose chunking or embedding fails stays catalogued without chunks.
     * The vector store is saved once at the end whenever it holds unsaved changes,
     * including ones left by an earlier failed save; a save failure is returned.
     */
    Result<metadata::ScanCounts> indexDirectory(const std::filesystem::path& root,
                                                const metadata::ScanOptions& options = {});

    Result<std::vector<metadata::IndexedFile>>
    search(const std::string& query, int limit = 10,
           const std::optional<std::string>& directoryFilter = std::nullopt);

    /**
     * @brief Narrow candidates by keyword, then rank their chunks by vector distance
     *
     * With no keyword candidates every file under directoryFilter is a candidate.
     * Degrades to keyword results when the semantic path is unavailable.
     */
    Result<std::vector<SemanticSearchResult>>
    searchSemantic(const std::string& query, int limit = 10,
                   const std::optional<std::string>& directoryFilter = std::nullopt,
                   std::optional<size_t> maxChunksPerFile = std::nullopt);

    /**
     * @return Number of catalog rows removed
     */
    Result<size_t> removeDirectory(const std::filesystem::path& root);

    Result<void> clearIndex();

    Result<IndexerStats> getStats();

    Result<std::optional<metadata::IndexedFile>> getFileByPath(const std::string& filePath);

    Result<std::vector<metadata::IndexedFile>>
    getAllFiles(const std::optional<std::string>& directoryFilter = std::nullopt);

    /**
     * @brief Drop vectors left behind by replaced or removed files and save
     * @return Rows reclaimed
     */
    Result<size_t> compactVectors();

    /**
     * @brief Whether hybrid search can run; initialises the provider on first call
     */
    bool semanticSearchAvailable();

    const config::IndexerConfig& config() const { return config_; }

private:
    ml::IEmbeddingProvider* ensureProvider();
    Result<size_t> embedFile(ml::IEmbeddingProvider& provider, const metadata::IndexedFile& file);
    Result<std::vector<SemanticSearchResult>>
    keywordResults(const std::string& query, int limit,
                   const std::optional<std::string>& directoryFilter);
    Result<void> saveVectors();

    config::IndexerConfig config_;
    metadata::FileCatalog catalog_;
    vector::MarkdownChunker chunker_;
    std::unique_ptr<vector::VectorStore> vectorStore_;

    std::shared_ptr<ml::IEmbeddingProvider> provider_;
    std::once_flag providerOnce_;
    std::atomic<bool> providerReady_{false};
};

} // namespace docindex::indexing
