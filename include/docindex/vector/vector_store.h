#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <docindex/core/types.h>
#include <docindex/vector/flat_index.h>
#include <docindex/vector/markdown_chunker.h>

namespace docindex::vector {

/**
 * Provenance of one stored chunk
 */
struct ChunkMetadata {
    std::string file_path;
    size_t chunk_index = 0;
    std::string content;
    size_t start_pos = 0;
    size_t end_pos = 0;
};

struct ChunkSearchResult {
    ChunkId chunk_id = 0;
    float distance = 0.0f; // Lower is more similar
    ChunkMetadata metadata;
};

struct VectorStoreStats {
    size_t total_chunks = 0;
    size_t total_files_with_chunks = 0;
    size_t index_size = 0;   // Physical rows, live and dead
    size_t dead_vectors = 0; // Rows no longer referenced by metadata
    size_t embedding_dim = 0;
};

/**
 * @brief Persistent flat similarity index plus chunk provenance
 *
 * Removal only forgets metadata; the vectors stay in the index until compact().
 * Every lookup goes through the metadata map, so removed rows are never returned.
 * All public methods are serialized by one mutex.
 */
class VectorStore {
public:
    static constexpr size_t kDefaultMaxChunksPerFile = 5;

    VectorStore(std::filesystem::path indexPath, size_t embeddingDim);

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /**
     * @brief Load index and metadata from disk
     *
     * Missing, unreadable or corrupt files and a dimension mismatch leave the store
     * empty and log a warning; none of them is an error.
     */
    Result<void> load();

    /**
     * @brief Write index and metadata through temporary files renamed into place
     *
     * A successful save clears isDirty(); a failed one leaves it set so the
     * next save retries.
     */
    Result<void> save() const;

    /// True when in-memory state has changed since the last load or successful save
    bool isDirty() const;

    /**
     * @brief Replace all chunks of filePath
     *
     * Fails with InvalidArgument, leaving the store untouched, when the counts
     * differ or an embedding has the wrong width.
     */
    Result<std::vector<ChunkId>> addChunks(const std::string& filePath,
                                           const std::vector<DocumentChunk>& chunks,
                                           const std::vector<std::vector<float>>& embeddings);

    /**
     * @brief Nearest chunks in ascending distance order
     *
     * @param fileFilter When non-null, only chunks of these files are returned; the set
     *        must outlive the call
     * @param maxChunksPerFile Per-file cap; defaults to kDefaultMaxChunksPerFile when a
     *        filter is given and to no cap otherwise
     */
    Result<std::vector<ChunkSearchResult>>
    search(const std::vector<float>& query, size_t k,
           const std::unordered_set<std::string>* fileFilter = nullptr,
           std::optional<size_t> maxChunksPerFile = std::nullopt) const;

    void removeFile(const std::string& filePath);

    /**
     * @brief Rebuild the index without dead rows
     * @return Rows reclaimed
     */
    size_t compact();

    void clear();

    VectorStoreStats getStats() const;

    std::vector<ChunkId> getChunkIds(const std::string& filePath) const;
    std::optional<ChunkMetadata> getChunk(ChunkId id) const;

    size_t embeddingDim() const { return embeddingDim_; }
    const std::filesystem::path& indexPath() const { return indexPath_; }
    const std::filesystem::path& metadataPath() const { return metadataPath_; }

private:
    void resetLocked();
    bool removeFileLocked(const std::string& filePath);
    Result<void> loadLocked();

    std::filesystem::path indexPath_;
    std::filesystem::path metadataPath_;
    size_t embeddingDim_;

    mutable std::mutex mutex_;
    std::unique_ptr<FlatIndex> index_;
    std::unordered_map<ChunkId, ChunkMetadata> metadata_;
    std::unordered_map<std::string, std::vector<ChunkId>> fileToChunks_;
    ChunkId nextChunkId_ = 0;
    mutable bool dirty_ = false;
};

} // namespace docindex::vector
