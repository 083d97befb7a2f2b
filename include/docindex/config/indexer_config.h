#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace docindex::config {

/**
 * @brief Settings for a FileIndexer
 *
 * Empty databasePath / vectorIndexPath are derived from dataDir by resolvePaths().
 */
struct IndexerConfig {
    std::filesystem::path dataDir;
    std::filesystem::path databasePath;    // <dataDir>/file_index.db
    std::filesystem::path vectorIndexPath; // <dataDir>/vector_index.bin, sidecar .meta

    bool enableSemanticSearch = true;
    size_t chunkSize = 1000;   // tokens
    size_t chunkOverlap = 200; // tokens
    std::string embeddingProvider = "hashing";
    std::string embeddingModel = "all-MiniLM-L6-v2";
    size_t embeddingDim = 384;
    size_t maxChunksPerFile = 5;
    size_t candidateLimit = 50;

    std::string logLevel = "info";

    static IndexerConfig forDataDir(const std::filesystem::path& dataDir);

    void resolvePaths();
};

/**
 * @brief Build a config from defaults, config.toml and DOCINDEX_* environment
 *
 * Unparseable values keep their defaults and log a warning.
 */
IndexerConfig loadIndexerConfig(const std::filesystem::path& configPath = {});

/**
 * @brief Set the spdlog level from a name such as "debug" or "warn"
 * @return false if the name is not a level
 */
bool applyLogLevel(const std::string& level);

} // namespace docindex::config
