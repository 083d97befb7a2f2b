#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <docindex/indexing/file_indexer.h>

namespace docindex::indexing {

namespace {

vector::ChunkingConfig chunkingConfigFor(const config::IndexerConfig& config) {
    vector::ChunkingConfig chunking;
    chunking.target_chunk_size = config.chunkSize;
    chunking.overlap_size = config.chunkOverlap;
    return chunking;
}

Result<std::string> readFileContent(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::InvalidData, "Failed reading " + path.string()};
    }
    return buffer.str();
}

config::IndexerConfig withResolvedPaths(config::IndexerConfig config) {
    config.resolvePaths();
    return config;
}

SemanticSearchResult fromFile(const metadata::IndexedFile& file) {
    SemanticSearchResult result;
    result.filePath = file.filePath;
    result.fileName = file.fileName;
    result.resourceName = file.resourceName;
    result.directory = file.directory;
    return result;
}

} // namespace

FileIndexer::FileIndexer(config::IndexerConfig config,
                         std::shared_ptr<ml::IEmbeddingProvider> provider)
    : config_(withResolvedPaths(std::move(config))), catalog_(config_.databasePath),
      chunker_(chunkingConfigFor(config_)),
      provider_(std::move(provider)) {}

FileIndexer::~FileIndexer() = default;

Result<void> FileIndexer::open() {
    auto catalogResult = catalog_.open();
    if (!catalogResult) {
        return catalogResult;
    }

    if (config_.enableSemanticSearch && !vectorStore_) {
        vectorStore_ =
            std::make_unique<vector::VectorStore>(config_.vectorIndexPath, config_.embeddingDim);
        auto loadResult = vectorStore_->load();
        if (!loadResult) {
            return loadResult;
        }
    }

    spdlog::info("FileIndexer ready (database={}, semantic={})", config_.databasePath.string(),
                 config_.enableSemanticSearch);
    return Result<void>();
}

ml::IEmbeddingProvider* FileIndexer::ensureProvider() {
    if (!vectorStore_) {
        return nullptr;
    }

    std::call_once(providerOnce_, [this]() {
        if (!provider_) {
            provider_ =
                ml::createEmbeddingProvider(config_.embeddingProvider, config_.embeddingDim);
            if (!provider_) {
                spdlog::warn("Semantic search disabled: no embedding provider '{}'",
                             config_.embeddingProvider);
                return;
            }
        }

        auto initResult = provider_->initialize();
        if (!initResult) {
            spdlog::warn("Semantic search disabled: {} provider failed to initialise: {}",
                         provider_->getProviderName(), initResult.error().message);
            return;
        }

        if (provider_->getEmbeddingDimension() != config_.embeddingDim) {
            spdlog::warn("Semantic search disabled: {} produces {}-dim embeddings, index expects {}",
                         provider_->getProviderName(), provider_->getEmbeddingDimension(),
                         config_.embeddingDim);
            return;
        }

        spdlog::info("Embedding provider {} ready (model={}, dim={})",
                     provider_->getProviderName(), config_.embeddingModel, config_.embeddingDim);
        providerReady_ = true;
    });

    return providerReady_.load() ? provider_.get() : nullptr;
}

bool FileIndexer::semanticSearchAvailable() {
    return ensureProvider() != nullptr;
}

Result<size_t> FileIndexer::embedFile(ml::IEmbeddingProvider& provider,
                                      const metadata::IndexedFile& file) {
    auto content = readFileContent(file.filePath);
    if (!content) {
        return content.error();
    }

    auto chunks = chunker_.chunkDocument(content.value());
    if (chunks.empty()) {
        vectorStore_->removeFile(file.filePath);
        return size_t{0};
    }

    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        texts.push_back(chunk.content);
    }

    auto embeddings = provider.generateBatchEmbeddings(texts);
    if (!embeddings) {
        return embeddings.error();
    }

    auto added = vectorStore_->addChunks(file.filePath, chunks, embeddings.value());
    if (!added) {
        return added.error();
    }
    return added.value().size();
}

Result<metadata::ScanCounts> FileIndexer::indexDirectory(const std::filesystem::path& root,
                                                         const metadata::ScanOptions& options) {
    auto scan = catalog_.indexDirectory(root, options);
    if (!scan) {
        return scan.error();
    }

    const auto& changed = scan.value().changedFiles;
    if (!vectorStore_) {
        return scan.value().counts;
    }

    auto* provider = changed.empty() ? nullptr : ensureProvider();
    if (provider) {
        size_t totalChunks = 0;
        for (const auto& file : changed) {
            auto result = embedFile(*provider, file);
            if (!result) {
                // Old chunks describe content that no longer exists
                vectorStore_->removeFile(file.filePath);
                spdlog::warn("Could not chunk/embed {}: {}", file.filePath,
                             result.error().message);
                continue;
            }
            spdlog::debug("Embedded {} chunks for {}", result.value(), file.filePath);
            totalChunks += result.value();
        }
        spdlog::info("Indexed {} changed files into {} chunks", changed.size(), totalChunks);
    }

    // Also retries a save that failed on an earlier call
    auto saveResult = saveVectors();
    if (!saveResult) {
        return saveResult.error();
    }
    return scan.value().counts;
}

Result<void> FileIndexer::saveVectors() {
    if (!vectorStore_ || !vectorStore_->isDirty()) {
        return Result<void>();
    }
    return vectorStore_->save();
}

Result<std::vector<metadata::IndexedFile>>
FileIndexer::search(const std::string& query, int limit,
                    const std::optional<std::string>& directoryFilter) {
    return catalog_.search(query, limit, directoryFilter);
}

Result<std::vector<SemanticSearchResult>>
FileIndexer::keywordResults(const std::string& query, int limit,
                            const std::optional<std::string>& directoryFilter) {
    auto files = catalog_.search(query, limit, directoryFilter);
    if (!files) {
        return files.error();
    }

    std::vector<SemanticSearchResult> results;
    results.reserve(files.value().size());
    for (const auto& file : files.value()) {
        results.push_back(fromFile(file));
    }
    return results;
}

Result<std::vector<SemanticSearchResult>>
FileIndexer::searchSemantic(const std::string& query, int limit,
                            const std::optional<std::string>& directoryFilter,
                            std::optional<size_t> maxChunksPerFile) {
    if (limit <= 0) {
        return std::vector<SemanticSearchResult>{};
    }

    auto* provider = ensureProvider();
    if (!provider) {
        return keywordResults(query, limit, directoryFilter);
    }

    // Stage 1: keyword narrowing, never allowed to starve recall
    auto candidates =
        catalog_.search(query, static_cast<int>(config_.candidateLimit), directoryFilter);
    if (!candidates) {
        return candidates.error();
    }
    std::vector<metadata::IndexedFile> files = candidates.value();
    if (files.empty()) {
        auto all = catalog_.getAllFiles(directoryFilter);
        if (!all) {
            return all.error();
        }
        files = all.value();
    }
    if (files.empty()) {
        return std::vector<SemanticSearchResult>{};
    }

    // Stage 2: vector rerank within the candidates
    auto embedding = provider->generateEmbedding(query);
    if (!embedding) {
        spdlog::warn("Query embedding failed, using keyword search: {}",
                     embedding.error().message);
        return keywordResults(query, limit, directoryFilter);
    }

    std::unordered_map<std::string, const metadata::IndexedFile*> byPath;
    std::unordered_set<std::string> fileFilter;
    for (const auto& file : files) {
        byPath.emplace(file.filePath, &file);
        fileFilter.insert(file.filePath);
    }

    const size_t cap = maxChunksPerFile.value_or(config_.maxChunksPerFile);
    auto hits = vectorStore_->search(embedding.value(), static_cast<size_t>(limit) * 2,
                                     &fileFilter, cap);
    if (!hits) {
        spdlog::warn("Vector search failed, using keyword search: {}", hits.error().message);
        return keywordResults(query, limit, directoryFilter);
    }

    std::vector<SemanticSearchResult> results;
    std::unordered_map<std::string, size_t> perFile;
    for (const auto& hit : hits.value()) {
        auto it = byPath.find(hit.metadata.file_path);
        if (it == byPath.end()) {
            continue;
        }
        if (cap > 0 && perFile[hit.metadata.file_path]++ >= cap) {
            continue;
        }

        auto result = fromFile(*it->second);
        result.chunkIndex = hit.metadata.chunk_index;
        result.content = hit.metadata.content;
        result.startPos = hit.metadata.start_pos;
        result.endPos = hit.metadata.end_pos;
        result.score = hit.distance;
        results.push_back(std::move(result));

        if (results.size() >= static_cast<size_t>(limit)) {
            break;
        }
    }
    return results;
}

Result<size_t> FileIndexer::removeDirectory(const std::filesystem::path& root) {
    auto removed = catalog_.removeDirectory(root);
    if (!removed) {
        return removed.error();
    }

    const auto& paths = removed.value();
    if (vectorStore_) {
        for (const auto& path : paths) {
            vectorStore_->removeFile(path);
        }
    }
    auto saveResult = saveVectors();
    if (!saveResult) {
        return saveResult.error();
    }
    return paths.size();
}

Result<void> FileIndexer::clearIndex() {
    auto clearResult = catalog_.clear();
    if (!clearResult) {
        return clearResult;
    }

    if (vectorStore_) {
        vectorStore_->clear();
    }
    auto saveResult = saveVectors();
    if (!saveResult) {
        return saveResult;
    }
    spdlog::info("Index cleared");
    return Result<void>();
}

Result<IndexerStats> FileIndexer::getStats() {
    auto catalogStats = catalog_.getStats();
    if (!catalogStats) {
        return catalogStats.error();
    }

    IndexerStats stats;
    stats.totalFiles = catalogStats.value().totalFiles;
    stats.totalSize = catalogStats.value().totalSize;
    stats.totalDirectories = catalogStats.value().totalDirectories;
    stats.databasePath = catalogStats.value().databasePath;
    stats.semanticSearchEnabled = semanticSearchAvailable();
    if (stats.semanticSearchEnabled) {
        stats.vectors = vectorStore_->getStats();
    }
    return stats;
}

Result<std::optional<metadata::IndexedFile>>
FileIndexer::getFileByPath(const std::string& filePath) {
    return catalog_.getFileByPath(filePath);
}

Result<std::vector<metadata::IndexedFile>>
FileIndexer::getAllFiles(const std::optional<std::string>& directoryFilter) {
    return catalog_.getAllFiles(directoryFilter);
}

Result<size_t> FileIndexer::compactVectors() {
    if (!vectorStore_) {
        return size_t{0};
    }

    const size_t reclaimed = vectorStore_->compact();
    auto saveResult = saveVectors();
    if (!saveResult) {
        return saveResult.error();
    }
    return reclaimed;
}

} // namespace docindex::indexing
