#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <functional>
#include <map>
#include <system_error>
#include <docindex/vector/vector_store.h>

namespace fs = std::filesystem;

namespace docindex::vector {

namespace {

constexpr uint32_t kIndexMagic = 0x58495644; // "DVIX"
constexpr uint32_t kMetaMagic = 0x54454D44;  // "DMET"
constexpr uint32_t kFormatVersion = 1;
constexpr uint32_t kMaxStringBytes = 256u * 1024u * 1024u;

template <typename T> void writePod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T> bool readPod(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return in.good();
}

void writeString(std::ostream& out, const std::string& value) {
    const auto len = static_cast<uint32_t>(value.size());
    writePod(out, len);
    out.write(value.data(), len);
}

bool readString(std::istream& in, std::string& value) {
    uint32_t len = 0;
    if (!readPod(in, len) || len > kMaxStringBytes)
        return false;
    value.assign(len, '\0');
    in.read(value.data(), len);
    return !in.fail();
}

Result<void> writeAtomically(const fs::path& target,
                             const std::function<Result<void>(std::ostream&)>& writer) {
    fs::path tmp = target;
    tmp += ".tmp";
    std::error_code ec;

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot open " + tmp.string() + " for writing"};
        }
        auto result = writer(out);
        if (result) {
            out.flush();
            if (!out.good()) {
                result = Error{ErrorCode::WriteError, "Failed writing " + tmp.string()};
            }
        }
        if (!result) {
            out.close();
            fs::remove(tmp, ec);
            return result;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Error{ErrorCode::WriteError,
                     "Failed to move " + tmp.string() + " into place: " + ec.message()};
    }
    return Result<void>();
}

} // namespace

VectorStore::VectorStore(fs::path indexPath, size_t embeddingDim)
    : indexPath_(std::move(indexPath)), embeddingDim_(embeddingDim),
      index_(std::make_unique<FlatIndex>(embeddingDim)) {
    metadataPath_ = indexPath_;
    metadataPath_.replace_extension(".meta");
}

void VectorStore::resetLocked() {
    index_ = std::make_unique<FlatIndex>(embeddingDim_);
    metadata_.clear();
    fileToChunks_.clear();
    nextChunkId_ = 0;
}

Result<void> VectorStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    resetLocked();
    dirty_ = false;

    std::error_code ec;
    if (!fs::exists(indexPath_, ec) || !fs::exists(metadataPath_, ec)) {
        spdlog::info("VectorStore: no saved index at {}, starting empty", indexPath_.string());
        return Result<void>();
    }

    auto result = loadLocked();
    if (!result) {
        spdlog::warn("VectorStore: could not load {}: {}; starting empty", indexPath_.string(),
                     result.error().message);
        resetLocked();
        return Result<void>();
    }

    spdlog::info("VectorStore: loaded {} chunks for {} files ({} rows)", metadata_.size(),
                 fileToChunks_.size(), index_->size());
    return Result<void>();
}

Result<void> VectorStore::loadLocked() {
    std::ifstream indexFile(indexPath_, std::ios::binary);
    if (!indexFile) {
        return Error{ErrorCode::FileNotFound, "Cannot open index file"};
    }

    uint32_t magic = 0;
    uint32_t version = 0;
    if (!readPod(indexFile, magic) || magic != kIndexMagic) {
        return Error{ErrorCode::InvalidData, "Invalid index file format"};
    }
    if (!readPod(indexFile, version) || version != kFormatVersion) {
        return Error{ErrorCode::InvalidData,
                     "Unsupported index version: " + std::to_string(version)};
    }

    auto index = std::make_unique<FlatIndex>(embeddingDim_);
    auto indexResult = index->deserialize(indexFile);
    if (!indexResult) {
        return indexResult;
    }

    std::ifstream metaFile(metadataPath_, std::ios::binary);
    if (!metaFile) {
        return Error{ErrorCode::FileNotFound, "Cannot open metadata file"};
    }
    if (!readPod(metaFile, magic) || magic != kMetaMagic) {
        return Error{ErrorCode::InvalidData, "Invalid metadata file format"};
    }
    if (!readPod(metaFile, version) || version != kFormatVersion) {
        return Error{ErrorCode::InvalidData,
                     "Unsupported metadata version: " + std::to_string(version)};
    }

    int64_t nextId = 0;
    uint64_t count = 0;
    if (!readPod(metaFile, nextId) || !readPod(metaFile, count)) {
        return Error{ErrorCode::CorruptedData, "Truncated metadata header"};
    }

    std::unordered_map<ChunkId, ChunkMetadata> metadata;
    metadata.reserve(static_cast<size_t>(std::min<uint64_t>(count, 1u << 20)));
    for (uint64_t i = 0; i < count; ++i) {
        int64_t id = 0;
        uint64_t chunkIndex = 0;
        uint64_t start = 0;
        uint64_t end = 0;
        ChunkMetadata meta;
        if (!readPod(metaFile, id) || !readString(metaFile, meta.file_path) ||
            !readPod(metaFile, chunkIndex) || !readPod(metaFile, start) ||
            !readPod(metaFile, end) || !readString(metaFile, meta.content)) {
            return Error{ErrorCode::CorruptedData,
                         "Truncated metadata at entry " + std::to_string(i)};
        }
        meta.chunk_index = static_cast<size_t>(chunkIndex);
        meta.start_pos = static_cast<size_t>(start);
        meta.end_pos = static_cast<size_t>(end);
        metadata.emplace(id, std::move(meta));
    }

    ChunkId maxId = -1;
    for (ChunkId id : index->ids()) {
        maxId = std::max(maxId, id);
    }

    std::map<ChunkId, const ChunkMetadata*> ordered;
    for (const auto& [id, meta] : metadata) {
        ordered.emplace(id, &meta);
        maxId = std::max(maxId, id);
    }

    std::unordered_map<std::string, std::vector<ChunkId>> fileToChunks;
    for (const auto& [id, meta] : ordered) {
        fileToChunks[meta->file_path].push_back(id);
    }
    for (auto& [path, ids] : fileToChunks) {
        std::stable_sort(ids.begin(), ids.end(), [&](ChunkId a, ChunkId b) {
            return metadata.at(a).chunk_index < metadata.at(b).chunk_index;
        });
    }

    index_ = std::move(index);
    metadata_ = std::move(metadata);
    fileToChunks_ = std::move(fileToChunks);
    nextChunkId_ = std::max<ChunkId>(nextId, maxId + 1);
    return Result<void>();
}

Result<void> VectorStore::save() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto parent = indexPath_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            spdlog::error("VectorStore: cannot create {}: {}", parent.string(), ec.message());
            return Error{ErrorCode::WriteError,
                         "Failed to create index directory: " + ec.message()};
        }
    }

    auto indexResult = writeAtomically(indexPath_, [&](std::ostream& out) -> Result<void> {
        writePod(out, kIndexMagic);
        writePod(out, kFormatVersion);
        return index_->serialize(out);
    });
    if (!indexResult) {
        spdlog::error("VectorStore: saving index failed: {}", indexResult.error().message);
        return indexResult;
    }

    auto metaResult = writeAtomically(metadataPath_, [&](std::ostream& out) -> Result<void> {
        writePod(out, kMetaMagic);
        writePod(out, kFormatVersion);
        writePod(out, static_cast<int64_t>(nextChunkId_));
        writePod(out, static_cast<uint64_t>(metadata_.size()));

        std::map<ChunkId, const ChunkMetadata*> ordered;
        for (const auto& [id, meta] : metadata_) {
            ordered.emplace(id, &meta);
        }
        for (const auto& [id, meta] : ordered) {
            writePod(out, static_cast<int64_t>(id));
            writeString(out, meta->file_path);
            writePod(out, static_cast<uint64_t>(meta->chunk_index));
            writePod(out, static_cast<uint64_t>(meta->start_pos));
            writePod(out, static_cast<uint64_t>(meta->end_pos));
            writeString(out, meta->content);
        }
        if (!out.good()) {
            return Error{ErrorCode::WriteError, "Failed to serialize chunk metadata"};
        }
        return Result<void>();
    });
    if (!metaResult) {
        spdlog::error("VectorStore: saving metadata failed: {}", metaResult.error().message);
        return metaResult;
    }

    dirty_ = false;
    spdlog::debug("VectorStore: saved {} chunks ({} rows) to {}", metadata_.size(),
                  index_->size(), indexPath_.string());
    return Result<void>();
}

bool VectorStore::isDirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

Result<std::vector<ChunkId>>
VectorStore::addChunks(const std::string& filePath, const std::vector<DocumentChunk>& chunks,
                       const std::vector<std::vector<float>>& embeddings) {
    if (chunks.size() != embeddings.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Number of chunks (" + std::to_string(chunks.size()) +
                         ") does not match number of embeddings (" +
                         std::to_string(embeddings.size()) + ")"};
    }
    for (size_t i = 0; i < embeddings.size(); ++i) {
        if (embeddings[i].size() != embeddingDim_) {
            return Error{ErrorCode::InvalidArgument,
                         "Embedding " + std::to_string(i) + " has dimension " +
                             std::to_string(embeddings[i].size()) + ", expected " +
                             std::to_string(embeddingDim_)};
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (removeFileLocked(filePath))
        dirty_ = true;

    std::vector<ChunkId> ids;
    ids.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        ids.push_back(nextChunkId_ + static_cast<ChunkId>(i));
    }

    auto addResult = index_->addBatch(ids, embeddings);
    if (!addResult) {
        return addResult.error();
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        ChunkMetadata meta;
        meta.file_path = filePath;
        meta.chunk_index = chunks[i].chunk_index;
        meta.content = chunks[i].content;
        meta.start_pos = chunks[i].start_pos;
        meta.end_pos = chunks[i].end_pos;
        metadata_.emplace(ids[i], std::move(meta));
    }
    nextChunkId_ += static_cast<ChunkId>(chunks.size());
    if (!chunks.empty())
        dirty_ = true;

    if (!ids.empty()) {
        fileToChunks_[filePath] = ids;
    }
    return ids;
}

Result<std::vector<ChunkSearchResult>>
VectorStore::search(const std::vector<float>& query, size_t k,
                    const std::unordered_set<std::string>* fileFilter,
                    std::optional<size_t> maxChunksPerFile) const {
    if (query.size() != embeddingDim_) {
        return Error{ErrorCode::InvalidArgument, "Query dimension mismatch"};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ChunkSearchResult> results;
    if (k == 0 || index_->empty() || metadata_.empty()) {
        return results;
    }

    size_t cap = maxChunksPerFile.value_or(fileFilter ? kDefaultMaxChunksPerFile : 0);

    auto eligible = [&](ChunkId id) {
        auto it = metadata_.find(id);
        if (it == metadata_.end())
            return false;
        return !fileFilter || fileFilter->count(it->second.file_path) > 0;
    };

    // Start with twice the requested count and widen only if the cap starves the result
    const size_t rows = index_->size();
    size_t window = k > rows / 2 ? rows : k * 2;
    while (true) {
        auto hits = index_->search(query, window, eligible);
        if (!hits) {
            return hits.error();
        }

        results.clear();
        std::unordered_map<std::string, size_t> perFile;
        for (const auto& hit : hits.value()) {
            const auto& meta = metadata_.at(hit.id);
            if (cap > 0) {
                auto& seen = perFile[meta.file_path];
                if (seen >= cap)
                    continue;
                ++seen;
            }
            results.push_back(ChunkSearchResult{hit.id, hit.distance, meta});
            if (results.size() >= k)
                break;
        }

        if (results.size() >= k || hits.value().size() < window || window >= rows) {
            break;
        }
        window = window > rows / 2 ? rows : window * 2;
    }

    return results;
}

bool VectorStore::removeFileLocked(const std::string& filePath) {
    auto it = fileToChunks_.find(filePath);
    if (it == fileToChunks_.end())
        return false;
    for (ChunkId id : it->second) {
        metadata_.erase(id);
    }
    fileToChunks_.erase(it);
    return true;
}

void VectorStore::removeFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (removeFileLocked(filePath))
        dirty_ = true;
}

size_t VectorStore::compact() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t removed = index_->retain([&](ChunkId id) { return metadata_.count(id) > 0; });
    if (removed > 0) {
        dirty_ = true;
        spdlog::info("VectorStore: compacted {} dead vectors ({} rows remain)", removed,
                     index_->size());
    }
    return removed;
}

void VectorStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    resetLocked();
    dirty_ = true;
    spdlog::info("VectorStore: cleared");
}

VectorStoreStats VectorStore::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    VectorStoreStats stats;
    stats.total_chunks = metadata_.size();
    stats.total_files_with_chunks = fileToChunks_.size();
    stats.index_size = index_->size();
    stats.embedding_dim = embeddingDim_;
    for (ChunkId id : index_->ids()) {
        if (metadata_.count(id) == 0)
            ++stats.dead_vectors;
    }
    return stats;
}

std::vector<ChunkId> VectorStore::getChunkIds(const std::string& filePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fileToChunks_.find(filePath);
    if (it == fileToChunks_.end())
        return {};
    return it->second;
}

std::optional<ChunkMetadata> VectorStore::getChunk(ChunkId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metadata_.find(id);
    if (it == metadata_.end())
        return std::nullopt;
    return it->second;
}

} // namespace docindex::vector
