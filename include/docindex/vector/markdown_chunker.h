#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace docindex::vector {

/**
 * Configuration for markdown chunking.
 * Sizes are in approximate tokens, converted with chars_per_token.
 */
struct ChunkingConfig {
    size_t target_chunk_size = 1000; // Target size in tokens
    size_t overlap_size = 200;       // Overlap between consecutive chunks in tokens
    size_t min_chunk_size = 100;     // Minimum chunk length in characters
    size_t chars_per_token = 4;
};

/**
 * Represents a single document chunk
 */
struct DocumentChunk {
    std::string content;    // Trimmed chunk text
    size_t chunk_index = 0; // Position in document (0-based)
    size_t start_pos = 0;   // Byte offset in document
    size_t end_pos = 0;     // End byte offset (exclusive)
};

/**
 * Structure-aware splitter for markdown.
 *
 * Break points are chosen in order of preference: a header line, a blank line,
 * a sentence end, whitespace. A break that lands inside a fenced code block is
 * moved to the end of the block. Every chunk start advances by at least half the
 * target size, so chunking always terminates.
 */
class MarkdownChunker {
public:
    explicit MarkdownChunker(const ChunkingConfig& config = {});

    std::vector<DocumentChunk> chunkDocument(const std::string& content) const;

    const ChunkingConfig& getConfig() const { return config_; }

    /**
     * Byte ranges [begin, end) of fenced ``` blocks, paired in document order
     */
    static std::vector<std::pair<size_t, size_t>> findCodeBlocks(const std::string& text);

private:
    size_t findBreakPoint(const std::string& text, size_t start, size_t end) const;

    ChunkingConfig config_;
};

} // namespace docindex::vector
