#include <spdlog/spdlog.h>
#include <algorithm>
#include <optional>
#include <regex>
#include <string_view>
#include <docindex/common/pattern_utils.h>
#include <docindex/vector/markdown_chunker.h>

namespace docindex::vector {

namespace {

constexpr size_t kHeaderLookahead = 100;
constexpr size_t kParagraphLookbehind = 200;
constexpr size_t kParagraphLookahead = 100;
constexpr size_t kSentenceLookbehind = 100;
constexpr size_t kSentenceLookahead = 50;
constexpr size_t kWordWindow = 50;

using Block = std::pair<size_t, size_t>;

// First match of re inside text[lo, hi); returns absolute {position, end}
std::optional<Block> searchWindow(const std::string& text, size_t lo, size_t hi,
                                  const std::regex& re) {
    if (lo >= hi)
        return std::nullopt;
    std::smatch match;
    auto first = text.cbegin() + static_cast<std::ptrdiff_t>(lo);
    auto last = text.cbegin() + static_cast<std::ptrdiff_t>(hi);
    if (!std::regex_search(first, last, match, re))
        return std::nullopt;
    size_t pos = lo + static_cast<size_t>(match.position(0));
    return Block{pos, pos + static_cast<size_t>(match.length(0))};
}

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

const Block* enclosingBlock(const std::vector<Block>& blocks, size_t pos) {
    for (const auto& block : blocks) {
        if (block.first < pos && pos < block.second)
            return &block;
    }
    return nullptr;
}

} // namespace

MarkdownChunker::MarkdownChunker(const ChunkingConfig& config) : config_(config) {}

std::vector<Block> MarkdownChunker::findCodeBlocks(const std::string& text) {
    std::vector<Block> blocks;
    size_t pos = 0;
    while (true) {
        size_t open = text.find("```", pos);
        if (open == std::string::npos)
            break;
        size_t close = text.find("```", open + 3);
        if (close == std::string::npos)
            break;
        blocks.emplace_back(open, close + 3);
        pos = close + 3;
    }
    return blocks;
}

size_t MarkdownChunker::findBreakPoint(const std::string& text, size_t start, size_t end) const {
    static const std::regex header_re(R"(\n#{1,6}\s+)");
    static const std::regex paragraph_re(R"(\n\n+)");
    static const std::regex sentence_re(R"([.!?]\s+)");
    static const std::regex word_re(R"(\s+)");

    const size_t len = text.size();
    const size_t charSize = std::max<size_t>(1, config_.target_chunk_size * config_.chars_per_token);
    // Breaks before this point would shrink the step below the progress floor
    const size_t floor = start + std::max<size_t>(1, charSize / 2);

    auto lower = [&](size_t behind) { return std::max(floor, end > behind ? end - behind : 0); };
    auto upper = [&](size_t ahead) { return std::min(len, end + ahead); };

    if (auto m = searchWindow(text, floor, upper(kHeaderLookahead), header_re)) {
        return m->first;
    }
    if (auto m = searchWindow(text, lower(kParagraphLookbehind), upper(kParagraphLookahead),
                              paragraph_re)) {
        return m->second;
    }
    if (auto m = searchWindow(text, lower(kSentenceLookbehind), upper(kSentenceLookahead),
                              sentence_re)) {
        return m->second;
    }
    if (auto m = searchWindow(text, lower(kWordWindow), upper(kWordWindow), word_re)) {
        return m->second;
    }

    // Mid-word cut; keep UTF-8 sequences whole
    size_t cut = end;
    while (cut > floor && cut < len && isContinuationByte(text[cut])) {
        --cut;
    }
    return cut;
}

std::vector<DocumentChunk> MarkdownChunker::chunkDocument(const std::string& content) const {
    std::vector<DocumentChunk> chunks;
    if (content.empty())
        return chunks;

    const auto trimmed = common::trim(content);
    if (trimmed.empty())
        return chunks;

    // Short documents survive whole instead of vanishing under the length filter
    if (trimmed.size() < config_.min_chunk_size) {
        DocumentChunk chunk;
        chunk.content = std::string(trimmed);
        chunk.chunk_index = 0;
        chunk.start_pos = 0;
        chunk.end_pos = content.size();
        chunks.push_back(std::move(chunk));
        return chunks;
    }

    const size_t len = content.size();
    const size_t charSize = std::max<size_t>(1, config_.target_chunk_size * config_.chars_per_token);
    const size_t charOverlap = config_.overlap_size * config_.chars_per_token;
    const size_t minProgress = std::max<size_t>(1, charSize / 2);
    const auto codeBlocks = findCodeBlocks(content);

    size_t current = 0;
    size_t index = 0;

    while (current < len) {
        size_t end = std::min(current + charSize, len);
        if (end < len) {
            end = findBreakPoint(content, current, end);
        }
        if (const Block* block = enclosingBlock(codeBlocks, end)) {
            end = block->second;
        }

        auto text = common::trim(std::string_view(content).substr(current, end - current));
        if (!text.empty() && text.size() >= config_.min_chunk_size) {
            DocumentChunk chunk;
            chunk.content = std::string(text);
            chunk.chunk_index = index++;
            chunk.start_pos = current;
            chunk.end_pos = end;
            chunks.push_back(std::move(chunk));
        }

        if (end >= len)
            break;

        size_t next = end > charOverlap ? end - charOverlap : 0;
        if (next <= current || next - current < minProgress) {
            next = current + minProgress;
        }
        if (const Block* block = enclosingBlock(codeBlocks, next)) {
            next = block->first >= current + minProgress ? block->first : block->second;
        }
        while (next < len && isContinuationByte(content[next])) {
            ++next;
        }
        current = next;
    }

    spdlog::debug("MarkdownChunker: {} bytes -> {} chunks", len, chunks.size());
    return chunks;
}

} // namespace docindex::vector
