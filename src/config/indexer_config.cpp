#include <spdlog/spdlog.h>
#include <charconv>
#include <docindex/config/config_helpers.h>
#include <docindex/config/indexer_config.h>

namespace docindex::config {

namespace {

void readSize(const std::filesystem::path& path, const char* key, size_t& target) {
    auto raw = parse_config_value(path, "search", key);
    if (raw.empty())
        return;

    size_t value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        spdlog::warn("Config: invalid value '{}' for search.{}, keeping {}", raw, key, target);
        return;
    }
    target = value;
}

void readString(const std::filesystem::path& path, const char* key, std::string& target) {
    if (auto raw = parse_config_value(path, "search", key); !raw.empty()) {
        target = raw;
    }
}

} // namespace

IndexerConfig IndexerConfig::forDataDir(const std::filesystem::path& dataDir) {
    IndexerConfig config;
    config.dataDir = dataDir;
    config.resolvePaths();
    return config;
}

void IndexerConfig::resolvePaths() {
    if (databasePath.empty()) {
        databasePath = dataDir / "file_index.db";
    }
    if (vectorIndexPath.empty()) {
        vectorIndexPath = dataDir / "vector_index.bin";
    }
}

IndexerConfig loadIndexerConfig(const std::filesystem::path& configPath) {
    IndexerConfig config;
    const auto path = configPath.empty() ? get_config_path() : configPath;

    config.dataDir = resolve_data_dir_from_config(path);

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        spdlog::debug("Config: reading {}", path.string());

        if (auto raw = parse_config_value(path, "search", "semantic_search_enabled");
            !raw.empty()) {
            if (auto enabled = parse_bool(raw)) {
                config.enableSemanticSearch = *enabled;
            } else {
                spdlog::warn("Config: invalid boolean '{}' for search.semantic_search_enabled",
                             raw);
            }
        }
        readSize(path, "chunk_size", config.chunkSize);
        readSize(path, "chunk_overlap", config.chunkOverlap);
        readString(path, "embedding_provider", config.embeddingProvider);
        readString(path, "embedding_model", config.embeddingModel);
        readSize(path, "embedding_dim", config.embeddingDim);
        readSize(path, "max_chunks_per_file", config.maxChunksPerFile);
        readSize(path, "candidate_limit", config.candidateLimit);

        if (auto level = parse_config_value(path, "logging", "level"); !level.empty()) {
            config.logLevel = level;
        }
    }

    if (auto level = env_value("DOCINDEX_LOG_LEVEL")) {
        config.logLevel = *level;
    }

    config.resolvePaths();
    return config;
}

bool applyLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept "off" when asked for it
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}'", level);
        return false;
    }
    spdlog::set_level(parsed);
    return true;
}

} // namespace docindex::config
