#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <docindex/config/config_helpers.h>
#include <docindex/config/indexer_config.h>
#include "../../common/test_helpers.h"

using namespace docindex::config;

namespace fs = std::filesystem;

namespace {

// Sets an environment variable for the lifetime of the guard; empty means unset
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            hadValue_ = true;
            oldValue_ = old;
        }
        set(value);
    }

    ~ScopedEnv() {
        if (hadValue_) {
            set(oldValue_.c_str());
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    void set(const char* value) {
        if (value && *value) {
            setenv(name_.c_str(), value, 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    std::string name_;
    std::string oldValue_;
    bool hadValue_{false};
};

} // namespace

class IndexerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = docindex::test::makeTempDir("docindex_config");
        configPath_ = dir_ / "config.toml";
    }

    void TearDown() override {
        spdlog::set_level(spdlog::level::info);
        fs::remove_all(dir_);
    }

    fs::path dir_;
    fs::path configPath_;
    ScopedEnv noDataDir_{"DOCINDEX_DATA_DIR", ""};
    ScopedEnv noConfig_{"DOCINDEX_CONFIG", ""};
    ScopedEnv noLogLevel_{"DOCINDEX_LOG_LEVEL", ""};
};

TEST_F(IndexerConfigTest, ParseConfigValueHandlesSectionsAndComments) {
    docindex::test::writeFile(configPath_, "# top comment\n"
                                           "[core]\n"
                                           "data_dir = \"/srv/docs # not a comment\"\n"
                                           "\n"
                                           "[search]\n"
                                           "chunk_size = 512 # tokens\n"
                                           "embedding_model = 'bge-small'\n"
                                           "logging.level = debug\n");

    EXPECT_EQ(parse_config_value(configPath_, "core", "data_dir"), "/srv/docs # not a comment");
    EXPECT_EQ(parse_config_value(configPath_, "search", "chunk_size"), "512");
    EXPECT_EQ(parse_config_value(configPath_, "search", "embedding_model"), "bge-small");
    EXPECT_EQ(parse_config_value(configPath_, "logging", "level"), "debug");
    EXPECT_EQ(parse_config_value(configPath_, "core", "chunk_size"), "");
    EXPECT_EQ(parse_config_value(dir_ / "missing.toml", "core", "data_dir"), "");
}

TEST_F(IndexerConfigTest, ParseBoolAcceptsCommonSpellings) {
    EXPECT_EQ(parse_bool("true"), true);
    EXPECT_EQ(parse_bool(" YES "), true);
    EXPECT_EQ(parse_bool("on"), true);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_EQ(parse_bool("Off"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST_F(IndexerConfigTest, DefaultsWithoutConfigFile) {
    ScopedEnv dataDir("DOCINDEX_DATA_DIR", (dir_ / "data").c_str());

    auto config = loadIndexerConfig(dir_ / "absent.toml");

    EXPECT_EQ(config.dataDir.string(), (dir_ / "data").string());
    EXPECT_EQ(config.databasePath.string(), (dir_ / "data" / "file_index.db").string());
    EXPECT_EQ(config.vectorIndexPath.string(), (dir_ / "data" / "vector_index.bin").string());
    EXPECT_TRUE(config.enableSemanticSearch);
    EXPECT_EQ(config.chunkSize, 1000u);
    EXPECT_EQ(config.chunkOverlap, 200u);
    EXPECT_EQ(config.embeddingProvider, "hashing");
    EXPECT_EQ(config.embeddingDim, 384u);
    EXPECT_EQ(config.maxChunksPerFile, 5u);
    EXPECT_EQ(config.candidateLimit, 50u);
    EXPECT_EQ(config.logLevel, "info");
}

TEST_F(IndexerConfigTest, ReadsSearchSection) {
    docindex::test::writeFile(configPath_, "[core]\n"
                                           "data_dir = \"" + (dir_ / "store").string() + "\"\n"
                                           "[search]\n"
                                           "semantic_search_enabled = false\n"
                                           "chunk_size = 256\n"
                                           "chunk_overlap = 32\n"
                                           "embedding_provider = mock\n"
                                           "embedding_dim = 128\n"
                                           "max_chunks_per_file = 3\n"
                                           "candidate_limit = 20\n"
                                           "[logging]\n"
                                           "level = warn\n");

    auto config = loadIndexerConfig(configPath_);

    EXPECT_EQ(config.dataDir.string(), (dir_ / "store").string());
    EXPECT_FALSE(config.enableSemanticSearch);
    EXPECT_EQ(config.chunkSize, 256u);
    EXPECT_EQ(config.chunkOverlap, 32u);
    EXPECT_EQ(config.embeddingProvider, "mock");
    EXPECT_EQ(config.embeddingDim, 128u);
    EXPECT_EQ(config.maxChunksPerFile, 3u);
    EXPECT_EQ(config.candidateLimit, 20u);
    EXPECT_EQ(config.logLevel, "warn");
}

TEST_F(IndexerConfigTest, InvalidValuesKeepDefaults) {
    docindex::test::writeFile(configPath_, "[search]\n"
                                           "semantic_search_enabled = sometimes\n"
                                           "chunk_size = big\n"
                                           "embedding_dim = 12abc\n");

    auto config = loadIndexerConfig(configPath_);

    EXPECT_TRUE(config.enableSemanticSearch);
    EXPECT_EQ(config.chunkSize, 1000u);
    EXPECT_EQ(config.embeddingDim, 384u);
}

TEST_F(IndexerConfigTest, EnvironmentOverridesConfigFile) {
    docindex::test::writeFile(configPath_, "[core]\n"
                                           "data_dir = /from/config\n"
                                           "[logging]\n"
                                           "level = warn\n");
    ScopedEnv dataDir("DOCINDEX_DATA_DIR", (dir_ / "env").c_str());
    ScopedEnv logLevel("DOCINDEX_LOG_LEVEL", "debug");

    auto config = loadIndexerConfig(configPath_);

    EXPECT_EQ(config.dataDir.string(), (dir_ / "env").string());
    EXPECT_EQ(config.logLevel, "debug");
}

TEST_F(IndexerConfigTest, ConfigPathFollowsEnvironment) {
    EXPECT_EQ(get_config_path("/explicit.toml").string(), "/explicit.toml");

    {
        ScopedEnv config("DOCINDEX_CONFIG", configPath_.c_str());
        EXPECT_EQ(get_config_path().string(), configPath_.string());
    }

    ScopedEnv xdg("XDG_CONFIG_HOME", dir_.c_str());
    EXPECT_EQ(get_config_path().string(), (dir_ / "docindex" / "config.toml").string());
}

TEST_F(IndexerConfigTest, DataDirFollowsXdg) {
    ScopedEnv xdg("XDG_DATA_HOME", dir_.c_str());
    EXPECT_EQ(get_data_dir().string(), (dir_ / "docindex").string());
}

TEST_F(IndexerConfigTest, TildeExpandsToHome) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~/notes").string(), "/home/tester/notes");
    EXPECT_EQ(expand_tilde("~").string(), "/home/tester");
    EXPECT_EQ(expand_tilde("/abs/~x").string(), "/abs/~x");
}

TEST_F(IndexerConfigTest, ApplyLogLevel) {
    EXPECT_TRUE(applyLogLevel("debug"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);

    EXPECT_TRUE(applyLogLevel("off"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);

    EXPECT_FALSE(applyLogLevel("verbose"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
}

TEST_F(IndexerConfigTest, ForDataDirKeepsExplicitPaths) {
    IndexerConfig config;
    config.dataDir = dir_;
    config.databasePath = dir_ / "custom.db";
    config.resolvePaths();

    EXPECT_EQ(config.databasePath.string(), (dir_ / "custom.db").string());
    EXPECT_EQ(config.vectorIndexPath.string(), (dir_ / "vector_index.bin").string());
}
