#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <docindex/ml/provider.h>
#include "../../common/test_helpers.h"

using namespace docindex;
using namespace docindex::ml;

namespace {

float norm(const std::vector<float>& v) {
    return std::sqrt(std::inner_product(v.begin(), v.end(), v.begin(), 0.0f));
}

float dot(const std::vector<float>& a, const std::vector<float>& b) {
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0f);
}

} // namespace

class EmbeddingProviderTest : public ::testing::Test {
protected:
    std::unique_ptr<IEmbeddingProvider> make(const std::string& name, size_t dim = 384) {
        auto provider = createEmbeddingProvider(name, dim);
        EXPECT_NE(provider, nullptr);
        if (provider) {
            EXPECT_TRUE(provider->initialize().has_value());
        }
        return provider;
    }
};

TEST_F(EmbeddingProviderTest, BuiltinsAreRegistered) {
    auto names = getRegisteredEmbeddingProviders();
    EXPECT_NE(std::find(names.begin(), names.end(), "hashing"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "mock"), names.end());
}

TEST_F(EmbeddingProviderTest, LookupIsCaseInsensitive) {
    auto provider = createEmbeddingProvider("HaShInG", 64);
    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->getProviderName(), "Hashing");
    EXPECT_EQ(provider->getEmbeddingDimension(), 64u);
}

TEST_F(EmbeddingProviderTest, UnknownNameYieldsNull) {
    EXPECT_EQ(createEmbeddingProvider("no-such-model"), nullptr);
}

TEST_F(EmbeddingProviderTest, CustomFactoryCanBeRegistered) {
    registerEmbeddingProvider("Concept", [](size_t dim) -> std::unique_ptr<IEmbeddingProvider> {
        return std::make_unique<test::ConceptEmbeddingProvider>(dim);
    });

    auto provider = createEmbeddingProvider("concept", 24);
    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->getProviderName(), "Concept");
    EXPECT_EQ(provider->getEmbeddingDimension(), 24u);
}

TEST_F(EmbeddingProviderTest, HashingRequiresInitialize) {
    auto provider = createEmbeddingProvider("hashing", 32);
    ASSERT_NE(provider, nullptr);

    auto result = provider->generateEmbedding("text");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotInitialized);

    ASSERT_TRUE(provider->initialize().has_value());
    EXPECT_TRUE(provider->generateEmbedding("text").has_value());

    provider->shutdown();
    EXPECT_FALSE(provider->generateEmbedding("text").has_value());
}

TEST_F(EmbeddingProviderTest, HashingRejectsZeroDimension) {
    auto provider = createEmbeddingProvider("hashing", 0);
    ASSERT_NE(provider, nullptr);
    auto result = provider->initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EmbeddingProviderTest, HashingIsDeterministicAndNormalized) {
    auto provider = make("hashing", 128);
    ASSERT_NE(provider, nullptr);

    auto a = provider->generateEmbedding("Configure the database connection pool").value();
    auto b = provider->generateEmbedding("Configure the database connection pool").value();

    ASSERT_EQ(a.size(), 128u);
    EXPECT_EQ(a, b);
    EXPECT_NEAR(norm(a), 1.0f, 1e-5);

    auto other = createEmbeddingProvider("hashing", 128);
    ASSERT_TRUE(other->initialize().has_value());
    EXPECT_EQ(other->generateEmbedding("Configure the database connection pool").value(), a);
}

TEST_F(EmbeddingProviderTest, HashingPlacesSharedVocabularyCloser) {
    auto provider = make("hashing", 384);
    ASSERT_NE(provider, nullptr);

    auto query = provider->generateEmbedding("database index tuning").value();
    auto related = provider->generateEmbedding("Tuning a database index for speed").value();
    auto unrelated = provider->generateEmbedding("Kubernetes rollout of the web frontend").value();

    EXPECT_GT(dot(query, related), dot(query, unrelated));
}

TEST_F(EmbeddingProviderTest, BatchMatchesSingleCalls) {
    for (const char* name : {"hashing", "mock"}) {
        auto provider = make(name, 48);
        ASSERT_NE(provider, nullptr);

        std::vector<std::string> texts = {"first text", "second text", ""};
        auto batch = provider->generateBatchEmbeddings(texts);
        ASSERT_TRUE(batch.has_value()) << name;
        ASSERT_EQ(batch.value().size(), texts.size());
        for (size_t i = 0; i < texts.size(); ++i) {
            EXPECT_EQ(batch.value()[i], provider->generateEmbedding(texts[i]).value()) << name;
            EXPECT_EQ(batch.value()[i].size(), 48u);
        }
    }
}

TEST_F(EmbeddingProviderTest, MockIsDeterministicPerText) {
    auto provider = make("mock", 16);
    ASSERT_NE(provider, nullptr);

    auto a = provider->generateEmbedding("alpha").value();
    auto b = provider->generateEmbedding("alpha").value();
    auto c = provider->generateEmbedding("beta").value();

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NEAR(norm(a), 1.0f, 1e-5);
    EXPECT_EQ(provider->getMaxSequenceLength(), 512u);
    EXPECT_TRUE(provider->isAvailable());
}
