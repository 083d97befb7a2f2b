#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <docindex/ml/provider.h>

namespace docindex::ml {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

uint64_t fnv1a(std::string_view text, uint64_t seed = kFnvOffset) {
    uint64_t hash = seed;
    for (char c : text) {
        hash ^= static_cast<unsigned char>(c);
        hash *= kFnvPrime;
    }
    return hash;
}

void normalize(std::vector<float>& embedding) {
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
}

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

// ============================================================================
// Hashing Embedding Provider
// ============================================================================

/**
 * Feature-hashing bag-of-words embedder.
 *
 * Each lower-cased word and each character trigram of " word " is hashed into
 * one of dimension_ buckets with a hash-derived sign. The result is L2-normalised,
 * so texts sharing vocabulary or word fragments land close together. It needs no
 * model files and is stable across processes, which keeps persisted vectors valid.
 */
class HashingEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
        spdlog::debug("HashingEmbeddingProvider created with dimension {}", dimension);
    }

    Result<void> initialize() override {
        if (dimension_ == 0) {
            return Error{ErrorCode::InvalidArgument, "Embedding dimension must be positive"};
        }
        initialized_ = true;
        return Result<void>();
    }

    void shutdown() override { initialized_ = false; }

    Result<std::vector<float>> generateEmbedding(const std::string& text) override {
        if (!initialized_) {
            return Error{ErrorCode::NotInitialized, "Hashing provider not initialized"};
        }

        std::vector<float> embedding(dimension_, 0.0f);
        std::string word;
        auto flush = [&]() {
            if (word.empty())
                return;
            addFeature(embedding, word, 1.0f);
            const std::string padded = " " + word + " ";
            for (size_t i = 0; i + 3 <= padded.size(); ++i) {
                addFeature(embedding, std::string_view(padded).substr(i, 3), 0.5f);
            }
            word.clear();
        };

        for (unsigned char c : text) {
            if (std::isalnum(c) || c >= 0x80) {
                word.push_back(static_cast<char>(std::tolower(c)));
            } else {
                flush();
            }
        }
        flush();

        normalize(embedding);
        return embedding;
    }

    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override {
        std::vector<std::vector<float>> embeddings;
        embeddings.reserve(texts.size());
        for (const auto& text : texts) {
            auto result = generateEmbedding(text);
            if (!result) {
                return result.error();
            }
            embeddings.push_back(std::move(result).value());
        }
        return embeddings;
    }

    bool isAvailable() const override { return dimension_ > 0; }

    std::string getProviderName() const override { return "Hashing"; }

    size_t getEmbeddingDimension() const override { return dimension_; }

    size_t getMaxSequenceLength() const override { return 0; }

private:
    void addFeature(std::vector<float>& embedding, std::string_view feature, float weight) const {
        const uint64_t h = fnv1a(feature);
        const size_t bucket = static_cast<size_t>(h % dimension_);
        const float sign = (h >> 63) ? -1.0f : 1.0f;
        embedding[bucket] += sign * weight;
    }

    size_t dimension_;
    bool initialized_ = false;
};

// ============================================================================
// Mock Embedding Provider
// ============================================================================

/**
 * Generates a deterministic pseudo-random unit vector per text.
 * Similar texts are not close; useful only for plumbing tests.
 */
class MockEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(size_t dimension) : dimension_(dimension) {
        spdlog::debug("MockEmbeddingProvider created with dimension {}", dimension);
    }

    ~MockEmbeddingProvider() override {
        if (initialized_) {
            shutdown();
        }
    }

    Result<void> initialize() override {
        if (initialized_) {
            return Result<void>();
        }
        spdlog::debug("Initializing MockEmbeddingProvider");
        initialized_ = true;
        return Result<void>();
    }

    void shutdown() override { initialized_ = false; }

    Result<std::vector<float>> generateEmbedding(const std::string& text) override {
        if (!initialized_) {
            return Error{ErrorCode::NotInitialized, "Mock provider not initialized"};
        }

        std::mt19937_64 gen(fnv1a(text));
        std::normal_distribution<float> dist(0.0f, 1.0f);

        std::vector<float> embedding(dimension_);
        for (size_t i = 0; i < dimension_; ++i) {
            embedding[i] = dist(gen);
        }
        normalize(embedding);
        return embedding;
    }

    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override {
        if (!initialized_) {
            return Error{ErrorCode::NotInitialized, "Mock provider not initialized"};
        }

        std::vector<std::vector<float>> embeddings;
        embeddings.reserve(texts.size());

        for (const auto& text : texts) {
            auto result = generateEmbedding(text);
            if (!result) {
                return result.error();
            }
            embeddings.push_back(std::move(result).value());
        }

        return embeddings;
    }

    bool isAvailable() const override { return true; }

    std::string getProviderName() const override { return "Mock"; }

    size_t getEmbeddingDimension() const override { return dimension_; }

    size_t getMaxSequenceLength() const override { return 512; }

private:
    size_t dimension_;
    bool initialized_ = false;
};

// ============================================================================
// Provider Registry
// ============================================================================

namespace {

struct ProviderRegistry {
    std::mutex mutex;
    std::map<std::string, EmbeddingProviderFactory> factories;

    ProviderRegistry() {
        factories["hashing"] = [](size_t dim) -> std::unique_ptr<IEmbeddingProvider> {
            return std::make_unique<HashingEmbeddingProvider>(dim);
        };
        factories["mock"] = [](size_t dim) -> std::unique_ptr<IEmbeddingProvider> {
            return std::make_unique<MockEmbeddingProvider>(dim);
        };
    }
};

ProviderRegistry& registry() {
    static ProviderRegistry instance;
    return instance;
}

} // namespace

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.factories[toLower(name)] = std::move(factory);
}

std::vector<std::string> getRegisteredEmbeddingProviders() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    std::vector<std::string> names;
    for (const auto& [name, _] : reg.factories) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimension) {
    EmbeddingProviderFactory factory;
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.factories.find(toLower(name));
        if (it == reg.factories.end()) {
            spdlog::warn("Embedding provider '{}' not found", name);
            return nullptr;
        }
        factory = it->second;
    }
    return factory(dimension);
}

} // namespace docindex::ml
