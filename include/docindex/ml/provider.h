#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <docindex/core/types.h>

namespace docindex::ml {

/**
 * @brief Text to fixed-width float vector
 *
 * Lifecycle: construct, initialize(), embed, shutdown(). Embedding calls made
 * before a successful initialize() return ErrorCode::NotInitialized. Every
 * vector returned has exactly getEmbeddingDimension() components; the indexer
 * rejects anything else.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<void> initialize() = 0;
    virtual void shutdown() = 0;

    virtual Result<std::vector<float>> generateEmbedding(const std::string& text) = 0;

    /// Results line up index-for-index with texts
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual bool isAvailable() const = 0;
    virtual std::string getProviderName() const = 0;
    virtual size_t getEmbeddingDimension() const = 0;

    /// 0 when the provider accepts text of any length
    virtual size_t getMaxSequenceLength() const = 0;
};

using EmbeddingProviderFactory = std::function<std::unique_ptr<IEmbeddingProvider>(size_t)>;

/**
 * @brief Instantiate a provider by registered name, ignoring case
 *
 * "hashing" and "mock" are always registered. Returns nullptr for an unknown
 * name; the provider is returned uninitialized.
 */
std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimension = 384);

/// Later registrations under the same name win
void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory);

std::vector<std::string> getRegisteredEmbeddingProviders();

} // namespace docindex::ml
