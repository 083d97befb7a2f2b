#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <vector>
#include <docindex/core/types.h>

namespace docindex::vector {

struct FlatSearchHit {
    ChunkId id = 0;
    float distance = 0.0f; ///< Squared Euclidean distance
};

/**
 * @brief Exact nearest-neighbour index over fixed-width float vectors
 *
 * Rows are stored contiguously and compared against every query. Rows are only
 * appended; dropping rows happens through retain(). Not synchronized, the owner
 * holds the lock.
 */
class FlatIndex {
public:
    using Filter = std::function<bool(ChunkId)>;

    explicit FlatIndex(size_t dimension);

    size_t dimension() const { return dimension_; }
    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }

    Result<void> add(ChunkId id, const std::vector<float>& vector);
    Result<void> addBatch(const std::vector<ChunkId>& ids,
                          const std::vector<std::vector<float>>& vectors);

    /**
     * @brief The k closest rows accepted by filter, ascending by distance then insertion order
     */
    Result<std::vector<FlatSearchHit>> search(const std::vector<float>& query, size_t k,
                                              const Filter& filter = {}) const;

    /**
     * @brief Drop every row whose id is rejected by keep, preserving order
     * @return Number of rows removed
     */
    size_t retain(const Filter& keep);

    void clear();

    const std::vector<ChunkId>& ids() const { return ids_; }

    size_t memoryUsageBytes() const {
        return data_.size() * sizeof(float) + ids_.size() * sizeof(ChunkId);
    }

    /**
     * Layout: uint32 dimension, uint64 rows, then per row int64 id and dimension floats
     */
    Result<void> serialize(std::ostream& out) const;
    Result<void> deserialize(std::istream& in);

private:
    size_t dimension_;
    std::vector<float> data_; // row-major, size() * dimension_
    std::vector<ChunkId> ids_;
};

float squaredL2(const float* a, const float* b, size_t dimension);

} // namespace docindex::vector
