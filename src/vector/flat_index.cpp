#include <algorithm>
#include <istream>
#include <ostream>
#include <utility>
#include <docindex/vector/flat_index.h>

namespace docindex::vector {

namespace {
// Guards against allocating from a garbage header
constexpr uint64_t kMaxSerializedFloats = uint64_t{1} << 32;
constexpr uint64_t kReserveRows = 4096;
} // namespace

float squaredL2(const float* a, const float* b, size_t dimension) {
    float sum = 0.0f;
    for (size_t i = 0; i < dimension; ++i) {
        const float diff = a[i] - b[i];
        sum += diff * diff;
    }
    return sum;
}

FlatIndex::FlatIndex(size_t dimension) : dimension_(dimension) {}

Result<void> FlatIndex::add(ChunkId id, const std::vector<float>& vector) {
    if (vector.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     "Vector dimension mismatch: expected " + std::to_string(dimension_) +
                         ", got " + std::to_string(vector.size())};
    }
    data_.insert(data_.end(), vector.begin(), vector.end());
    ids_.push_back(id);
    return Result<void>();
}

Result<void> FlatIndex::addBatch(const std::vector<ChunkId>& ids,
                                 const std::vector<std::vector<float>>& vectors) {
    if (ids.size() != vectors.size()) {
        return Error{ErrorCode::InvalidArgument, "IDs and vectors size mismatch"};
    }
    for (size_t i = 0; i < vectors.size(); ++i) {
        if (vectors[i].size() != dimension_) {
            return Error{ErrorCode::InvalidArgument,
                         "Vector dimension mismatch at index " + std::to_string(i)};
        }
    }

    data_.reserve(data_.size() + vectors.size() * dimension_);
    ids_.reserve(ids_.size() + ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        data_.insert(data_.end(), vectors[i].begin(), vectors[i].end());
        ids_.push_back(ids[i]);
    }
    return Result<void>();
}

Result<std::vector<FlatSearchHit>> FlatIndex::search(const std::vector<float>& query, size_t k,
                                                     const Filter& filter) const {
    if (query.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument, "Query dimension mismatch"};
    }

    std::vector<std::pair<float, size_t>> distances;
    distances.reserve(ids_.size());
    for (size_t row = 0; row < ids_.size(); ++row) {
        if (filter && !filter(ids_[row])) {
            continue;
        }
        distances.emplace_back(squaredL2(query.data(), data_.data() + row * dimension_, dimension_),
                               row);
    }

    const size_t resultSize = std::min(k, distances.size());
    std::partial_sort(distances.begin(), distances.begin() + static_cast<std::ptrdiff_t>(resultSize),
                      distances.end());

    std::vector<FlatSearchHit> hits;
    hits.reserve(resultSize);
    for (size_t i = 0; i < resultSize; ++i) {
        hits.push_back(FlatSearchHit{ids_[distances[i].second], distances[i].first});
    }
    return hits;
}

size_t FlatIndex::retain(const Filter& keep) {
    size_t write = 0;
    for (size_t row = 0; row < ids_.size(); ++row) {
        if (!keep(ids_[row])) {
            continue;
        }
        if (write != row) {
            ids_[write] = ids_[row];
            std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(row * dimension_), dimension_,
                        data_.begin() + static_cast<std::ptrdiff_t>(write * dimension_));
        }
        ++write;
    }
    const size_t removed = ids_.size() - write;
    ids_.resize(write);
    data_.resize(write * dimension_);
    ids_.shrink_to_fit();
    data_.shrink_to_fit();
    return removed;
}

void FlatIndex::clear() {
    ids_.clear();
    data_.clear();
}

Result<void> FlatIndex::serialize(std::ostream& out) const {
    const auto dim = static_cast<uint32_t>(dimension_);
    const auto rows = static_cast<uint64_t>(ids_.size());
    out.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
    out.write(reinterpret_cast<const char*>(&rows), sizeof(rows));

    for (size_t row = 0; row < ids_.size(); ++row) {
        const int64_t id = ids_[row];
        out.write(reinterpret_cast<const char*>(&id), sizeof(id));
        out.write(reinterpret_cast<const char*>(data_.data() + row * dimension_),
                  static_cast<std::streamsize>(dimension_ * sizeof(float)));
    }

    if (!out.good()) {
        return Error{ErrorCode::WriteError, "Failed to serialize vector index"};
    }
    return Result<void>();
}

Result<void> FlatIndex::deserialize(std::istream& in) {
    uint32_t dim = 0;
    uint64_t rows = 0;
    in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
    in.read(reinterpret_cast<char*>(&rows), sizeof(rows));
    if (!in.good()) {
        return Error{ErrorCode::CorruptedData, "Truncated vector index header"};
    }
    if (dim != dimension_) {
        return Error{ErrorCode::InvalidData, "Dimension mismatch: stored " + std::to_string(dim) +
                                                 ", expected " + std::to_string(dimension_)};
    }
    if (dim == 0 || rows > kMaxSerializedFloats / dim) {
        return Error{ErrorCode::CorruptedData,
                     "Number of vectors seems invalid: " + std::to_string(rows)};
    }

    // Grow with the rows actually read; the header count is not trusted for allocation
    const size_t reserveRows = static_cast<size_t>(std::min<uint64_t>(rows, kReserveRows));
    std::vector<ChunkId> ids;
    std::vector<float> data;
    ids.reserve(reserveRows);
    data.reserve(reserveRows * dim);
    std::vector<float> row(dim);
    for (uint64_t r = 0; r < rows; ++r) {
        int64_t id = 0;
        in.read(reinterpret_cast<char*>(&id), sizeof(id));
        in.read(reinterpret_cast<char*>(row.data()),
                static_cast<std::streamsize>(dim * sizeof(float)));
        if (!in.good()) {
            return Error{ErrorCode::CorruptedData,
                         "Truncated vector index at row " + std::to_string(r)};
        }
        ids.push_back(id);
        data.insert(data.end(), row.begin(), row.end());
    }

    ids_ = std::move(ids);
    data_ = std::move(data);
    return Result<void>();
}

} // namespace docindex::vector
