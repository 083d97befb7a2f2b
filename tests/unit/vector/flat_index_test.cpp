#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <sstream>
#include <docindex/vector/flat_index.h>

using namespace docindex;
using namespace docindex::vector;

class FlatIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(index_.add(10, {0.0f, 0.0f, 0.0f}).has_value());
        ASSERT_TRUE(index_.add(11, {1.0f, 0.0f, 0.0f}).has_value());
        ASSERT_TRUE(index_.add(12, {0.0f, 2.0f, 0.0f}).has_value());
        ASSERT_TRUE(index_.add(13, {0.0f, 0.0f, 3.0f}).has_value());
    }

    FlatIndex index_{3};
};

TEST_F(FlatIndexTest, SquaredDistance) {
    const float a[] = {1.0f, 2.0f, 3.0f};
    const float b[] = {4.0f, 6.0f, 3.0f};
    EXPECT_FLOAT_EQ(squaredL2(a, b, 3), 25.0f);
    EXPECT_FLOAT_EQ(squaredL2(a, a, 3), 0.0f);
}

TEST_F(FlatIndexTest, ReturnsNearestInAscendingOrder) {
    auto hits = index_.search({0.9f, 0.0f, 0.0f}, 3);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits.value().size(), 3u);
    EXPECT_EQ(hits.value()[0].id, 11);
    EXPECT_NEAR(hits.value()[0].distance, 0.01f, 1e-5);
    EXPECT_EQ(hits.value()[1].id, 10);
    EXPECT_EQ(hits.value()[2].id, 12);
}

TEST_F(FlatIndexTest, KLargerThanIndexReturnsAll) {
    auto hits = index_.search({0.0f, 0.0f, 0.0f}, 100);
    ASSERT_TRUE(hits.has_value());
    EXPECT_EQ(hits.value().size(), 4u);
    EXPECT_TRUE(index_.search({0.0f, 0.0f, 0.0f}, 0).value().empty());
}

TEST_F(FlatIndexTest, TiesKeepInsertionOrder) {
    FlatIndex index(2);
    ASSERT_TRUE(index.add(5, {1.0f, 0.0f}).has_value());
    ASSERT_TRUE(index.add(3, {-1.0f, 0.0f}).has_value());
    ASSERT_TRUE(index.add(4, {0.0f, 1.0f}).has_value());

    auto hits = index.search({0.0f, 0.0f}, 3).value();
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].id, 5);
    EXPECT_EQ(hits[1].id, 3);
    EXPECT_EQ(hits[2].id, 4);
}

TEST_F(FlatIndexTest, FilterIsAppliedDuringScan) {
    auto hits = index_.search({1.0f, 0.0f, 0.0f}, 2, [](ChunkId id) { return id >= 12; });
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(hits.value()[0].id, 12);
    EXPECT_EQ(hits.value()[1].id, 13);
}

TEST_F(FlatIndexTest, RejectsWrongDimension) {
    auto add = index_.add(99, {1.0f, 2.0f});
    ASSERT_FALSE(add.has_value());
    EXPECT_EQ(add.error().code, ErrorCode::InvalidArgument);

    auto search = index_.search({1.0f}, 1);
    ASSERT_FALSE(search.has_value());
    EXPECT_EQ(search.error().code, ErrorCode::InvalidArgument);

    auto batch =
        index_.addBatch({1, 2}, std::vector<std::vector<float>>{{1.0f, 2.0f, 3.0f}});
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(index_.size(), 4u);
}

TEST_F(FlatIndexTest, RetainDropsRejectedRows) {
    EXPECT_EQ(index_.retain([](ChunkId id) { return id % 2 == 0; }), 2u);
    EXPECT_EQ(index_.size(), 2u);
    EXPECT_EQ(index_.ids(), (std::vector<ChunkId>{10, 12}));

    auto hits = index_.search({0.0f, 2.0f, 0.0f}, 1).value();
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, 12);
    EXPECT_FLOAT_EQ(hits[0].distance, 0.0f);
}

TEST_F(FlatIndexTest, SerializeRestoresRows) {
    std::stringstream buffer;
    ASSERT_TRUE(index_.serialize(buffer).has_value());

    FlatIndex restored(3);
    ASSERT_TRUE(restored.deserialize(buffer).has_value());
    EXPECT_EQ(restored.ids(), index_.ids());

    auto hits = restored.search({0.0f, 0.0f, 2.9f}, 1).value();
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, 13);
}

TEST_F(FlatIndexTest, DeserializeRejectsOtherDimension) {
    std::stringstream buffer;
    ASSERT_TRUE(index_.serialize(buffer).has_value());

    FlatIndex other(4);
    auto result = other.deserialize(buffer);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidData);
    EXPECT_TRUE(other.empty());
}

TEST_F(FlatIndexTest, DeserializeRejectsTruncatedData) {
    std::stringstream buffer;
    ASSERT_TRUE(index_.serialize(buffer).has_value());
    std::string bytes = buffer.str();
    std::stringstream truncated(bytes.substr(0, bytes.size() - 5));

    FlatIndex restored(3);
    EXPECT_FALSE(restored.deserialize(truncated).has_value());
}

namespace {
std::stringstream headerOnly(uint32_t dim, uint64_t rows) {
    std::stringstream buffer;
    buffer.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
    buffer.write(reinterpret_cast<const char*>(&rows), sizeof(rows));
    return buffer;
}
} // namespace

TEST(FlatIndexHeaderTest, ZeroDimensionHeaderIsCorrupt) {
    auto buffer = headerOnly(0, std::numeric_limits<uint64_t>::max());
    FlatIndex restored(0);
    Result<void> result;
    EXPECT_NO_THROW(result = restored.deserialize(buffer));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CorruptedData);
    EXPECT_TRUE(restored.empty());
}

TEST(FlatIndexHeaderTest, HugeRowCountIsCorrupt) {
    auto buffer = headerOnly(3, uint64_t{1} << 40);
    FlatIndex restored(3);
    Result<void> result;
    EXPECT_NO_THROW(result = restored.deserialize(buffer));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CorruptedData);
}

TEST(FlatIndexHeaderTest, RowCountBeyondDataIsTruncated) {
    // Plausible count but no rows behind it: fails on read, not on allocation
    auto buffer = headerOnly(3, 1'000'000);
    FlatIndex restored(3);
    Result<void> result;
    EXPECT_NO_THROW(result = restored.deserialize(buffer));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CorruptedData);
    EXPECT_TRUE(restored.empty());
}

TEST_F(FlatIndexTest, ClearEmptiesIndex) {
    EXPECT_GT(index_.memoryUsageBytes(), 0u);
    index_.clear();
    EXPECT_TRUE(index_.empty());
    EXPECT_TRUE(index_.search({0.0f, 0.0f, 0.0f}, 3).value().empty());
}
