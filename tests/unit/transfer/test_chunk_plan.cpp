/**
 * @file test_chunk_plan.cpp
 * @brief Unit tests for chunk size selection and range planning
 */

#include <gtest/gtest.h>

#include <kcenon/object_storage/config/client_config.h>
#include <kcenon/object_storage/transfer/chunk_plan.h>

namespace kcenon::object_storage::test {

namespace {
constexpr uint64_t MiB = 1024ULL * 1024;
}

TEST(ChunkPlanTest, ChunkCount) {
    EXPECT_EQ(chunk_count(0, 10), 0u);
    EXPECT_EQ(chunk_count(10, 0), 0u);
    EXPECT_EQ(chunk_count(10, 10), 1u);
    EXPECT_EQ(chunk_count(11, 10), 2u);
    EXPECT_EQ(chunk_count(150 * MiB, 64 * MiB), 3u);
}

TEST(ChunkPlanTest, UploadOf150MiBUses3Parts) {
    auto ranges = plan_chunks(150 * MiB, 64 * MiB);
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0], byte_range(0, 64 * MiB));
    EXPECT_EQ(ranges[1], byte_range(64 * MiB, 64 * MiB));
    EXPECT_EQ(ranges[2], byte_range(128 * MiB, 22 * MiB));
    EXPECT_TRUE(tiles_exactly(ranges, 150 * MiB));
}

TEST(ChunkPlanTest, DownloadRangesAreContiguous) {
    auto ranges = plan_chunks(10 * MiB, 4 * MiB);
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0].offset, 0u);
    EXPECT_EQ(ranges[1].offset, 4194304u);
    EXPECT_EQ(ranges[2].offset, 8388608u);
    EXPECT_EQ(ranges[2].length, 2 * MiB);
    EXPECT_EQ(ranges[2].last(), 10 * MiB - 1);
}

TEST(ChunkPlanTest, EmptyObjectHasNoChunks) {
    EXPECT_TRUE(plan_chunks(0, 4 * MiB).empty());
    EXPECT_TRUE(tiles_exactly({}, 0));
}

TEST(ChunkPlanTest, TilesExactlyDetectsGapsAndOverlap) {
    EXPECT_FALSE(tiles_exactly({byte_range(0, 5), byte_range(6, 4)}, 10));
    EXPECT_FALSE(tiles_exactly({byte_range(0, 6), byte_range(5, 5)}, 10));
    EXPECT_FALSE(tiles_exactly({byte_range(0, 5)}, 10));
    EXPECT_FALSE(tiles_exactly({byte_range(0, 10), byte_range(10, 0)}, 10));
}

TEST(ChunkPlanTest, UploadChunkSizeHasFloor) {
    EXPECT_EQ(effective_upload_chunk_size(100 * MiB, 1 * MiB), min_upload_chunk_size);
    EXPECT_EQ(effective_upload_chunk_size(100 * MiB, 16 * MiB), 16 * MiB);
}

TEST(ChunkPlanTest, UploadChunkSizeGrowsToStayUnderPartLimit) {
    const uint64_t huge = 100000ULL * 5 * MiB;
    auto size = effective_upload_chunk_size(huge, 5 * MiB);
    EXPECT_GT(size, 5 * MiB);
    EXPECT_LE(chunk_count(huge, size), max_upload_parts);
}

TEST(ChunkPlanTest, DownloadChunkSizeHasFloor) {
    EXPECT_EQ(effective_download_chunk_size(1024), min_download_chunk_size);
    EXPECT_EQ(effective_download_chunk_size(8 * MiB), 8 * MiB);
}

TEST(ChunkPlanTest, ClampParallelism) {
    EXPECT_EQ(clamp_parallelism(0, 10), 1u);
    EXPECT_EQ(clamp_parallelism(4, 10), 4u);
    EXPECT_EQ(clamp_parallelism(64, max_parallel_downloads_limit), 8u);
}

}  // namespace kcenon::object_storage::test
