#include <gtest/gtest.h>
#include "ferry/transfer/chunk_plan.hpp"

using namespace ferry::transfer;

class ChunkPlanTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t MB = 1024 * 1024;
};

TEST_F(ChunkPlanTest, PartitionsWholeFile) {
    auto plan = ChunkPlan::build(25 * MB, 10 * MB);
    
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_TRUE(plan.is_valid_partition(25 * MB));
    EXPECT_EQ(plan.chunks()[0].start_offset, 0u);
    EXPECT_EQ(plan.chunks()[0].end_offset, 10 * MB);
    EXPECT_EQ(plan.chunks()[2].start_offset, 20 * MB);
    EXPECT_EQ(plan.chunks()[2].end_offset, 25 * MB);
    EXPECT_EQ(plan.chunks()[2].size(), 5 * MB);
    
    for (const auto& chunk : plan.chunks()) {
        EXPECT_FALSE(chunk.completed);
        EXPECT_FALSE(chunk.hash.has_value());
    }
}

TEST_F(ChunkPlanTest, ExactMultiple) {
    auto plan = ChunkPlan::build(20 * MB, 10 * MB);
    EXPECT_EQ(plan.size(), 2u);
    EXPECT_TRUE(plan.is_valid_partition(20 * MB));
}

TEST_F(ChunkPlanTest, ChunkCount) {
    EXPECT_EQ(ChunkPlan::chunk_count_for(0, 10), 0u);
    EXPECT_EQ(ChunkPlan::chunk_count_for(1, 10), 1u);
    EXPECT_EQ(ChunkPlan::chunk_count_for(10, 10), 1u);
    EXPECT_EQ(ChunkPlan::chunk_count_for(11, 10), 2u);
    EXPECT_EQ(ChunkPlan::chunk_count_for(11, 0), 0u);
}

TEST_F(ChunkPlanTest, EmptyFileHasNoChunks) {
    auto plan = ChunkPlan::build(0, 10 * MB);
    EXPECT_TRUE(plan.empty());
    EXPECT_TRUE(plan.is_valid_partition(0));
}

TEST_F(ChunkPlanTest, MarkCompletedThrough) {
    auto plan = ChunkPlan::build(25 * MB, 10 * MB);
    
    plan.mark_completed_through(15 * MB);
    EXPECT_EQ(plan.completed_count(), 1u);
    EXPECT_EQ(plan.completed_bytes(), 10 * MB);
    EXPECT_EQ(plan.contiguous_completed_bytes(), 10 * MB);
    ASSERT_TRUE(plan.first_incomplete().has_value());
    EXPECT_EQ(*plan.first_incomplete(), 1u);
    
    plan.mark_completed_through(25 * MB);
    EXPECT_EQ(plan.completed_count(), 3u);
    EXPECT_FALSE(plan.first_incomplete().has_value());
}

TEST_F(ChunkPlanTest, ContiguousPrefixStopsAtGap) {
    auto plan = ChunkPlan::build(30 * MB, 10 * MB);
    plan.mark_completed_through(30 * MB);
    plan.mark_incomplete({1});
    
    EXPECT_EQ(plan.completed_bytes(), 20 * MB);
    EXPECT_EQ(plan.contiguous_completed_bytes(), 10 * MB);
    EXPECT_EQ(*plan.first_incomplete(), 1u);
}

TEST_F(ChunkPlanTest, ResetFrom) {
    auto plan = ChunkPlan::build(30 * MB, 10 * MB);
    plan.mark_completed_through(30 * MB);
    
    plan.reset_from(1);
    EXPECT_EQ(plan.completed_count(), 1u);
    
    plan.reset_all();
    EXPECT_EQ(plan.completed_count(), 0u);
}

TEST_F(ChunkPlanTest, MarkIncompleteIgnoresUnknownIndex) {
    auto plan = ChunkPlan::build(20 * MB, 10 * MB);
    plan.mark_completed_through(20 * MB);
    
    plan.mark_incomplete({7});
    EXPECT_EQ(plan.completed_count(), 2u);
}

TEST_F(ChunkPlanTest, ChunkHashes) {
    auto plan = ChunkPlan::build(20 * MB, 10 * MB);
    
    EXPECT_TRUE(plan.set_chunk_hash(1, "abcd"));
    EXPECT_FALSE(plan.set_chunk_hash(2, "ffff"));
    ASSERT_TRUE(plan.chunks()[1].hash.has_value());
    EXPECT_EQ(*plan.chunks()[1].hash, "abcd");
}

TEST_F(ChunkPlanTest, InvalidPartitionDetected) {
    auto plan = ChunkPlan::build(20 * MB, 10 * MB);
    EXPECT_FALSE(plan.is_valid_partition(21 * MB));
}
