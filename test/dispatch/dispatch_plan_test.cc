#include <gtest/gtest.h>
#include "../../src/dispatch/dispatch_plan.h"
#include "../../src/common/errors.h"

#include <numeric>

using namespace ProducerPerf;

TEST(DispatchPlanTest, LastChunkTakesRemainder) {
    EXPECT_EQ(PlanChunks(10, 3), std::vector<int64_t>({3, 3, 4}));
    EXPECT_EQ(PlanChunks(7, 7), std::vector<int64_t>({1, 1, 1, 1, 1, 1, 1}));
    EXPECT_EQ(PlanChunks(5, 1), std::vector<int64_t>({5}));
}

TEST(DispatchPlanTest, ChunksSumToLoad) {
    for (int workers = 1; workers <= 16; workers++) {
        std::vector<int64_t> chunks = PlanChunks(1001, workers);
        ASSERT_EQ(chunks.size(), static_cast<size_t>(workers));
        EXPECT_EQ(std::accumulate(chunks.begin(), chunks.end(), int64_t{0}), 1001);
    }
}

TEST(DispatchPlanTest, RejectsInvalidWorkerCounts) {
    EXPECT_THROW(PlanChunks(10, 0), ConfigurationError);
    EXPECT_THROW(PlanChunks(3, 4), ConfigurationError);
}
