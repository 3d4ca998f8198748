#include <gtest/gtest.h>

#include <sdm/planner.hpp>

using namespace sdm;

static auto expect_covers(ChunkPlan const& plan, std::int64_t total_size) -> void {
    ASSERT_FALSE(plan.empty());
    auto next = std::int64_t{};
    for (std::size_t i = 0; i != plan.size(); ++i) {
        EXPECT_EQ(plan[i].index, i);
        EXPECT_EQ(plan[i].start, next);
        EXPECT_GE(plan[i].size(), total_size ? 1 : 0);
        next = plan[i].end + 1;
    }
    EXPECT_EQ(next, total_size);
}

TEST(PlannerTest, WorkerHeuristicBoundaries) {
    EXPECT_EQ(plan_workers(0), 1u);
    EXPECT_EQ(plan_workers(5 * MiB - 1), 1u);
    EXPECT_EQ(plan_workers(5 * MiB), 4u);
    EXPECT_EQ(plan_workers(100 * MiB - 1), 4u);
    EXPECT_EQ(plan_workers(100 * MiB), 8u);
    EXPECT_EQ(plan_workers(GiB - 1), 8u);
    EXPECT_EQ(plan_workers(GiB), 16u);
    EXPECT_EQ(plan_workers(64 * GiB), 16u);
}

TEST(PlannerTest, WorkerHeuristicIsMonotonic) {
    auto last = plan_workers(0);
    for (std::int64_t size = 1; size < 4 * GiB; size = size * 3 / 2 + 1) {
        auto const workers = plan_workers(size);
        EXPECT_GE(workers, last) << size;
        last = workers;
    }
}

TEST(PlannerTest, TenMiBWithFourWorkers) {
    auto const plan = plan_chunks(10485760, 4);
    ASSERT_EQ(plan.size(), 4u);
    EXPECT_EQ(plan[0].range(), "0-2621439");
    EXPECT_EQ(plan[1].range(), "2621440-5242879");
    EXPECT_EQ(plan[2].range(), "5242880-7864319");
    EXPECT_EQ(plan[3].range(), "7864320-10485759");
}

TEST(PlannerTest, LastChunkTakesRemainder) {
    auto const plan = plan_chunks(10, 3);
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan[0].size(), 3);
    EXPECT_EQ(plan[1].size(), 3);
    EXPECT_EQ(plan[2].size(), 4);
    expect_covers(plan, 10);
}

TEST(PlannerTest, CoverageWithoutGaps) {
    for (std::int64_t size : {1, 2, 3, 7, 64, 1000, 4097, 1 << 20}) {
        for (std::uint32_t workers : {1u, 2u, 3u, 4u, 8u, 16u, 64u}) {
            SCOPED_TRACE(fmt::format("size={} workers={}", size, workers));
            auto const plan = plan_chunks(size, workers);
            EXPECT_EQ((std::int64_t)plan.size(), std::min((std::int64_t)workers, size));
            expect_covers(plan, size);
        }
    }
}

TEST(PlannerTest, SmallFileClampsWorkers) {
    auto const plan = plan_chunks(3, 16);
    ASSERT_EQ(plan.size(), 3u);
    for (auto const& chunk : plan) {
        EXPECT_EQ(chunk.size(), 1);
    }
}

TEST(PlannerTest, LargeWorkerRequestIsUsedVerbatim) {
    auto const plan = plan_chunks(100 * MiB, 200);
    ASSERT_EQ(plan.size(), 200u);
    expect_covers(plan, 100 * MiB);
}

TEST(PlannerTest, EmptyResourceHasOneEmptyChunk) {
    auto const plan = plan_chunks(0, 8);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0].start, 0);
    EXPECT_EQ(plan[0].end, -1);
    EXPECT_EQ(plan[0].size(), 0);
}

TEST(PlannerTest, ZeroWorkersUsesHeuristic) {
    EXPECT_EQ(plan_chunks(MiB, 0).size(), 1u);
    EXPECT_EQ(plan_chunks(10 * MiB, 0).size(), 4u);
    EXPECT_EQ(plan_chunks(200 * MiB, 0).size(), 8u);
}

TEST(PlannerTest, NegativeSizeIsRejected) {
    try {
        plan_chunks(-1, 4);
        FAIL() << "expected an error";
    } catch (Error const& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
}
