#include "world/streaming/chunk_grid.h"
#include "world/streaming/chunk_registry.h"
#include "world/streaming/streaming_planner.h"

#include "fake_chunk_provider.h"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace
{
    using streaming::ChunkCoord;
    using streaming::ChunkGrid;
    using streaming::ChunkRegistry;
    using streaming::StreamingConfig;
    using streaming::StreamingPlanner;

    StreamingConfig make_config(int32_t radius, int32_t hysteresis)
    {
        StreamingConfig cfg{};
        cfg.active_radius = radius;
        cfg.hysteresis = hysteresis;
        return cfg;
    }

    void load_square(ChunkRegistry &registry, const ChunkGrid &grid, const ChunkCoord &center, int32_t radius)
    {
        for (int32_t dz = -radius; dz <= radius; ++dz)
        {
            for (int32_t dx = -radius; dx <= radius; ++dx)
            {
                registry.commit_load(ChunkCoord{center.x + dx, center.z + dz}, grid, 0);
            }
        }
    }
} // namespace

TEST(StreamingPlanner, EmptyRegistryLoadsNearestFirstWithCoordTieBreak)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);

    const auto plan = StreamingPlanner::plan(ChunkCoord{0, 0}, registry, make_config(1, 0));

    const std::vector<ChunkCoord> expected{
            {0, 0},
            {-1, -1}, {-1, 0}, {-1, 1},
            {0, -1}, {0, 1},
            {1, -1}, {1, 0}, {1, 1},
    };
    EXPECT_EQ(plan.to_load, expected);
    EXPECT_TRUE(plan.to_unload.empty());
    EXPECT_TRUE(plan.to_cancel.empty());
}

TEST(StreamingPlanner, RadiusTwoOrdersByRing)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);

    const auto plan = StreamingPlanner::plan(ChunkCoord{3, -2}, registry, make_config(2, 1));
    ASSERT_EQ(plan.to_load.size(), 25u);

    int64_t last = 0;
    for (const ChunkCoord &c : plan.to_load)
    {
        const int64_t d = ChunkGrid::chebyshev_distance(c, ChunkCoord{3, -2});
        EXPECT_GE(d, last);
        EXPECT_LE(d, 2);
        last = d;
    }
    EXPECT_EQ(plan.to_load.front(), (ChunkCoord{3, -2}));
}

TEST(StreamingPlanner, PlanIsIdempotent)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    const ChunkGrid grid(64.0);
    load_square(registry, grid, ChunkCoord{0, 0}, 1);

    const StreamingConfig cfg = make_config(2, 0);
    const auto a = StreamingPlanner::plan(ChunkCoord{1, 0}, registry, cfg);
    const auto b = StreamingPlanner::plan(ChunkCoord{1, 0}, registry, cfg);

    EXPECT_EQ(a.to_load, b.to_load);
    EXPECT_EQ(a.to_unload, b.to_unload);
    EXPECT_EQ(a.to_cancel, b.to_cancel);
}

TEST(StreamingPlanner, ExcludesChunksAlreadyInRegistry)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    const ChunkGrid grid(64.0);
    load_square(registry, grid, ChunkCoord{0, 0}, 1);

    const auto plan = StreamingPlanner::plan(ChunkCoord{0, 0}, registry, make_config(1, 0));
    EXPECT_TRUE(plan.to_load.empty());
    EXPECT_TRUE(plan.to_unload.empty());
}

TEST(StreamingPlanner, UnloadsOnlyBeyondKeepRadius)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    const ChunkGrid grid(64.0);
    load_square(registry, grid, ChunkCoord{0, 0}, 2);

    // Observer one cell east: the x = -2 column is at distance 3.
    const auto with_hysteresis = StreamingPlanner::plan(ChunkCoord{1, 0}, registry, make_config(2, 1));
    EXPECT_TRUE(with_hysteresis.to_unload.empty());

    const auto without = StreamingPlanner::plan(ChunkCoord{1, 0}, registry, make_config(2, 0));
    const std::vector<ChunkCoord> expected{{-2, -2}, {-2, -1}, {-2, 0}, {-2, 1}, {-2, 2}};
    EXPECT_EQ(without.to_unload, expected);
}

TEST(StreamingPlanner, PendingUnloadBackInsideIsCancelled)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    const ChunkGrid grid(64.0);

    registry.commit_load(ChunkCoord{4, 0}, grid, 0);
    provider.fail_unloads.insert(ChunkCoord{4, 0});
    EXPECT_FALSE(registry.commit_unload(ChunkCoord{4, 0}, 0));
    ASSERT_EQ(registry.state(ChunkCoord{4, 0}), streaming::ChunkState::PendingUnload);

    const auto far = StreamingPlanner::plan(ChunkCoord{0, 0}, registry, make_config(1, 1));
    EXPECT_EQ(far.to_unload, (std::vector<ChunkCoord>{{4, 0}}));
    EXPECT_TRUE(far.to_cancel.empty());

    const auto near = StreamingPlanner::plan(ChunkCoord{3, 0}, registry, make_config(1, 1));
    EXPECT_TRUE(near.to_unload.empty());
    EXPECT_EQ(near.to_cancel, (std::vector<ChunkCoord>{{4, 0}}));
}

TEST(StreamingPlanner, NegativeRadiusPlansOnlyTheObserverCell)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);

    const auto plan = StreamingPlanner::plan(ChunkCoord{7, 7}, registry, make_config(-3, -1));
    EXPECT_EQ(plan.to_load, (std::vector<ChunkCoord>{{7, 7}}));
}

TEST(StreamingPlanner, UnnormalizedHugeRadiusStopsAtHardCeiling)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);

    const auto plan = StreamingPlanner::plan(ChunkCoord{0, 0}, registry,
                                             make_config(std::numeric_limits<int32_t>::max(), 0));
    const size_t side = 2 * static_cast<size_t>(streaming::StreamingLimits::kActiveRadiusCeiling) + 1;
    EXPECT_EQ(plan.to_load.size(), side * side);
    EXPECT_EQ(plan.to_load.front(), (ChunkCoord{0, 0}));
}

TEST(StreamingPlanner, SkipsCellsOutsideCoordinateRange)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    const int32_t max = std::numeric_limits<int32_t>::max();

    const auto plan = StreamingPlanner::plan(ChunkCoord{max, 0}, registry, make_config(1, 0));
    EXPECT_EQ(plan.to_load.size(), 6u);
    for (const ChunkCoord &c : plan.to_load)
    {
        EXPECT_GE(c.x, max - 1);
    }
}
