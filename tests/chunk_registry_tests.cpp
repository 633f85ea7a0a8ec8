#include "world/streaming/chunk_grid.h"
#include "world/streaming/chunk_registry.h"

#include "core/util/logger.h"
#include "fake_chunk_provider.h"

#include <gtest/gtest.h>

namespace
{
    using streaming::ChunkCoord;
    using streaming::ChunkGrid;
    using streaming::ChunkRegistry;
    using streaming::ChunkState;

    const ChunkGrid kGrid(100.0);
} // namespace

TEST(ChunkRegistry, LoadMakesChunkResidentWithHandle)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);

    EXPECT_EQ(registry.state(ChunkCoord{1, 2}), ChunkState::Unloaded);
    EXPECT_TRUE(registry.commit_load(ChunkCoord{1, 2}, kGrid, 0));

    const streaming::ResidentChunk *chunk = registry.find(ChunkCoord{1, 2});
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->state, ChunkState::Resident);
    EXPECT_TRUE(chunk->handle.is_valid());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.stats().loads, 1u);
}

TEST(ChunkRegistry, DuplicateLoadIsRefused)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);

    ASSERT_TRUE(registry.commit_load(ChunkCoord{0, 0}, kGrid, 0));
    const auto handle = registry.find(ChunkCoord{0, 0})->handle;

    EXPECT_FALSE(registry.commit_load(ChunkCoord{0, 0}, kGrid, 1));
    EXPECT_EQ(provider.load_calls.size(), 1u);
    EXPECT_EQ(registry.find(ChunkCoord{0, 0})->handle, handle);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ChunkRegistry, FailedLoadLeavesNoEntryAndBacksOff)
{
    FakeChunkProvider provider;
    provider.fail_loads.insert(ChunkCoord{3, 3});
    ChunkRegistry registry(&provider);

    streaming::RetryPolicy retry{};
    retry.load_base_delay_frames = 4;
    retry.load_max_delay_frames = 10;
    registry.set_retry_policy(retry);

    EXPECT_FALSE(registry.commit_load(ChunkCoord{3, 3}, kGrid, 5));
    EXPECT_FALSE(registry.contains(ChunkCoord{3, 3}));
    EXPECT_EQ(registry.stats().load_failures, 1u);

    EXPECT_TRUE(registry.load_retry_blocked(ChunkCoord{3, 3}, 5));
    EXPECT_TRUE(registry.load_retry_blocked(ChunkCoord{3, 3}, 8));
    EXPECT_FALSE(registry.load_retry_blocked(ChunkCoord{3, 3}, 9));

    // Second failure doubles the delay, third is capped.
    EXPECT_FALSE(registry.commit_load(ChunkCoord{3, 3}, kGrid, 9));
    EXPECT_EQ(registry.failure_records().at(ChunkCoord{3, 3}).retry_frame, 17u);
    EXPECT_FALSE(registry.commit_load(ChunkCoord{3, 3}, kGrid, 17));
    EXPECT_EQ(registry.failure_records().at(ChunkCoord{3, 3}).retry_frame, 27u);
    EXPECT_EQ(registry.failure_records().at(ChunkCoord{3, 3}).attempts, 3u);
    EXPECT_EQ(registry.failure_records().at(ChunkCoord{3, 3}).last_error, "scripted load failure");

    // A later success clears the record.
    provider.fail_loads.clear();
    EXPECT_TRUE(registry.commit_load(ChunkCoord{3, 3}, kGrid, 27));
    EXPECT_TRUE(registry.failure_records().empty());
}

TEST(ChunkRegistry, LoadErrorWithValidHandleReleasesContent)
{
    FakeChunkProvider provider;
    provider.partial_loads.insert(ChunkCoord{2, -1});
    ChunkRegistry registry(&provider);

    EXPECT_FALSE(registry.commit_load(ChunkCoord{2, -1}, kGrid, 0));
    EXPECT_FALSE(registry.contains(ChunkCoord{2, -1}));

    ASSERT_EQ(provider.unload_calls.size(), 1u);
    EXPECT_EQ(provider.unload_calls[0], (ChunkCoord{2, -1}));
    EXPECT_TRUE(provider.live.empty());

    EXPECT_EQ(registry.stats().load_failures, 1u);
    EXPECT_EQ(registry.failure_records().at(ChunkCoord{2, -1}).last_error, "scripted partial load");
}

TEST(ChunkRegistry, MissingProviderFailsLoads)
{
    ChunkRegistry registry(nullptr);

    EXPECT_FALSE(registry.commit_load(ChunkCoord{0, 0}, kGrid, 0));
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.failure_records().at(ChunkCoord{0, 0}).last_error, "no content provider");
}

TEST(ChunkRegistry, UnloadRemovesEntry)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);

    ASSERT_TRUE(registry.commit_load(ChunkCoord{2, -1}, kGrid, 0));
    EXPECT_TRUE(registry.commit_unload(ChunkCoord{2, -1}, 1));
    EXPECT_FALSE(registry.contains(ChunkCoord{2, -1}));
    EXPECT_TRUE(provider.live.empty());
    EXPECT_EQ(registry.stats().unloads, 1u);

    EXPECT_FALSE(registry.commit_unload(ChunkCoord{2, -1}, 2));
}

TEST(ChunkRegistry, FailedUnloadKeepsHandleAndRetriesWithBackoff)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);

    ASSERT_TRUE(registry.commit_load(ChunkCoord{0, 0}, kGrid, 0));
    const auto handle = registry.find(ChunkCoord{0, 0})->handle;
    provider.fail_unloads.insert(ChunkCoord{0, 0});

    EXPECT_FALSE(registry.commit_unload(ChunkCoord{0, 0}, 10));
    ASSERT_TRUE(registry.contains(ChunkCoord{0, 0}));
    EXPECT_EQ(registry.state(ChunkCoord{0, 0}), ChunkState::PendingUnload);
    EXPECT_EQ(registry.find(ChunkCoord{0, 0})->handle, handle);
    EXPECT_EQ(registry.unload_attempts(ChunkCoord{0, 0}), 1u);

    // Default unload backoff: 1, 2, 4 ... frames.
    EXPECT_TRUE(registry.unload_retry_blocked(ChunkCoord{0, 0}, 10));
    EXPECT_FALSE(registry.unload_retry_blocked(ChunkCoord{0, 0}, 11));

    EXPECT_FALSE(registry.commit_unload(ChunkCoord{0, 0}, 11));
    EXPECT_TRUE(registry.unload_retry_blocked(ChunkCoord{0, 0}, 12));
    EXPECT_FALSE(registry.unload_retry_blocked(ChunkCoord{0, 0}, 13));

    provider.fail_unloads.clear();
    EXPECT_TRUE(registry.commit_unload(ChunkCoord{0, 0}, 13));
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.stats().unload_failures, 2u);
}

TEST(ChunkRegistry, RepeatedUnloadFailuresEscalateToErrors)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    ASSERT_TRUE(registry.commit_load(ChunkCoord{5, 5}, kGrid, 0));
    provider.fail_unloads.insert(ChunkCoord{5, 5});

    Logger::reset_counts();
    registry.commit_unload(ChunkCoord{5, 5}, 1);
    registry.commit_unload(ChunkCoord{5, 5}, 2);
    EXPECT_EQ(Logger::count(LogLevel::Warn), 2u);
    EXPECT_EQ(Logger::count(LogLevel::Error), 0u);

    registry.commit_unload(ChunkCoord{5, 5}, 4);
    EXPECT_EQ(Logger::count(LogLevel::Error), 1u);
    EXPECT_EQ(registry.unload_attempts(ChunkCoord{5, 5}), 3u);
    EXPECT_TRUE(registry.contains(ChunkCoord{5, 5}));

    provider.fail_unloads.clear();
}

TEST(ChunkRegistry, CancelUnloadRestoresResident)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    ASSERT_TRUE(registry.commit_load(ChunkCoord{1, 1}, kGrid, 0));

    EXPECT_FALSE(registry.cancel_unload(ChunkCoord{1, 1}));

    provider.fail_unloads.insert(ChunkCoord{1, 1});
    registry.commit_unload(ChunkCoord{1, 1}, 0);
    ASSERT_EQ(registry.state(ChunkCoord{1, 1}), ChunkState::PendingUnload);

    const size_t unload_calls = provider.unload_calls.size();
    EXPECT_TRUE(registry.cancel_unload(ChunkCoord{1, 1}));
    EXPECT_EQ(registry.state(ChunkCoord{1, 1}), ChunkState::Resident);
    EXPECT_EQ(registry.unload_attempts(ChunkCoord{1, 1}), 0u);
    EXPECT_EQ(provider.unload_calls.size(), unload_calls);
    EXPECT_EQ(registry.stats().cancelled_unloads, 1u);

    provider.fail_unloads.clear();
}

TEST(ChunkRegistry, ReleaseAllUnloadsEverythingAndCountsFailures)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    registry.commit_load(ChunkCoord{0, 0}, kGrid, 0);
    registry.commit_load(ChunkCoord{0, 1}, kGrid, 0);
    registry.commit_load(ChunkCoord{1, 0}, kGrid, 0);
    provider.fail_unloads.insert(ChunkCoord{0, 1});

    EXPECT_EQ(registry.release_all(), 1u);
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(provider.live.size(), 1u);
    EXPECT_EQ(registry.stats().unloads, 2u);
}

TEST(ChunkRegistry, DestructorReleasesRemainingChunks)
{
    FakeChunkProvider provider;
    {
        ChunkRegistry registry(&provider);
        registry.commit_load(ChunkCoord{0, 0}, kGrid, 0);
        registry.commit_load(ChunkCoord{-1, 0}, kGrid, 0);
    }
    EXPECT_TRUE(provider.live.empty());
}

TEST(ChunkRegistry, PruneDropsFailureRecordsOutsideKeepRadius)
{
    FakeChunkProvider provider;
    provider.fail_loads = {ChunkCoord{1, 0}, ChunkCoord{6, 0}};
    ChunkRegistry registry(&provider);
    registry.commit_load(ChunkCoord{1, 0}, kGrid, 0);
    registry.commit_load(ChunkCoord{6, 0}, kGrid, 0);
    ASSERT_EQ(registry.counts().failure_records, 2u);

    registry.prune_failures(ChunkCoord{0, 0}, 3);
    EXPECT_EQ(registry.counts().failure_records, 1u);
    EXPECT_EQ(registry.failure_records().count(ChunkCoord{1, 0}), 1u);
}

TEST(ChunkRegistry, EntriesAreSortedAndCountsByState)
{
    FakeChunkProvider provider;
    ChunkRegistry registry(&provider);
    registry.commit_load(ChunkCoord{2, 0}, kGrid, 0);
    registry.commit_load(ChunkCoord{-1, 5}, kGrid, 0);
    registry.commit_load(ChunkCoord{-1, -5}, kGrid, 0);

    provider.fail_unloads.insert(ChunkCoord{2, 0});
    registry.commit_unload(ChunkCoord{2, 0}, 0);

    const auto entries = registry.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].coord, (ChunkCoord{-1, -5}));
    EXPECT_EQ(entries[1].coord, (ChunkCoord{-1, 5}));
    EXPECT_EQ(entries[2].coord, (ChunkCoord{2, 0}));

    const auto counts = registry.counts();
    EXPECT_EQ(counts.resident, 2u);
    EXPECT_EQ(counts.pending_unload, 1u);
    EXPECT_EQ(counts.pending, 0u);
    EXPECT_EQ(counts.total(), 3u);

    provider.fail_unloads.clear();
}
