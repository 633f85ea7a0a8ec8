#include "runtime/game_runtime.h"
#include "game/streaming_game.h"

#include <gtest/gtest.h>

#include <vector>

namespace
{
    struct RecordingGame : GameRuntime::IGameCallbacks
    {
        void on_init(GameRuntime::Runtime &rt) override
        {
            runtime = &rt;
            inits++;
        }

        void on_update(float dt) override
        {
            updates++;
            last_dt = dt;
            if (runtime && runtime->input().state().key_pressed(Key::F5))
            {
                f5_frames.push_back(runtime->frame_index());
            }
        }

        void on_fixed_update(float) override { fixed_updates++; }
        void on_shutdown() override { shutdowns++; }

        GameRuntime::Runtime *runtime = nullptr;
        int inits = 0;
        int updates = 0;
        int fixed_updates = 0;
        int shutdowns = 0;
        float last_dt = 0.0f;
        std::vector<uint64_t> f5_frames;
    };

    GameRuntime::RuntimeSettings fixed_settings(uint64_t frames)
    {
        GameRuntime::RuntimeSettings s{};
        s.max_frames = frames;
        s.fixed_frame_time = 1.0f / 60.0f;
        return s;
    }

    streaming::StreamingSettings small_world()
    {
        streaming::StreamingSettings s{};
        s.chunk_size_m = 100.0;
        s.world_extent_chunks = 16;
        s.config.active_radius = 1;
        s.config.hysteresis = 0;
        s.config.load_cap_per_frame = 9;
        s.config.unload_cap_per_frame = 9;
        s.hud_interval_frames = 1;
        return s;
    }
} // namespace

TEST(GameRuntime, RunsRequestedFramesWithFixedSteps)
{
    GameRuntime::Runtime runtime(fixed_settings(10));
    RecordingGame game;

    EXPECT_EQ(runtime.run(&game), 10u);
    EXPECT_EQ(game.inits, 1);
    EXPECT_EQ(game.updates, 10);
    EXPECT_EQ(game.fixed_updates, 10);
    EXPECT_EQ(game.shutdowns, 1);
    EXPECT_FLOAT_EQ(game.last_dt, 1.0f / 60.0f);
}

TEST(GameRuntime, ScheduledTapsArriveOnTheirFrame)
{
    GameRuntime::Runtime runtime(fixed_settings(6));
    runtime.schedule_key_tap(2, Key::F5);
    runtime.schedule_key_tap(4, Key::F5);
    RecordingGame game;

    runtime.run(&game);
    EXPECT_EQ(game.f5_frames, (std::vector<uint64_t>{2, 4}));
}

TEST(GameRuntime, EscapeStopsTheLoop)
{
    GameRuntime::Runtime runtime(fixed_settings(100));
    runtime.schedule_key_tap(3, Key::Escape);
    RecordingGame game;

    EXPECT_EQ(runtime.run(&game), 4u);
    EXPECT_EQ(game.shutdowns, 1);
}

TEST(GameRuntime, NullCallbacksDoNothing)
{
    GameRuntime::Runtime runtime(fixed_settings(5));
    EXPECT_EQ(runtime.run(nullptr), 0u);
}

TEST(StreamingGame, StreamsAroundPlayerAndReleasesOnShutdown)
{
    const streaming::StreamingSettings settings = small_world();
    Bastion::ObserverRoute route(WorldVec3(50.0, 0.0, 50.0));
    route.hold(10.0);

    GameRuntime::Runtime runtime(fixed_settings(3));
    Bastion::StreamingGame game(settings, route);
    runtime.run(&game);

    EXPECT_EQ(game.manager().observer_chunk(), (streaming::ChunkCoord{0, 0}));
    EXPECT_EQ(game.spawner().spawned(), 9u);
    EXPECT_EQ(game.spawner().despawned(), 9u);
    EXPECT_EQ(game.entities().count(Bastion::EntityKind::ChunkRoot), 0u);
    EXPECT_EQ(game.entities().count(Bastion::EntityKind::Player), 1u);
    EXPECT_TRUE(game.manager().registry().empty());
    EXPECT_EQ(game.visible_ground_chunks(), 9u);
}

TEST(StreamingGame, FollowsRouteAcrossChunks)
{
    const streaming::StreamingSettings settings = small_world();
    Bastion::ObserverRoute route(WorldVec3(50.0, 0.0, 50.0));
    route.teleport_to(WorldVec3(450.0, 0.0, 50.0)).hold(10.0);

    GameRuntime::Runtime runtime(fixed_settings(4));
    Bastion::StreamingGame game(settings, route);
    runtime.run(&game);

    EXPECT_EQ(game.manager().observer_chunk(), (streaming::ChunkCoord{4, 0}));
    EXPECT_DOUBLE_EQ(game.player_position().x, 450.0);
    EXPECT_EQ(game.manager().registry().stats().loads, 9u);
}

TEST(StreamingGame, DebugKeysChangeConfigAndHud)
{
    streaming::StreamingSettings settings = small_world();
    Bastion::ObserverRoute route(WorldVec3(50.0, 0.0, 50.0));

    GameRuntime::Runtime runtime(fixed_settings(6));
    runtime.schedule_key_tap(1, Key::F9);
    runtime.schedule_key_tap(2, Key::F10);
    runtime.schedule_key_tap(3, Key::F3);

    Bastion::StreamingGame game(settings, route);
    runtime.run(&game);

    EXPECT_EQ(game.config().active_radius, 2);
    EXPECT_EQ(game.config().hysteresis, 0);
    EXPECT_FALSE(game.controls().hud_enabled());
    // HUD printed on frames 0..2, then switched off.
    EXPECT_EQ(game.hud_prints(), 3u);
}

TEST(StreamingGame, ChunksBeyondWorldExtentAreNotSpawned)
{
    streaming::StreamingSettings settings = small_world();
    settings.world_extent_chunks = 0;
    Bastion::ObserverRoute route(WorldVec3(50.0, 0.0, 50.0));

    GameRuntime::Runtime runtime(fixed_settings(2));
    Bastion::StreamingGame game(settings, route);
    runtime.run(&game);

    EXPECT_EQ(game.spawner().spawned(), 1u);
    EXPECT_EQ(game.manager().registry().stats().load_failures, 8u);
}

TEST(TimeManager, FixedFrameTimeAdvancesDeterministically)
{
    GameRuntime::TimeManager time;
    time.set_fixed_delta_time(0.05f);
    time.set_fixed_frame_time(0.1f);
    ASSERT_EQ(time.step_mode(), GameRuntime::TimeManager::StepMode::Fixed);

    time.begin_frame();
    EXPECT_FLOAT_EQ(time.delta_time(), 0.1f);

    int steps = 0;
    while (time.consume_fixed_step())
    {
        steps++;
    }
    EXPECT_EQ(steps, 2);
    EXPECT_EQ(time.frame_count(), 1u);
    EXPECT_EQ(time.fixed_step_count(), 2u);
}

TEST(TimeManager, FrameTimeIsClampedAndStepIsBounded)
{
    GameRuntime::TimeManager time;
    time.set_fixed_frame_time(5.0f);
    time.begin_frame();
    EXPECT_FLOAT_EQ(time.delta_time(), GameRuntime::TimeManager::k_max_delta_time);

    time.set_fixed_delta_time(1.0f);
    EXPECT_FLOAT_EQ(time.fixed_delta_time(), 0.1f);

    time.set_fixed_frame_time(0.0f);
    EXPECT_EQ(time.step_mode(), GameRuntime::TimeManager::StepMode::WallClock);
}
