#pragma once

#include "chunk_grid.h"
#include "chunk_registry.h"
#include "streaming_config.h"
#include "streaming_planner.h"

#include <core/world.h>

#include <cstdint>

namespace streaming
{
    struct FrameReport
    {
        uint64_t frame = 0;
        ChunkCoord observer{};

        uint32_t planned_loads = 0;
        uint32_t planned_unloads = 0;

        uint32_t loads_committed = 0;   // attempts admitted by the budget
        uint32_t loads_succeeded = 0;
        uint32_t load_failures = 0;
        uint32_t loads_deferred = 0;    // over budget
        uint32_t loads_backing_off = 0; // held back by a recent failure

        uint32_t unloads_committed = 0;
        uint32_t unloads_succeeded = 0;
        uint32_t unload_failures = 0;
        uint32_t unloads_deferred = 0;
        uint32_t unloads_backing_off = 0;

        uint32_t cancelled_unloads = 0;
    };

    // Read-only snapshot for the HUD.
    struct StreamingDiagnostics
    {
        ChunkCoord observer{};
        ChunkRegistry::Counts counts{};
        ChunkRegistry::Stats totals{};
        StreamingConfig config{};
        int64_t keep_radius = 0;
        double chunk_size_m = 0.0;
        FrameReport last_frame{};
    };

    // Per-frame driver: observer -> grid -> planner -> budget -> registry.
    class StreamingManager
    {
    public:
        StreamingManager(const ChunkGrid &grid, IChunkContentProvider *provider);

        StreamingManager(const StreamingManager &) = delete;
        StreamingManager &operator=(const StreamingManager &) = delete;

        // One planning + commit pass. The config is read fresh every call.
        FrameReport update(const WorldVec3 &observer_world, const StreamingConfig &config);

        // Unloads every chunk. Further updates start from an empty registry.
        void shutdown();

        StreamingDiagnostics diagnostics(const StreamingConfig &config) const;

        const ChunkGrid &grid() const { return _grid; }
        const ChunkRegistry &registry() const { return _registry; }
        const FrameReport &last_report() const { return _last_report; }
        ChunkCoord observer_chunk() const { return _observer_chunk; }
        uint64_t frame_index() const { return _frame; }

    private:
        ChunkGrid _grid;
        ChunkRegistry _registry;

        ChunkCoord _observer_chunk{};
        FrameReport _last_report{};
        ConfigViolations _last_violations{};
        uint64_t _frame = 0;
    };
} // namespace streaming
