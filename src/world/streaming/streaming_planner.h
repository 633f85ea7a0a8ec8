#pragma once

#include "chunk_coord.h"
#include "streaming_config.h"

#include <vector>

namespace streaming
{
    class ChunkRegistry;

    struct StreamingPlan
    {
        // Within active_radius and absent from the registry; nearest first, ties by (x, z).
        std::vector<ChunkCoord> to_load;
        // Resident or PendingUnload beyond keep_radius; sorted by (x, z).
        std::vector<ChunkCoord> to_unload;
        // PendingUnload back inside keep_radius; sorted by (x, z).
        std::vector<ChunkCoord> to_cancel;
    };

    // Policy only: computes what should change, commits nothing.
    // The output is a pure function of (observer, registry contents, config).
    class StreamingPlanner
    {
    public:
        static StreamingPlan plan(const ChunkCoord &observer,
                                  const ChunkRegistry &registry,
                                  const StreamingConfig &config);
    };
} // namespace streaming
