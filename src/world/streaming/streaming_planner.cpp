#include "streaming_planner.h"
#include "chunk_grid.h"
#include "chunk_registry.h"

#include <algorithm>
#include <limits>

namespace streaming
{
    namespace
    {
        // Cells outside the int32 range do not exist; skip rather than wrap.
        bool offset_coord(const ChunkCoord &center, int64_t dx, int64_t dz, ChunkCoord &out)
        {
            const int64_t x = static_cast<int64_t>(center.x) + dx;
            const int64_t z = static_cast<int64_t>(center.z) + dz;
            constexpr int64_t lo = std::numeric_limits<int32_t>::min();
            constexpr int64_t hi = std::numeric_limits<int32_t>::max();
            if (x < lo || x > hi || z < lo || z > hi)
            {
                return false;
            }
            out = ChunkCoord{static_cast<int32_t>(x), static_cast<int32_t>(z)};
            return true;
        }

        struct LoadCandidate
        {
            int64_t distance = 0;
            ChunkCoord coord{};
        };
    } // namespace

    StreamingPlan StreamingPlanner::plan(const ChunkCoord &observer,
                                         const ChunkRegistry &registry,
                                         const StreamingConfig &config)
    {
        StreamingPlan out{};

        // Callers normally pass a normalized config; the hard ceiling keeps the square bounded regardless.
        const int64_t active = std::clamp<int64_t>(config.active_radius, 0, StreamingLimits::kActiveRadiusCeiling);
        const int64_t keep = config.keep_radius();

        // Load candidates: the (2r+1)^2 square around the observer.
        std::vector<LoadCandidate> candidates;
        const uint64_t side = static_cast<uint64_t>(2 * active + 1);
        candidates.reserve(static_cast<size_t>(side * side));

        for (int64_t dz = -active; dz <= active; ++dz)
        {
            for (int64_t dx = -active; dx <= active; ++dx)
            {
                ChunkCoord c{};
                if (!offset_coord(observer, dx, dz, c))
                {
                    continue;
                }
                if (registry.contains(c))
                {
                    continue;
                }
                candidates.push_back(LoadCandidate{std::max(dx < 0 ? -dx : dx, dz < 0 ? -dz : dz), c});
            }
        }

        std::sort(candidates.begin(), candidates.end(),
                  [](const LoadCandidate &a, const LoadCandidate &b)
                  {
                      if (a.distance != b.distance) return a.distance < b.distance;
                      return a.coord < b.coord;
                  });

        out.to_load.reserve(candidates.size());
        for (const LoadCandidate &c : candidates)
        {
            out.to_load.push_back(c.coord);
        }

        // Unload / cancel candidates come from what the registry already holds.
        registry.for_each([&](const ResidentChunk &chunk)
        {
            const int64_t d = ChunkGrid::chebyshev_distance(chunk.coord, observer);
            switch (chunk.state)
            {
                case ChunkState::Resident:
                    if (d > keep) out.to_unload.push_back(chunk.coord);
                    break;
                case ChunkState::PendingUnload:
                    if (d > keep) out.to_unload.push_back(chunk.coord);
                    else out.to_cancel.push_back(chunk.coord);
                    break;
                case ChunkState::Pending:
                case ChunkState::Unloaded:
                    break;
            }
        });

        std::sort(out.to_unload.begin(), out.to_unload.end());
        std::sort(out.to_cancel.begin(), out.to_cancel.end());
        return out;
    }
} // namespace streaming
