#include "chunk_grid.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace streaming
{
    namespace
    {
        int32_t floor_to_cell(double value, double size)
        {
            const double q = std::floor(value / size);
            if (std::isnan(q))
            {
                return 0;
            }

            constexpr double lo = static_cast<double>(std::numeric_limits<int32_t>::min());
            constexpr double hi = static_cast<double>(std::numeric_limits<int32_t>::max());
            return static_cast<int32_t>(std::clamp(q, lo, hi));
        }
    } // namespace

    ChunkGrid::ChunkGrid(double chunk_size_m)
    {
        if (std::isfinite(chunk_size_m) && chunk_size_m > 0.0)
        {
            _chunk_size = chunk_size_m;
        }
    }

    ChunkCoord ChunkGrid::world_to_chunk(const WorldVec3 &position) const
    {
        return ChunkCoord{floor_to_cell(position.x, _chunk_size),
                          floor_to_cell(position.z, _chunk_size)};
    }

    WorldVec3 ChunkGrid::chunk_origin(const ChunkCoord &coord) const
    {
        return WorldVec3(static_cast<double>(coord.x) * _chunk_size,
                         0.0,
                         static_cast<double>(coord.z) * _chunk_size);
    }

    WorldVec3 ChunkGrid::chunk_to_world_center(const ChunkCoord &coord) const
    {
        const double half = _chunk_size * 0.5;
        return chunk_origin(coord) + WorldVec3(half, 0.0, half);
    }

    int64_t ChunkGrid::chebyshev_distance(const ChunkCoord &a, const ChunkCoord &b)
    {
        const int64_t dx = static_cast<int64_t>(a.x) - static_cast<int64_t>(b.x);
        const int64_t dz = static_cast<int64_t>(a.z) - static_cast<int64_t>(b.z);
        return std::max(dx < 0 ? -dx : dx, dz < 0 ? -dz : dz);
    }
} // namespace streaming
