#pragma once

#include "chunk_coord.h"

#include <core/world.h>

#include <cstdint>

namespace streaming
{
    // Pure mapping between continuous world positions and chunk cells.
    class ChunkGrid
    {
    public:
        static constexpr double kDefaultChunkSize = 1024.0;

        ChunkGrid() = default;
        explicit ChunkGrid(double chunk_size_m);

        double chunk_size() const { return _chunk_size; }

        // Floor division on X and Z; Y is ignored. Saturates at the int32 range, NaN maps to 0.
        ChunkCoord world_to_chunk(const WorldVec3 &position) const;

        // Minimum corner of the cell (y = 0).
        WorldVec3 chunk_origin(const ChunkCoord &coord) const;

        // Center of the cell (y = 0).
        WorldVec3 chunk_to_world_center(const ChunkCoord &coord) const;

        // max(|dx|, |dz|): square rings around the center.
        static int64_t chebyshev_distance(const ChunkCoord &a, const ChunkCoord &b);

    private:
        double _chunk_size = kDefaultChunkSize;
    };
} // namespace streaming
