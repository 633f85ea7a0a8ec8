#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace streaming
{
    // Integer cell on the infinite XZ chunk grid.
    struct ChunkCoord
    {
        int32_t x = 0;
        int32_t z = 0;

        friend bool operator==(const ChunkCoord &, const ChunkCoord &) = default;

        // Lexicographic (x, z); used wherever a deterministic order is needed.
        friend bool operator<(const ChunkCoord &a, const ChunkCoord &b)
        {
            if (a.x != b.x) return a.x < b.x;
            return a.z < b.z;
        }
    };

    struct ChunkCoordHash
    {
        size_t operator()(const ChunkCoord &c) const noexcept
        {
            // Pack both axes into one 64-bit word: [x:32 | z:32]
            const uint64_t x = static_cast<uint64_t>(static_cast<uint32_t>(c.x));
            const uint64_t z = static_cast<uint64_t>(static_cast<uint32_t>(c.z));
            return std::hash<uint64_t>{}((x << 32) | z);
        }
    };
} // namespace streaming
