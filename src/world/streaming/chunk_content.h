#pragma once

// IChunkContentProvider: boundary between the streaming core and whatever
// instantiates chunk content (entities, meshes, colliders).
// Both calls are synchronous; the registry is the only caller.

#include "chunk_coord.h"

#include <cstdint>
#include <string>
#include <utility>

namespace streaming
{
    class ChunkGrid;

    // Opaque token for the content created by a provider. 0 is invalid.
    struct ChunkContentHandle
    {
        uint64_t value{0};

        ChunkContentHandle() = default;

        explicit ChunkContentHandle(uint64_t v) : value(v)
        {
        }

        bool is_valid() const { return value != 0; }
        explicit operator bool() const { return is_valid(); }
        bool operator==(const ChunkContentHandle &other) const { return value == other.value; }
        bool operator!=(const ChunkContentHandle &other) const { return value != other.value; }
    };

    struct ChunkLoadResult
    {
        ChunkContentHandle handle{};
        std::string error;

        bool ok() const { return handle.is_valid() && error.empty(); }

        static ChunkLoadResult success(ChunkContentHandle h) { return ChunkLoadResult{h, {}}; }
        static ChunkLoadResult failure(std::string cause) { return ChunkLoadResult{{}, std::move(cause)}; }
    };

    struct ChunkUnloadResult
    {
        bool succeeded{false};
        std::string error;

        bool ok() const { return succeeded; }

        static ChunkUnloadResult success() { return ChunkUnloadResult{true, {}}; }
        static ChunkUnloadResult failure(std::string cause) { return ChunkUnloadResult{false, std::move(cause)}; }
    };

    class IChunkContentProvider
    {
    public:
        virtual ~IChunkContentProvider() = default;

        // Instantiate the content backing coord. A result without a valid handle is a load failure.
        virtual ChunkLoadResult load(const ChunkCoord &coord, const ChunkGrid &grid) = 0;

        // Tear down content previously returned by load() for the same coord.
        virtual ChunkUnloadResult unload(const ChunkCoord &coord, ChunkContentHandle handle) = 0;
    };
} // namespace streaming
