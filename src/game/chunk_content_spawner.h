#pragma once

#include "entity_manager.h"

#include <world/streaming/chunk_content.h>

#include <cstdint>
#include <string>

namespace Bastion
{
    // Backs each streamed chunk with a ChunkRoot entity (at the chunk origin)
    // and a ChunkGround child covering the cell. The content handle is the
    // root entity id. Cells beyond the world extent have no data and fail to load.
    class ChunkContentSpawner : public streaming::IChunkContentProvider
    {
    public:
        ChunkContentSpawner(EntityManager &entities, int32_t world_extent_chunks);

        streaming::ChunkLoadResult load(const streaming::ChunkCoord &coord,
                                        const streaming::ChunkGrid &grid) override;

        streaming::ChunkUnloadResult unload(const streaming::ChunkCoord &coord,
                                            streaming::ChunkContentHandle handle) override;

        int32_t world_extent_chunks() const { return _world_extent_chunks; }
        bool has_region_data(const streaming::ChunkCoord &coord) const;

        static std::string chunk_root_name(const streaming::ChunkCoord &coord);

        uint64_t spawned() const { return _spawned; }
        uint64_t despawned() const { return _despawned; }

    private:
        EntityManager &_entities;
        int32_t _world_extent_chunks = 0;
        uint64_t _spawned = 0;
        uint64_t _despawned = 0;
    };
} // namespace Bastion
