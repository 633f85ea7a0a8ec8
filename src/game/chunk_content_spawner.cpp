#include "chunk_content_spawner.h"

#include <world/streaming/chunk_grid.h>

#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>

namespace Bastion
{
    ChunkContentSpawner::ChunkContentSpawner(EntityManager &entities, int32_t world_extent_chunks)
        : _entities(entities)
        , _world_extent_chunks(std::max(world_extent_chunks, 0))
    {
    }

    bool ChunkContentSpawner::has_region_data(const streaming::ChunkCoord &coord) const
    {
        const int64_t ax = std::llabs(static_cast<int64_t>(coord.x));
        const int64_t az = std::llabs(static_cast<int64_t>(coord.z));
        return ax <= _world_extent_chunks && az <= _world_extent_chunks;
    }

    std::string ChunkContentSpawner::chunk_root_name(const streaming::ChunkCoord &coord)
    {
        return fmt::format("Chunk ({}, {})", coord.x, coord.z);
    }

    streaming::ChunkLoadResult ChunkContentSpawner::load(const streaming::ChunkCoord &coord,
                                                         const streaming::ChunkGrid &grid)
    {
        if (!has_region_data(coord))
        {
            return streaming::ChunkLoadResult::failure(
                fmt::format("no region data beyond world extent {}", _world_extent_chunks));
        }

        const std::string name = chunk_root_name(coord);
        if (_entities.exists(name))
        {
            return streaming::ChunkLoadResult::failure("chunk root already spawned");
        }

        Entity &root = _entities.create_entity(EntityKind::ChunkRoot, name);
        root.set_position_world(grid.chunk_origin(coord));
        const EntityId root_id = root.id();

        Entity &ground = _entities.create_entity(EntityKind::ChunkGround, "", root_id);
        ground.set_position_world(grid.chunk_to_world_center(coord));
        ground.set_extent_m(grid.chunk_size() * 0.5);

        _spawned++;
        return streaming::ChunkLoadResult::success(streaming::ChunkContentHandle{root_id.value});
    }

    streaming::ChunkUnloadResult ChunkContentSpawner::unload(const streaming::ChunkCoord &coord,
                                                             streaming::ChunkContentHandle handle)
    {
        const EntityId root_id{static_cast<uint32_t>(handle.value)};
        const Entity *root = _entities.find(root_id);
        if (!root)
        {
            return streaming::ChunkUnloadResult::failure(fmt::format("chunk root {} not found", handle.value));
        }
        if (root->kind() != EntityKind::ChunkRoot || root->name() != chunk_root_name(coord))
        {
            return streaming::ChunkUnloadResult::failure(
                fmt::format("entity {} is not the root of chunk ({}, {})", handle.value, coord.x, coord.z));
        }

        _entities.destroy_entity(root_id);
        _despawned++;
        return streaming::ChunkUnloadResult::success();
    }
} // namespace Bastion
