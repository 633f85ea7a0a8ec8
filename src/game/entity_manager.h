#pragma once

#include "entity.h"
#include "core/world.h"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace Bastion
{

// ============================================================================
// EntityManager: Central store for game entities
// ============================================================================

class EntityManager
{
public:
    EntityManager() = default;
    ~EntityManager() = default;

    // Non-copyable
    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;

    // ------------------------------------------------------------------------
    // Entity Creation / Destruction
    // ------------------------------------------------------------------------

    // Create a new entity with auto-generated ID. A valid parent must exist,
    // otherwise the entity is created as a root.
    Entity& create_entity(EntityKind kind, const std::string& name = "", EntityId parent = EntityId{});

    // Destroy an entity and all of its descendants.
    // Returns the number of entities removed (0 if id is unknown).
    size_t destroy_entity(EntityId id);

    // Destroy all entities
    void clear();

    // ------------------------------------------------------------------------
    // Entity Access
    // ------------------------------------------------------------------------

    // Find entity by ID (returns nullptr if not found)
    Entity* find(EntityId id);
    const Entity* find(EntityId id) const;

    // Find entity by name (returns nullptr if not found)
    Entity* find(const std::string& name);
    const Entity* find(const std::string& name) const;

    bool exists(EntityId id) const;
    bool exists(const std::string& name) const;

    size_t count() const { return _entities.size(); }
    size_t count(EntityKind kind) const;

    // Iterate all entities
    template <typename Func>
    void for_each(Func&& func);

    template <typename Func>
    void for_each(Func&& func) const;

    // ------------------------------------------------------------------------
    // Visibility
    // ------------------------------------------------------------------------

    // Hides entities of the given kind farther than max_distance_m (XZ) from
    // center. Returns the number of visible entities of that kind afterwards.
    size_t cull_by_distance(EntityKind kind, const WorldVec3& center, double max_distance_m);

private:
    void destroy_subtree(EntityId id, size_t& removed);

    uint32_t _next_id{1};
    std::unordered_map<uint32_t, Entity> _entities;          // ID -> Entity
    std::unordered_map<std::string, uint32_t> _name_index;   // Name -> ID (for fast lookup)
};

// ============================================================================
// Template implementations
// ============================================================================

template <typename Func>
void EntityManager::for_each(Func&& func)
{
    for (auto& [id, entity] : _entities)
    {
        func(entity);
    }
}

template <typename Func>
void EntityManager::for_each(Func&& func) const
{
    for (const auto& [id, entity] : _entities)
    {
        func(entity);
    }
}

} // namespace Bastion
