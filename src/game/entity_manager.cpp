#include "entity_manager.h"

#include <vector>

namespace Bastion
{

// ============================================================================
// Entity Creation / Destruction
// ============================================================================

Entity& EntityManager::create_entity(EntityKind kind, const std::string& name, EntityId parent)
{
    EntityId id{_next_id++};

    auto [it, inserted] = _entities.emplace(id.value, Entity(id, kind, name));
    Entity& entity = it->second;

    if (parent)
    {
        auto parent_it = _entities.find(parent.value);
        if (parent_it != _entities.end())
        {
            entity._parent = parent;
            parent_it->second.add_child(id);
        }
    }

    // Add to name index if named
    if (!name.empty())
    {
        _name_index[name] = id.value;
    }

    return entity;
}

size_t EntityManager::destroy_entity(EntityId id)
{
    auto it = _entities.find(id.value);
    if (it == _entities.end())
    {
        return 0;
    }

    // Detach from the parent first so it never points at a dead child.
    const EntityId parent = it->second.parent();
    if (parent)
    {
        if (Entity* p = find(parent))
        {
            p->remove_child(id);
        }
    }

    size_t removed = 0;
    destroy_subtree(id, removed);
    return removed;
}

void EntityManager::destroy_subtree(EntityId id, size_t& removed)
{
    auto it = _entities.find(id.value);
    if (it == _entities.end())
    {
        return;
    }

    // Copy: children are erased while walking.
    const std::vector<EntityId> children = it->second.children();
    for (EntityId child : children)
    {
        destroy_subtree(child, removed);
    }

    it = _entities.find(id.value);
    const std::string& name = it->second.name();
    if (!name.empty())
    {
        auto name_it = _name_index.find(name);
        if (name_it != _name_index.end() && name_it->second == id.value)
        {
            _name_index.erase(name_it);
        }
    }

    _entities.erase(it);
    removed++;
}

void EntityManager::clear()
{
    _entities.clear();
    _name_index.clear();
    // Don't reset _next_id to avoid ID reuse issues
}

// ============================================================================
// Entity Access
// ============================================================================

Entity* EntityManager::find(EntityId id)
{
    auto it = _entities.find(id.value);
    return (it != _entities.end()) ? &it->second : nullptr;
}

const Entity* EntityManager::find(EntityId id) const
{
    auto it = _entities.find(id.value);
    return (it != _entities.end()) ? &it->second : nullptr;
}

Entity* EntityManager::find(const std::string& name)
{
    auto it = _name_index.find(name);
    if (it == _name_index.end())
    {
        return nullptr;
    }
    return find(EntityId{it->second});
}

const Entity* EntityManager::find(const std::string& name) const
{
    auto it = _name_index.find(name);
    if (it == _name_index.end())
    {
        return nullptr;
    }
    return find(EntityId{it->second});
}

bool EntityManager::exists(EntityId id) const
{
    return _entities.find(id.value) != _entities.end();
}

bool EntityManager::exists(const std::string& name) const
{
    return _name_index.find(name) != _name_index.end();
}

size_t EntityManager::count(EntityKind kind) const
{
    size_t n = 0;
    for (const auto& [id, entity] : _entities)
    {
        if (entity.kind() == kind)
        {
            n++;
        }
    }
    return n;
}

// ============================================================================
// Visibility
// ============================================================================

size_t EntityManager::cull_by_distance(EntityKind kind, const WorldVec3& center, double max_distance_m)
{
    size_t visible = 0;
    for (auto& [id, entity] : _entities)
    {
        if (entity.kind() != kind)
        {
            continue;
        }

        const bool show = planar_distance(entity.position_world(), center) <= max_distance_m;
        entity.set_visible(show);
        if (show)
        {
            visible++;
        }
    }
    return visible;
}

} // namespace Bastion
