#include "entity.h"

#include <algorithm>

namespace Bastion
{
    const char *entity_kind_name(EntityKind kind)
    {
        switch (kind)
        {
            case EntityKind::Generic: return "generic";
            case EntityKind::Player: return "player";
            case EntityKind::ChunkRoot: return "chunk_root";
            case EntityKind::ChunkGround: return "chunk_ground";
        }
        return "?";
    }

    Entity::Entity(EntityId id, EntityKind kind, const std::string &name)
        : _id(id)
        , _kind(kind)
        , _name(name)
    {
    }

    void Entity::add_child(EntityId child)
    {
        if (std::find(_children.begin(), _children.end(), child) == _children.end())
        {
            _children.push_back(child);
        }
    }

    void Entity::remove_child(EntityId child)
    {
        _children.erase(std::remove(_children.begin(), _children.end(), child), _children.end());
    }
} // namespace Bastion
