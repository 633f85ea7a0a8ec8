#pragma once

#include <core/world.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Bastion
{
    // ============================================================================
    // EntityId: Strongly-typed entity identifier
    // ============================================================================

    struct EntityId
    {
        uint32_t value{0};

        EntityId() = default;

        explicit EntityId(uint32_t v) : value(v)
        {
        }

        bool is_valid() const { return value != 0; }
        explicit operator bool() const { return is_valid(); }
        bool operator==(const EntityId &other) const { return value == other.value; }
        bool operator!=(const EntityId &other) const { return value != other.value; }
    };

    enum class EntityKind : uint8_t
    {
        Generic = 0,
        Player,
        ChunkRoot,
        ChunkGround,
    };

    const char *entity_kind_name(EntityKind kind);

    // ============================================================================
    // Entity: named object with a world-space position and an optional parent
    // ============================================================================

    class Entity
    {
    public:
        Entity() = default;

        Entity(EntityId id, EntityKind kind, const std::string &name = "");

        // ------------------------------------------------------------------------
        // Identity
        // ------------------------------------------------------------------------

        EntityId id() const { return _id; }
        EntityKind kind() const { return _kind; }
        const std::string &name() const { return _name; }
        void set_name(const std::string &name) { _name = name; }

        // ------------------------------------------------------------------------
        // Transform (authoritative, world-space position)
        // ------------------------------------------------------------------------

        const WorldVec3 &position_world() const { return _position_world; }
        void set_position_world(const WorldVec3 &pos) { _position_world = pos; }

        // Half-size on the ground plane; 0 for point-like entities.
        double extent_m() const { return _extent_m; }
        void set_extent_m(double extent) { _extent_m = extent; }

        // ------------------------------------------------------------------------
        // Hierarchy (maintained by EntityManager)
        // ------------------------------------------------------------------------

        EntityId parent() const { return _parent; }
        const std::vector<EntityId> &children() const { return _children; }

        // ------------------------------------------------------------------------
        // Flags
        // ------------------------------------------------------------------------

        bool is_active() const { return _active; }
        void set_active(bool active) { _active = active; }

        bool is_visible() const { return _visible; }
        void set_visible(bool visible) { _visible = visible; }

    private:
        friend class EntityManager;

        void add_child(EntityId child);
        void remove_child(EntityId child);

        EntityId _id;
        EntityKind _kind{EntityKind::Generic};
        std::string _name;

        WorldVec3 _position_world{0.0, 0.0, 0.0};
        double _extent_m{0.0};

        EntityId _parent;
        std::vector<EntityId> _children;

        bool _active{true};
        bool _visible{true};
    };
} // namespace Bastion
