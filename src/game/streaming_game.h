#pragma once

#include "runtime/i_game_callbacks.h"
#include "chunk_content_spawner.h"
#include "entity_manager.h"
#include "observer_route.h"

#include <world/streaming/streaming_debug_controls.h>
#include <world/streaming/streaming_manager.h>
#include <world/streaming/streaming_settings_loader.h>

#include <cstdint>

namespace Bastion
{

// ============================================================================
// StreamingGame: moves a player along a route and streams chunks around it
// ============================================================================

class StreamingGame : public GameRuntime::IGameCallbacks
{
public:
    StreamingGame(const streaming::StreamingSettings& settings, ObserverRoute route);
    ~StreamingGame() override = default;

    // IGameCallbacks
    void on_init(GameRuntime::Runtime& runtime) override;
    void on_update(float dt) override;
    void on_fixed_update(float fixed_dt) override;
    void on_shutdown() override;

    // ------------------------------------------------------------------------
    // Inspection
    // ------------------------------------------------------------------------

    const EntityManager& entities() const { return _entities; }
    const ChunkContentSpawner& spawner() const { return _spawner; }
    const streaming::StreamingManager& manager() const { return _manager; }
    const streaming::StreamingConfig& config() const { return _config; }
    const streaming::StreamingDebugControls& controls() const { return _controls; }
    const ObserverRoute& route() const { return _route; }

    EntityId player() const { return _player; }
    WorldVec3 player_position() const;

    uint32_t visible_ground_chunks() const { return _visible_ground; }
    uint64_t hud_prints() const { return _hud_prints; }

private:
    void update_culling(const WorldVec3& observer);
    void print_hud() const;

    GameRuntime::Runtime* _runtime{nullptr};

    streaming::StreamingSettings _settings;
    streaming::StreamingConfig _config;
    streaming::StreamingDebugControls _controls;

    // Declaration order matters: the spawner writes into _entities and must
    // outlive the manager, which releases its chunks on destruction.
    EntityManager _entities;
    ChunkContentSpawner _spawner;
    streaming::StreamingManager _manager;

    ObserverRoute _route;
    EntityId _player;

    // Distance culling runs every kCullInterval seconds or after a move of kCullMoveThreshold.
    static constexpr double kCullInterval = 0.1;
    static constexpr double kCullMoveThreshold = 1.0;
    double _cull_timer{0.0};
    WorldVec3 _last_cull_position{0.0};
    bool _cull_primed{false};
    uint32_t _visible_ground{0};

    uint64_t _frames{0};
    mutable uint64_t _hud_prints{0};
};

} // namespace Bastion
