#include "streaming_game.h"
#include "runtime/game_runtime.h"

#include <world/streaming/streaming_hud.h>

#include "core/util/logger.h"

#include <string>
#include <utility>
#include <vector>

namespace Bastion
{
    StreamingGame::StreamingGame(const streaming::StreamingSettings &settings, ObserverRoute route)
        : _settings(settings)
        , _config(settings.config)
        , _spawner(_entities, settings.world_extent_chunks)
        , _manager(streaming::ChunkGrid(settings.chunk_size_m), &_spawner)
        , _route(std::move(route))
    {
        _controls.set_hud_enabled(settings.hud_enabled);
    }

    void StreamingGame::on_init(GameRuntime::Runtime &runtime)
    {
        _runtime = &runtime;

        Entity &player = _entities.create_entity(EntityKind::Player, "Player");
        player.set_position_world(_route.position());
        _player = player.id();

        Logger::info("[Game] Streaming around '{}' from ({:.1f}, {:.1f}), chunk size {:.1f} m, radius {} (+{}).",
                     player.name(), _route.position().x, _route.position().z, _manager.grid().chunk_size(),
                     _config.active_radius, _config.hysteresis);
    }

    void StreamingGame::on_fixed_update(float fixed_dt)
    {
        const WorldVec3 &pos = _route.step(static_cast<double>(fixed_dt));
        if (Entity *player = _entities.find(_player))
        {
            player->set_position_world(pos);
        }
    }

    void StreamingGame::on_update(float dt)
    {
        if (_runtime)
        {
            _controls.apply(_runtime->input().state(), _config);
        }

        const WorldVec3 observer = player_position();
        _manager.update(observer, _config);

        _cull_timer += static_cast<double>(dt);
        update_culling(observer);

        if (_controls.hud_enabled() && _settings.hud_interval_frames > 0 &&
            _frames % _settings.hud_interval_frames == 0)
        {
            print_hud();
        }
        _frames++;
    }

    void StreamingGame::on_shutdown()
    {
        const auto before = _manager.registry().counts();
        _manager.shutdown();

        const auto &totals = _manager.registry().stats();
        Logger::info("[Game] Released {} chunks. Totals: {} loads, {} unloads, {} load failures, {} unload failures.",
                     before.total(), totals.loads, totals.unloads, totals.load_failures, totals.unload_failures);
    }

    WorldVec3 StreamingGame::player_position() const
    {
        if (const Entity *player = _entities.find(_player))
        {
            return player->position_world();
        }
        return _route.position();
    }

    void StreamingGame::update_culling(const WorldVec3 &observer)
    {
        const bool moved = !_cull_primed || planar_distance(observer, _last_cull_position) > kCullMoveThreshold;
        if (!moved && _cull_timer < kCullInterval)
        {
            return;
        }
        _cull_timer = 0.0;
        _cull_primed = true;
        _last_cull_position = observer;

        // Slightly beyond the unload ring so nothing resident pops in and out at its edge.
        const double ring = static_cast<double>(_config.active_radius) + static_cast<double>(_config.hysteresis) + 1.0;
        const double max_distance = _manager.grid().chunk_size() * ring * 1.5;

        _visible_ground = static_cast<uint32_t>(
            _entities.cull_by_distance(EntityKind::ChunkGround, observer, max_distance));
    }

    void StreamingGame::print_hud() const
    {
        const std::vector<std::string> lines = streaming::format_hud_lines(_manager.diagnostics(_config));
        for (const std::string &line : lines)
        {
            Logger::info("[HUD] {}", line);
        }
        _hud_prints++;
    }
} // namespace Bastion
