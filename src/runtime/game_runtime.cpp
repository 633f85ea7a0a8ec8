#include "game_runtime.h"

#include "core/util/logger.h"

#include <chrono>
#include <thread>

namespace GameRuntime
{
    Runtime::Runtime()
        : Runtime(RuntimeSettings{})
    {
    }

    Runtime::Runtime(const RuntimeSettings &settings)
        : _settings(settings)
    {
        _time.set_fixed_delta_time(settings.fixed_delta_time);
        _time.set_fixed_frame_time(settings.fixed_frame_time);
    }

    Runtime::~Runtime() = default;

    void Runtime::schedule_key_tap(uint64_t frame, Key key)
    {
        _scheduled_taps[frame].push_back(key);
    }

    void Runtime::deliver_scheduled_input()
    {
        auto it = _scheduled_taps.find(_frame_index);
        if (it == _scheduled_taps.end())
        {
            return;
        }

        for (Key key : it->second)
        {
            _input.submit_key_tap(key);
        }
        _scheduled_taps.erase(it);
    }

    uint64_t Runtime::run(IGameCallbacks *game)
    {
        if (!game)
        {
            Logger::error("[Runtime] run() called without game callbacks.");
            return 0;
        }

        _quit_requested = false;
        _frame_index = 0;

        game->on_init(*this);

        while (!_quit_requested)
        {
            // --- Begin frame: time, input --- //
            _time.begin_frame();

            _input.begin_frame();
            deliver_scheduled_input();
            _input.pump_events();

            if (_input.quit_requested())
            {
                _quit_requested = true;
            }

            // --- Fixed update loop --- //
            while (_time.consume_fixed_step())
            {
                game->on_fixed_update(_time.fixed_delta_time());
            }

            // --- Variable update --- //
            game->on_update(_time.delta_time());

            ++_frame_index;
            if (_settings.max_frames != 0 && _frame_index >= _settings.max_frames)
            {
                _quit_requested = true;
            }

            if (_settings.frame_sleep_ms > 0)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(_settings.frame_sleep_ms));
            }
        }

        // Call game shutdown
        game->on_shutdown();
        Logger::info("[Runtime] Stopped after {} frames ({:.2f} s simulated).", _frame_index, _time.total_time());
        return _frame_index;
    }
} // namespace GameRuntime
