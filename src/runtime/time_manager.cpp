#include "time_manager.h"

#include <algorithm>

namespace GameRuntime
{
    TimeManager::TimeManager()
        : _last_time(Clock::now())
    {
    }

    void TimeManager::begin_frame()
    {
        float elapsed = _fixed_frame_time;
        if (step_mode() == StepMode::WallClock)
        {
            const Clock::time_point now = Clock::now();
            elapsed = std::chrono::duration<float>(now - _last_time).count();
            _last_time = now;
        }

        // A stalled frame (debugger, slow disk) must not turn into a burst of fixed steps.
        _delta_time = std::clamp(elapsed, 0.0f, k_max_delta_time);
        _accumulator += _delta_time;
        _total_time += static_cast<double>(_delta_time);
        ++_frame_count;
    }

    void TimeManager::set_fixed_delta_time(float dt)
    {
        _fixed_delta_time = std::clamp(dt, 1.0f / 240.0f, 1.0f / 10.0f);
    }

    void TimeManager::set_fixed_frame_time(float dt)
    {
        _fixed_frame_time = std::max(0.0f, dt);
        _last_time = Clock::now();
    }

    bool TimeManager::consume_fixed_step()
    {
        if (_accumulator < _fixed_delta_time)
        {
            return false;
        }
        _accumulator -= _fixed_delta_time;
        ++_fixed_step_count;
        return true;
    }
} // namespace GameRuntime
