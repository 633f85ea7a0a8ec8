#pragma once

// TimeManager: frame clock for the headless loop.
// Produces one delta per frame, either from the wall clock or a constant step,
// and meters fixed simulation steps out of an accumulator.

#include <chrono>
#include <cstdint>

namespace GameRuntime
{

class TimeManager
{
public:
    enum class StepMode : uint8_t
    {
        WallClock, // delta measured with steady_clock
        Fixed,     // every frame advances by the same step
    };

    TimeManager();

    // Advance to the next frame. Call once at the start of each frame.
    void begin_frame();

    // Seconds covered by the current frame (0 .. k_max_delta_time).
    float delta_time() const { return _delta_time; }

    // Simulation step handed to on_fixed_update (default 1/60, kept within 1/240 .. 1/10).
    float fixed_delta_time() const { return _fixed_delta_time; }
    void set_fixed_delta_time(float dt);

    // A positive dt switches to StepMode::Fixed; 0 returns to the wall clock.
    // Scripted runs use a fixed step so the same script yields the same frames.
    void set_fixed_frame_time(float dt);
    float fixed_frame_time() const { return _fixed_frame_time; }
    StepMode step_mode() const { return _fixed_frame_time > 0.0f ? StepMode::Fixed : StepMode::WallClock; }

    // Pops one fixed step from the accumulator if enough time has built up.
    bool consume_fixed_step();

    // Simulated seconds since construction.
    double total_time() const { return _total_time; }

    uint64_t frame_count() const { return _frame_count; }
    uint64_t fixed_step_count() const { return _fixed_step_count; }

    static constexpr float k_max_delta_time = 0.1f;

private:
    using Clock = std::chrono::steady_clock;

    Clock::time_point _last_time;

    float _delta_time{0.0f};
    float _fixed_delta_time{1.0f / 60.0f};
    float _fixed_frame_time{0.0f};
    float _accumulator{0.0f};
    double _total_time{0.0};

    uint64_t _frame_count{0};
    uint64_t _fixed_step_count{0};
};

} // namespace GameRuntime
