#pragma once

// GameRuntime: headless game loop manager
// Owns time and input, drives IGameCallbacks with a variable update per frame
// and a fixed-step simulation update. A windowed host would feed InputSystem
// from its platform events; headless runs schedule key taps up front.

#include "i_game_callbacks.h"
#include "time_manager.h"

#include <core/input/input_state.h>

#include <cstdint>
#include <map>
#include <vector>

namespace GameRuntime
{

struct RuntimeSettings
{
    // Stop after this many frames (0 = run until quit is requested).
    uint64_t max_frames{0};

    // Constant per-frame dt; 0 uses the wall clock.
    float fixed_frame_time{0.0f};

    // Fixed simulation step (default 1/60).
    float fixed_delta_time{1.0f / 60.0f};

    // Sleep at the end of each frame (wall-clock pacing; 0 = run flat out).
    uint32_t frame_sleep_ms{0};
};

class Runtime
{
public:
    Runtime();
    explicit Runtime(const RuntimeSettings& settings);
    ~Runtime();

    // Non-copyable
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // ------------------------------------------------------------------------
    // Time Management
    // ------------------------------------------------------------------------

    TimeManager& time() { return _time; }
    const TimeManager& time() const { return _time; }

    float delta_time() const { return _time.delta_time(); }
    float fixed_delta_time() const { return _time.fixed_delta_time(); }

    // Index of the frame being processed (0-based).
    uint64_t frame_index() const { return _frame_index; }

    // ------------------------------------------------------------------------
    // Input
    // ------------------------------------------------------------------------

    InputSystem& input() { return _input; }
    const InputSystem& input() const { return _input; }

    // Deliver a key press+release at the start of the given frame.
    void schedule_key_tap(uint64_t frame, Key key);

    // ------------------------------------------------------------------------
    // Main Loop
    // ------------------------------------------------------------------------

    // Run the game loop with the given callback handler.
    // Blocks until the game exits. Returns the number of frames run.
    uint64_t run(IGameCallbacks* game);

    // Request quit (sets quit flag, loop will exit next frame)
    void request_quit() { _quit_requested = true; }

    bool quit_requested() const { return _quit_requested; }

private:
    void deliver_scheduled_input();

    RuntimeSettings _settings{};
    TimeManager _time;
    InputSystem _input;

    std::map<uint64_t, std::vector<Key>> _scheduled_taps;
    uint64_t _frame_index{0};
    bool _quit_requested{false};
};

} // namespace GameRuntime
