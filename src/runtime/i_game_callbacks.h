#pragma once

// IGameCallbacks: what the headless Runtime drives each frame.
// Frame order: input is pumped, on_fixed_update runs for each whole fixed step,
// then on_update runs once.

namespace GameRuntime
{

class Runtime;

class IGameCallbacks
{
public:
    virtual ~IGameCallbacks() = default;

    // Before the first frame. The runtime outlives the callbacks' use of it.
    virtual void on_init(Runtime& runtime) = 0;

    // Once per frame. dt is the frame delta in seconds (at most 0.1).
    virtual void on_update(float dt) = 0;

    // Zero or more times per frame; fixed_dt is the simulation step.
    virtual void on_fixed_update(float fixed_dt) = 0;

    // After the last frame, before run() returns.
    virtual void on_shutdown() = 0;
};

} // namespace GameRuntime
