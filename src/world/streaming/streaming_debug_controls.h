#pragma once

#include "streaming_config.h"

#include <core/input/input_state.h>

#include <array>

namespace streaming
{
    // Live tuning keys for the chunk streamer:
    //   F8/F9   active radius -/+
    //   F10/F11 hysteresis -/+
    //   F6/F7   load cap -/+
    //   F4/F5   unload cap -/+
    //   F3      HUD on/off
    class StreamingDebugControls
    {
    public:
        struct Binding
        {
            Key decrease = Key::Unknown;
            Key increase = Key::Unknown;
            StreamingParam param = StreamingParam::ActiveRadius;
        };

        StreamingDebugControls();

        // Applies this frame's key presses to config. Returns true if any value changed.
        bool apply(const InputState &input, StreamingConfig &config);

        bool hud_enabled() const { return _hud_enabled; }
        void set_hud_enabled(bool enabled) { _hud_enabled = enabled; }

        Key hud_toggle_key() const { return _hud_toggle; }
        const std::array<Binding, 4> &bindings() const { return _bindings; }

    private:
        std::array<Binding, 4> _bindings{};
        Key _hud_toggle = Key::F3;
        bool _hud_enabled = true;
    };
} // namespace streaming
