#include "streaming_debug_controls.h"

#include "core/util/logger.h"

namespace streaming
{
    StreamingDebugControls::StreamingDebugControls()
        : _bindings{{
              {Key::F8, Key::F9, StreamingParam::ActiveRadius},
              {Key::F10, Key::F11, StreamingParam::Hysteresis},
              {Key::F6, Key::F7, StreamingParam::LoadCap},
              {Key::F4, Key::F5, StreamingParam::UnloadCap},
          }}
    {
    }

    bool StreamingDebugControls::apply(const InputState &input, StreamingConfig &config)
    {
        if (input.key_pressed(_hud_toggle))
        {
            _hud_enabled = !_hud_enabled;
            Logger::info("[Streaming] HUD {}", _hud_enabled ? "on" : "off");
        }

        bool changed = false;
        for (const Binding &b : _bindings)
        {
            int32_t delta = 0;
            if (input.key_pressed(b.decrease)) delta -= 1;
            if (input.key_pressed(b.increase)) delta += 1;
            if (delta == 0)
            {
                continue;
            }

            const int32_t before = get_param(config, b.param);
            const int32_t after = adjust_param(config, b.param, delta);
            if (after != before)
            {
                changed = true;
                Logger::info("[Streaming] {} {} -> {}", streaming_param_name(b.param), before, after);
            }
        }
        return changed;
    }
} // namespace streaming
