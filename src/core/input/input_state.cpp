#include "input_state.h"

#include <algorithm>

void InputState::begin_frame()
{
    std::fill(_keys_pressed.begin(), _keys_pressed.end(), 0);
    std::fill(_keys_released.begin(), _keys_released.end(), 0);
}

bool InputState::key_down(Key key) const
{
    const size_t idx = key_index(key);
    if (idx >= _keys_down.size()) return false;
    return _keys_down[idx] != 0;
}

bool InputState::key_pressed(Key key) const
{
    const size_t idx = key_index(key);
    if (idx >= _keys_pressed.size()) return false;
    return _keys_pressed[idx] != 0;
}

bool InputState::key_released(Key key) const
{
    const size_t idx = key_index(key);
    if (idx >= _keys_released.size()) return false;
    return _keys_released[idx] != 0;
}

size_t InputState::key_index(Key key)
{
    return static_cast<size_t>(static_cast<uint16_t>(key));
}

void InputState::set_key(Key key, bool down, bool repeat)
{
    const size_t idx = key_index(key);
    if (idx >= _keys_down.size()) return;

    const bool was_down = _keys_down[idx] != 0;
    if (down)
    {
        _keys_down[idx] = 1;
        if (!was_down && !repeat)
        {
            _keys_pressed[idx] = 1;
        }
    }
    else
    {
        _keys_down[idx] = 0;
        if (was_down)
        {
            _keys_released[idx] = 1;
        }
    }
}

void InputSystem::begin_frame()
{
    _state.begin_frame();
    _events.clear();
}

void InputSystem::submit(const InputEvent &event)
{
    _queued.push_back(event);
}

void InputSystem::submit_key_tap(Key key)
{
    submit(InputEvent{InputEvent::Type::KeyDown, key, false});
    submit(InputEvent{InputEvent::Type::KeyUp, key, false});
}

void InputSystem::pump_events()
{
    for (const InputEvent &e : _queued)
    {
        switch (e.type)
        {
            case InputEvent::Type::KeyDown:
                _state.set_key(e.key, true, e.repeat);
                if (e.key == Key::Escape)
                {
                    _quit_requested = true;
                }
                break;
            case InputEvent::Type::KeyUp:
                _state.set_key(e.key, false, false);
                break;
        }
        _events.push_back(e);
    }
    _queued.clear();
}
