#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

// Keyboard codes follow USB HID usage IDs (and SDL scancodes) so a windowed
// host can forward native events without a translation table.
enum class Key : uint16_t
{
    Unknown = 0,

    A = 4,
    D = 7,
    S = 22,
    W = 26,

    Enter = 40,
    Escape = 41,
    Space = 44,

    F1 = 58,
    F2 = 59,
    F3 = 60,
    F4 = 61,
    F5 = 62,
    F6 = 63,
    F7 = 64,
    F8 = 65,
    F9 = 66,
    F10 = 67,
    F11 = 68,
    F12 = 69,

    LeftShift = 225,
    RightShift = 229,
};

struct InputEvent
{
    enum class Type : uint8_t
    {
        KeyDown,
        KeyUp,
    };

    Type type = Type::KeyDown;
    Key key = Key::Unknown;
    bool repeat = false;
};

class InputState
{
public:
    static constexpr uint16_t kMaxKeys = 512;

    void begin_frame();

    bool key_down(Key key) const;
    bool key_pressed(Key key) const;
    bool key_released(Key key) const;

private:
    friend class InputSystem;

    static size_t key_index(Key key);

    void set_key(Key key, bool down, bool repeat);

    std::array<uint8_t, kMaxKeys> _keys_down{};
    std::array<uint8_t, kMaxKeys> _keys_pressed{};
    std::array<uint8_t, kMaxKeys> _keys_released{};
};

// Collects events submitted by the host (a platform layer or a script) and
// folds them into an InputState once per frame.
class InputSystem
{
public:
    InputSystem() = default;

    InputSystem(const InputSystem &) = delete;
    InputSystem &operator=(const InputSystem &) = delete;

    void begin_frame();

    // Queue an event for the next pump_events().
    void submit(const InputEvent &event);

    // Convenience: queue a KeyDown followed by a KeyUp in the same frame.
    void submit_key_tap(Key key);

    void pump_events();

    const InputState &state() const { return _state; }
    std::span<const InputEvent> events() const { return _events; }

    bool quit_requested() const { return _quit_requested; }

private:
    InputState _state{};
    std::vector<InputEvent> _queued{};
    std::vector<InputEvent> _events{};

    bool _quit_requested = false;
};
