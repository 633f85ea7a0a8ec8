// Headless host for the chunk streamer.
//
// Usage: bastion [settings.json] [frame_count]
//
// Without a settings path, config/streaming.json is tried and the built-in
// defaults are used if it is missing. The run follows a scripted route and
// presses the debug keys on a fixed schedule so every run is reproducible.

#include "core/util/logger.h"
#include "game/observer_route.h"
#include "game/streaming_game.h"
#include "runtime/game_runtime.h"

#include <world/streaming/streaming_settings_loader.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace
{
    constexpr uint64_t kDefaultFrames = 900;
    constexpr const char *kDefaultSettingsPath = "config/streaming.json";

    std::optional<uint64_t> parse_frame_count(const char *text)
    {
        char *end = nullptr;
        const unsigned long long value = std::strtoull(text, &end, 10);
        if (end == text || *end != '\0' || value == 0)
        {
            return std::nullopt;
        }
        return static_cast<uint64_t>(value);
    }

    void schedule_debug_keys(GameRuntime::Runtime &runtime)
    {
        runtime.schedule_key_tap(240, Key::F9);  // radius 2 -> 3
        runtime.schedule_key_tap(300, Key::F7);  // load cap up
        runtime.schedule_key_tap(420, Key::F8);  // radius back to 2
        runtime.schedule_key_tap(480, Key::F10); // hysteresis 1 -> 0
        runtime.schedule_key_tap(481, Key::F10); // already at the floor
        runtime.schedule_key_tap(600, Key::F11); // hysteresis back to 1
        runtime.schedule_key_tap(660, Key::F4);  // unload cap down
        runtime.schedule_key_tap(720, Key::F3);  // hide HUD
        runtime.schedule_key_tap(840, Key::F3);  // show HUD
    }
} // namespace

int main(int argc, char *argv[])
{
    Logger::init(LogOutput::Console, LogLevel::Info);

    std::string settings_path;
    if (argc > 1)
    {
        settings_path = argv[1];
    }
    else if (std::filesystem::exists(kDefaultSettingsPath))
    {
        settings_path = kDefaultSettingsPath;
    }

    streaming::StreamingSettings settings{};
    if (!settings_path.empty())
    {
        auto loaded = streaming::load_streaming_settings(settings_path);
        if (!loaded)
        {
            Logger::error("Could not read settings from '{}'.", settings_path);
            Logger::shutdown();
            return 1;
        }
        settings = *loaded;
    }
    else
    {
        Logger::info("No settings file, using defaults.");
    }
    Logger::set_level(settings.log_level);

    uint64_t frames = kDefaultFrames;
    if (argc > 2)
    {
        auto parsed = parse_frame_count(argv[2]);
        if (!parsed)
        {
            Logger::error("Invalid frame count '{}'.", argv[2]);
            Logger::shutdown();
            return 1;
        }
        frames = *parsed;
    }

    GameRuntime::RuntimeSettings runtime_settings{};
    runtime_settings.max_frames = frames;
    runtime_settings.fixed_frame_time = 1.0f / 60.0f;

    {
        GameRuntime::Runtime runtime(runtime_settings);
        schedule_debug_keys(runtime);

        Bastion::StreamingGame game(settings, Bastion::make_demo_route(settings.chunk_size_m));
        runtime.run(&game);
    }

    const uint64_t errors = Logger::count(LogLevel::Error);
    Logger::shutdown();
    return errors == 0 ? 0 : 2;
}
