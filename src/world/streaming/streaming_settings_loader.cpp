#include "streaming_settings_loader.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace streaming
{
    using json = nlohmann::json;

    namespace
    {
        constexpr int kSchemaVersion = 1;

        const char *log_level_key(LogLevel level)
        {
            switch (level)
            {
                case LogLevel::Debug: return "debug";
                case LogLevel::Info: return "info";
                case LogLevel::Warn: return "warn";
                case LogLevel::Error: return "error";
            }
            return "info";
        }

        template<typename T>
        T json_get(const json &j, const char *key, const T &fallback)
        {
            if (j.contains(key) && !j[key].is_null())
            {
                return j[key].get<T>();
            }
            return fallback;
        }

        // Negative values are accepted from disk but clamped, the same way live edits are.
        int32_t json_get_non_negative(const json &j, const char *key, int32_t fallback)
        {
            const int64_t v = json_get<int64_t>(j, key, fallback);
            if (v < 0)
            {
                Logger::warn("[Settings] '{}' = {} is negative, clamped to 0.", key, v);
                return 0;
            }
            if (v > std::numeric_limits<int32_t>::max())
            {
                Logger::warn("[Settings] '{}' = {} is out of range, clamped.", key, v);
                return std::numeric_limits<int32_t>::max();
            }
            return static_cast<int32_t>(v);
        }

        uint32_t json_get_u32(const json &j, const char *key, uint32_t fallback)
        {
            return static_cast<uint32_t>(json_get_non_negative(j, key, static_cast<int32_t>(fallback)));
        }

        StreamingLimits parse_limits(const json &j, const StreamingLimits &defaults)
        {
            StreamingLimits l{};
            l.min_active_radius = json_get_non_negative(j, "min_active_radius", defaults.min_active_radius);
            l.max_active_radius = json_get_non_negative(j, "max_active_radius", defaults.max_active_radius);
            l.min_hysteresis = json_get_non_negative(j, "min_hysteresis", defaults.min_hysteresis);
            l.min_load_cap = json_get_non_negative(j, "min_load_cap", defaults.min_load_cap);
            l.min_unload_cap = json_get_non_negative(j, "min_unload_cap", defaults.min_unload_cap);
            return l;
        }

        RetryPolicy parse_retry(const json &j, const RetryPolicy &defaults)
        {
            RetryPolicy r{};
            r.load_base_delay_frames = json_get_u32(j, "load_base_delay_frames", defaults.load_base_delay_frames);
            r.load_max_delay_frames = json_get_u32(j, "load_max_delay_frames", defaults.load_max_delay_frames);
            r.unload_base_delay_frames = json_get_u32(j, "unload_base_delay_frames", defaults.unload_base_delay_frames);
            r.unload_max_delay_frames = json_get_u32(j, "unload_max_delay_frames", defaults.unload_max_delay_frames);
            r.unload_escalate_after = json_get_u32(j, "unload_escalate_after", defaults.unload_escalate_after);
            return r;
        }

        StreamingSettings parse_document(const json &root)
        {
            const StreamingSettings defaults{};
            StreamingSettings out{};

            const int version = json_get<int>(root, "schema_version", kSchemaVersion);
            if (version != kSchemaVersion)
            {
                Logger::warn("[Settings] Unknown schema_version {} (expected {}), reading what matches.",
                             version, kSchemaVersion);
            }

            const double size = json_get<double>(root, "chunk_size_m", defaults.chunk_size_m);
            if (std::isfinite(size) && size > 0.0)
            {
                out.chunk_size_m = size;
            }
            else
            {
                Logger::warn("[Settings] chunk_size_m = {} is invalid, using {}.", size, defaults.chunk_size_m);
            }

            out.world_extent_chunks = json_get_non_negative(root, "world_extent_chunks", defaults.world_extent_chunks);

            const json streaming = root.contains("streaming") ? root["streaming"] : json::object();
            StreamingConfig &cfg = out.config;
            cfg.active_radius = json_get_non_negative(streaming, "active_radius", defaults.config.active_radius);
            cfg.hysteresis = json_get_non_negative(streaming, "hysteresis", defaults.config.hysteresis);
            cfg.load_cap_per_frame = json_get_non_negative(streaming, "load_cap_per_frame", defaults.config.load_cap_per_frame);
            cfg.unload_cap_per_frame = json_get_non_negative(streaming, "unload_cap_per_frame", defaults.config.unload_cap_per_frame);

            if (streaming.contains("limits") && streaming["limits"].is_object())
            {
                cfg.limits = parse_limits(streaming["limits"], defaults.config.limits);
            }
            if (streaming.contains("retry") && streaming["retry"].is_object())
            {
                cfg.retry = parse_retry(streaming["retry"], defaults.config.retry);
            }

            ConfigViolations violations{};
            cfg = normalize_config(cfg, &violations);
            if (violations.any())
            {
                Logger::warn("[Settings] streaming values clamped: {}", describe_violations(violations));
            }

            const std::string level = json_get<std::string>(root, "log_level", log_level_key(defaults.log_level));
            if (auto parsed = parse_log_level(level))
            {
                out.log_level = *parsed;
            }
            else
            {
                Logger::warn("[Settings] Unknown log_level '{}', defaulting to info.", level);
            }

            if (root.contains("hud") && root["hud"].is_object())
            {
                const json &hud = root["hud"];
                out.hud_enabled = json_get<bool>(hud, "enabled", defaults.hud_enabled);
                out.hud_interval_frames = json_get_u32(hud, "interval_frames", defaults.hud_interval_frames);
            }

            return out;
        }
    } // namespace

    std::optional<StreamingSettings> parse_streaming_settings(const std::string &json_text)
    {
        try
        {
            const json root = json::parse(json_text);
            if (!root.is_object())
            {
                Logger::error("[Settings] Root must be a JSON object.");
                return std::nullopt;
            }
            return parse_document(root);
        }
        catch (const json::exception &e)
        {
            Logger::error("[Settings] Parse error: {}", e.what());
            return std::nullopt;
        }
    }

    std::optional<StreamingSettings> load_streaming_settings(const std::string &json_path)
    {
        std::ifstream in(json_path);
        if (!in.is_open())
        {
            Logger::error("[Settings] Failed to open '{}'.", json_path);
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << in.rdbuf();

        auto settings = parse_streaming_settings(buffer.str());
        if (settings)
        {
            Logger::info("[Settings] Loaded '{}'.", json_path);
        }
        return settings;
    }

    std::string serialize_streaming_settings(const StreamingSettings &settings)
    {
        const StreamingConfig &cfg = settings.config;

        json root{
                {"schema_version", kSchemaVersion},
                {"chunk_size_m", settings.chunk_size_m},
                {"world_extent_chunks", settings.world_extent_chunks},
                {"log_level", log_level_key(settings.log_level)},
                {"hud", {{"enabled", settings.hud_enabled}, {"interval_frames", settings.hud_interval_frames}}},
                {"streaming",
                 {
                         {"active_radius", cfg.active_radius},
                         {"hysteresis", cfg.hysteresis},
                         {"load_cap_per_frame", cfg.load_cap_per_frame},
                         {"unload_cap_per_frame", cfg.unload_cap_per_frame},
                         {"limits",
                          {
                                  {"min_active_radius", cfg.limits.min_active_radius},
                                  {"max_active_radius", cfg.limits.max_active_radius},
                                  {"min_hysteresis", cfg.limits.min_hysteresis},
                                  {"min_load_cap", cfg.limits.min_load_cap},
                                  {"min_unload_cap", cfg.limits.min_unload_cap},
                          }},
                         {"retry",
                          {
                                  {"load_base_delay_frames", cfg.retry.load_base_delay_frames},
                                  {"load_max_delay_frames", cfg.retry.load_max_delay_frames},
                                  {"unload_base_delay_frames", cfg.retry.unload_base_delay_frames},
                                  {"unload_max_delay_frames", cfg.retry.unload_max_delay_frames},
                                  {"unload_escalate_after", cfg.retry.unload_escalate_after},
                          }},
                 }},
        };
        return root.dump(2);
    }

    bool save_streaming_settings(const std::string &json_path, const StreamingSettings &settings)
    {
        std::ofstream out(json_path, std::ios::out | std::ios::trunc);
        if (!out.is_open())
        {
            Logger::error("[Settings] Failed to open '{}' for writing.", json_path);
            return false;
        }

        out << serialize_streaming_settings(settings);
        if (!out.good())
        {
            Logger::error("[Settings] Failed to write '{}'.", json_path);
            return false;
        }
        return true;
    }
} // namespace streaming
