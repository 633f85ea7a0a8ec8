#pragma once

#include <cstdint>
#include <string>

namespace streaming
{
    // Bounds applied by live adjustment (debug keys) and by normalize_config.
    // Only the active radius has a ceiling: the load square grows with its square.
    struct StreamingLimits
    {
        // Hard upper bound for max_active_radius itself.
        static constexpr int32_t kActiveRadiusCeiling = 1024;

        int32_t min_active_radius = 1;
        int32_t max_active_radius = 64;
        int32_t min_hysteresis = 0;
        int32_t min_load_cap = 1;
        int32_t min_unload_cap = 1;

        // max_active_radius clamped to [0, kActiveRadiusCeiling].
        int32_t active_radius_ceiling() const;
    };

    // Frame-count exponential backoff for failed provider calls.
    struct RetryPolicy
    {
        uint32_t load_base_delay_frames = 30;
        uint32_t load_max_delay_frames = 600;
        uint32_t unload_base_delay_frames = 1;
        uint32_t unload_max_delay_frames = 120;
        // Unload failures at or past this attempt count are logged as errors.
        uint32_t unload_escalate_after = 3;

        // Delay before attempt (attempts + 1). attempts >= 1.
        static uint64_t delay_frames(uint32_t attempts, uint32_t base, uint32_t max);
    };

    struct StreamingConfig
    {
        int32_t active_radius = 2;
        int32_t hysteresis = 1;
        int32_t load_cap_per_frame = 2;
        int32_t unload_cap_per_frame = 4;

        StreamingLimits limits{};
        RetryPolicy retry{};

        // Unload boundary. Never below active_radius, whatever hysteresis holds.
        int64_t keep_radius() const;
    };

    enum class StreamingParam : uint8_t
    {
        ActiveRadius,
        Hysteresis,
        LoadCap,
        UnloadCap,
    };

    const char *streaming_param_name(StreamingParam param);

    int32_t get_param(const StreamingConfig &config, StreamingParam param);

    // Adds delta with saturation, floored at the matching limit (and capped at the
    // radius ceiling for ActiveRadius). Returns the new value.
    int32_t adjust_param(StreamingConfig &config, StreamingParam param, int32_t delta);

    struct ConfigViolations
    {
        bool negative_radius = false;
        bool negative_hysteresis = false;
        bool negative_load_cap = false;
        bool negative_unload_cap = false;
        bool negative_limits = false;
        bool radius_above_max = false;
        bool max_radius_above_ceiling = false;

        bool any() const
        {
            return negative_radius || negative_hysteresis || negative_load_cap || negative_unload_cap ||
                   negative_limits || radius_above_max || max_radius_above_ceiling;
        }

        friend bool operator==(const ConfigViolations &, const ConfigViolations &) = default;
    };

    // Clamps every value to >= 0 so the unload boundary cannot fall below the
    // load boundary, and the active radius to the limits' ceiling.
    // Reports what had to be clamped through out_violations.
    StreamingConfig normalize_config(const StreamingConfig &config, ConfigViolations *out_violations = nullptr);

    std::string describe_violations(const ConfigViolations &violations);
} // namespace streaming
