#include "streaming_config.h"

#include <algorithm>
#include <limits>

namespace streaming
{
    namespace
    {
        int32_t saturating_add(int32_t value, int32_t delta)
        {
            const int64_t sum = static_cast<int64_t>(value) + static_cast<int64_t>(delta);
            constexpr int64_t lo = std::numeric_limits<int32_t>::min();
            constexpr int64_t hi = std::numeric_limits<int32_t>::max();
            return static_cast<int32_t>(std::clamp(sum, lo, hi));
        }

        int32_t &param_ref(StreamingConfig &config, StreamingParam param)
        {
            switch (param)
            {
                case StreamingParam::ActiveRadius: return config.active_radius;
                case StreamingParam::Hysteresis: return config.hysteresis;
                case StreamingParam::LoadCap: return config.load_cap_per_frame;
                case StreamingParam::UnloadCap: return config.unload_cap_per_frame;
            }
            return config.active_radius;
        }

        int32_t param_floor(const StreamingLimits &limits, StreamingParam param)
        {
            int32_t floor = 0;
            switch (param)
            {
                case StreamingParam::ActiveRadius: floor = limits.min_active_radius; break;
                case StreamingParam::Hysteresis: floor = limits.min_hysteresis; break;
                case StreamingParam::LoadCap: floor = limits.min_load_cap; break;
                case StreamingParam::UnloadCap: floor = limits.min_unload_cap; break;
            }
            return std::max(floor, 0);
        }

        int32_t clamp_non_negative(int32_t value, bool &flag)
        {
            if (value < 0)
            {
                flag = true;
                return 0;
            }
            return value;
        }
    } // namespace

    uint64_t RetryPolicy::delay_frames(uint32_t attempts, uint32_t base, uint32_t max)
    {
        const uint64_t b = std::max<uint64_t>(base, 1u);
        const uint64_t m = std::max<uint64_t>(max, b);
        const uint32_t shift = std::min<uint32_t>(attempts > 0 ? attempts - 1u : 0u, 32u);
        const uint64_t delay = b << shift;
        return std::min(delay, m);
    }

    int32_t StreamingLimits::active_radius_ceiling() const
    {
        return std::clamp(max_active_radius, 0, kActiveRadiusCeiling);
    }

    int64_t StreamingConfig::keep_radius() const
    {
        const int64_t r = std::max<int64_t>(active_radius, 0);
        const int64_t h = std::max<int64_t>(hysteresis, 0);
        return r + h;
    }

    const char *streaming_param_name(StreamingParam param)
    {
        switch (param)
        {
            case StreamingParam::ActiveRadius: return "active_radius";
            case StreamingParam::Hysteresis: return "hysteresis";
            case StreamingParam::LoadCap: return "load_cap_per_frame";
            case StreamingParam::UnloadCap: return "unload_cap_per_frame";
        }
        return "?";
    }

    int32_t get_param(const StreamingConfig &config, StreamingParam param)
    {
        switch (param)
        {
            case StreamingParam::ActiveRadius: return config.active_radius;
            case StreamingParam::Hysteresis: return config.hysteresis;
            case StreamingParam::LoadCap: return config.load_cap_per_frame;
            case StreamingParam::UnloadCap: return config.unload_cap_per_frame;
        }
        return 0;
    }

    int32_t adjust_param(StreamingConfig &config, StreamingParam param, int32_t delta)
    {
        int32_t &value = param_ref(config, param);
        value = std::max(saturating_add(value, delta), param_floor(config.limits, param));
        if (param == StreamingParam::ActiveRadius)
        {
            value = std::min(value, config.limits.active_radius_ceiling());
        }
        return value;
    }

    StreamingConfig normalize_config(const StreamingConfig &config, ConfigViolations *out_violations)
    {
        ConfigViolations v{};
        StreamingConfig out = config;

        out.active_radius = clamp_non_negative(config.active_radius, v.negative_radius);
        out.hysteresis = clamp_non_negative(config.hysteresis, v.negative_hysteresis);
        out.load_cap_per_frame = clamp_non_negative(config.load_cap_per_frame, v.negative_load_cap);
        out.unload_cap_per_frame = clamp_non_negative(config.unload_cap_per_frame, v.negative_unload_cap);

        out.limits.min_active_radius = clamp_non_negative(config.limits.min_active_radius, v.negative_limits);
        out.limits.min_hysteresis = clamp_non_negative(config.limits.min_hysteresis, v.negative_limits);
        out.limits.min_load_cap = clamp_non_negative(config.limits.min_load_cap, v.negative_limits);
        out.limits.min_unload_cap = clamp_non_negative(config.limits.min_unload_cap, v.negative_limits);
        out.limits.max_active_radius = clamp_non_negative(config.limits.max_active_radius, v.negative_limits);

        if (out.limits.max_active_radius > StreamingLimits::kActiveRadiusCeiling)
        {
            out.limits.max_active_radius = StreamingLimits::kActiveRadiusCeiling;
            v.max_radius_above_ceiling = true;
        }
        if (out.active_radius > out.limits.max_active_radius)
        {
            out.active_radius = out.limits.max_active_radius;
            v.radius_above_max = true;
        }

        if (out_violations)
        {
            *out_violations = v;
        }
        return out;
    }

    std::string describe_violations(const ConfigViolations &violations)
    {
        std::string out;
        auto append = [&out](const char *what) {
            if (!out.empty()) out += ", ";
            out += what;
        };

        if (violations.negative_radius) append("active_radius < 0");
        if (violations.negative_hysteresis) append("hysteresis < 0");
        if (violations.negative_load_cap) append("load_cap_per_frame < 0");
        if (violations.negative_unload_cap) append("unload_cap_per_frame < 0");
        if (violations.negative_limits) append("negative limit");
        if (violations.max_radius_above_ceiling) append("max_active_radius above ceiling");
        if (violations.radius_above_max) append("active_radius above max_active_radius");
        return out;
    }
} // namespace streaming
