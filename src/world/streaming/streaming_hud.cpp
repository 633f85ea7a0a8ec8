#include "streaming_hud.h"

#include <fmt/core.h>

namespace streaming
{
    std::vector<std::string> format_hud_lines(const StreamingDiagnostics &diag)
    {
        std::vector<std::string> lines;
        lines.reserve(5);

        lines.push_back(fmt::format("chunk ({}, {}), loaded {}",
                                    diag.observer.x, diag.observer.z, diag.counts.resident));
        lines.push_back(fmt::format("pending {} | pending unload {} | backoff {}",
                                    diag.counts.pending, diag.counts.pending_unload, diag.counts.failure_records));
        lines.push_back(fmt::format("radius {} (+{} hysteresis, keep {}) | caps load {} unload {} | size {:.0f} m",
                                    diag.config.active_radius, diag.config.hysteresis, diag.keep_radius,
                                    diag.config.load_cap_per_frame, diag.config.unload_cap_per_frame,
                                    diag.chunk_size_m));
        lines.push_back(fmt::format("frame {}: +{} -{} cancel {} fail {}/{} deferred {}/{}",
                                    diag.last_frame.frame,
                                    diag.last_frame.loads_succeeded, diag.last_frame.unloads_succeeded,
                                    diag.last_frame.cancelled_unloads,
                                    diag.last_frame.load_failures, diag.last_frame.unload_failures,
                                    diag.last_frame.loads_deferred, diag.last_frame.unloads_deferred));
        lines.push_back(fmt::format("totals: loads {} unloads {} load failures {} unload failures {} cancels {}",
                                    diag.totals.loads, diag.totals.unloads, diag.totals.load_failures,
                                    diag.totals.unload_failures, diag.totals.cancelled_unloads));
        return lines;
    }
} // namespace streaming
