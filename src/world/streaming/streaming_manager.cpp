#include "streaming_manager.h"
#include "budgeter.h"

#include "core/util/logger.h"

#include <vector>

namespace streaming
{
    StreamingManager::StreamingManager(const ChunkGrid &grid, IChunkContentProvider *provider)
        : _grid(grid)
        , _registry(provider)
    {
        if (!provider)
        {
            Logger::error("[Streaming] No content provider; every chunk load will fail.");
        }
    }

    FrameReport StreamingManager::update(const WorldVec3 &observer_world, const StreamingConfig &config)
    {
        FrameReport report{};
        report.frame = _frame;

        // Live input can push values out of range; clamp, warn once per distinct problem.
        ConfigViolations violations{};
        const StreamingConfig cfg = normalize_config(config, &violations);
        if (violations.any() && violations != _last_violations)
        {
            Logger::warn("[Streaming] Config clamped: {}", describe_violations(violations));
        }
        _last_violations = violations;

        _registry.set_retry_policy(cfg.retry);

        if (is_finite(observer_world))
        {
            _observer_chunk = _grid.world_to_chunk(observer_world);
        }
        else
        {
            Logger::warn("[Streaming] Non-finite observer position, keeping chunk ({}, {}).",
                         _observer_chunk.x, _observer_chunk.z);
        }
        report.observer = _observer_chunk;

        const int64_t keep = cfg.keep_radius();
        _registry.prune_failures(_observer_chunk, keep);

        const StreamingPlan plan = StreamingPlanner::plan(_observer_chunk, _registry, cfg);
        report.planned_loads = static_cast<uint32_t>(plan.to_load.size());
        report.planned_unloads = static_cast<uint32_t>(plan.to_unload.size());

        // --- Re-entry: keep chunks whose unload never went through --- //
        for (const ChunkCoord &c : plan.to_cancel)
        {
            if (_registry.cancel_unload(c))
            {
                report.cancelled_unloads++;
            }
        }

        // --- Unloads first so memory is freed before new content arrives --- //
        std::vector<ChunkCoord> unloads;
        unloads.reserve(plan.to_unload.size());
        for (const ChunkCoord &c : plan.to_unload)
        {
            if (_registry.unload_retry_blocked(c, _frame))
            {
                report.unloads_backing_off++;
                continue;
            }
            unloads.push_back(c);
        }

        const Admission<ChunkCoord> unload_admission = admit<ChunkCoord>(unloads, cfg.unload_cap_per_frame);
        report.unloads_deferred = static_cast<uint32_t>(unload_admission.deferred.size());
        for (const ChunkCoord &c : unload_admission.admitted)
        {
            report.unloads_committed++;
            if (_registry.commit_unload(c, _frame))
            {
                report.unloads_succeeded++;
            }
            else
            {
                report.unload_failures++;
            }
        }

        // --- Loads, nearest first --- //
        std::vector<ChunkCoord> loads;
        loads.reserve(plan.to_load.size());
        for (const ChunkCoord &c : plan.to_load)
        {
            if (_registry.load_retry_blocked(c, _frame))
            {
                report.loads_backing_off++;
                continue;
            }
            loads.push_back(c);
        }

        const Admission<ChunkCoord> load_admission = admit<ChunkCoord>(loads, cfg.load_cap_per_frame);
        report.loads_deferred = static_cast<uint32_t>(load_admission.deferred.size());
        for (const ChunkCoord &c : load_admission.admitted)
        {
            report.loads_committed++;
            if (_registry.commit_load(c, _grid, _frame))
            {
                report.loads_succeeded++;
            }
            else
            {
                report.load_failures++;
            }
        }

        if (report.loads_committed > 0 || report.unloads_committed > 0 || report.cancelled_unloads > 0)
        {
            Logger::debug("[Streaming] Frame {}: chunk ({}, {}) loaded={} unloaded={} cancelled={} deferred={}/{} total={}",
                          _frame, _observer_chunk.x, _observer_chunk.z,
                          report.loads_succeeded, report.unloads_succeeded, report.cancelled_unloads,
                          report.loads_deferred, report.unloads_deferred, _registry.size());
        }

        _last_report = report;
        ++_frame;
        return report;
    }

    void StreamingManager::shutdown()
    {
        const size_t resident = _registry.size();
        const size_t failures = _registry.release_all();
        Logger::info("[Streaming] Shutdown released {} chunks ({} failures).", resident, failures);
    }

    StreamingDiagnostics StreamingManager::diagnostics(const StreamingConfig &config) const
    {
        StreamingDiagnostics d{};
        d.observer = _observer_chunk;
        d.counts = _registry.counts();
        d.totals = _registry.stats();
        d.config = config;
        d.keep_radius = normalize_config(config).keep_radius();
        d.chunk_size_m = _grid.chunk_size();
        d.last_frame = _last_report;
        return d;
    }
} // namespace streaming
