#include "chunk_registry.h"
#include "chunk_grid.h"

#include "core/util/logger.h"

#include <algorithm>
#include <iterator>

namespace streaming
{
    const char *chunk_state_name(ChunkState state)
    {
        switch (state)
        {
            case ChunkState::Unloaded: return "Unloaded";
            case ChunkState::Pending: return "Pending";
            case ChunkState::Resident: return "Resident";
            case ChunkState::PendingUnload: return "PendingUnload";
        }
        return "?";
    }

    ChunkRegistry::ChunkRegistry(IChunkContentProvider *provider)
        : _provider(provider)
    {
    }

    ChunkRegistry::~ChunkRegistry()
    {
        if (!_entries.empty())
        {
            Logger::debug("[Streaming] Registry destroyed with {} chunks, releasing.", _entries.size());
            release_all();
        }
    }

    bool ChunkRegistry::commit_load(const ChunkCoord &coord, const ChunkGrid &grid, uint64_t frame)
    {
        // One entry per coord: refuse rather than overwrite.
        auto [it, inserted] = _entries.emplace(coord, Entry{});
        if (!inserted)
        {
            Logger::debug("[Streaming] Load skipped for ({}, {}): already {}.",
                          coord.x, coord.z, chunk_state_name(it->second.chunk.state));
            return false;
        }

        Entry &entry = it->second;
        entry.chunk.coord = coord;
        entry.chunk.state = ChunkState::Pending;

        ChunkLoadResult result = _provider
                                     ? _provider->load(coord, grid)
                                     : ChunkLoadResult::failure("no content provider");

        if (!result.ok())
        {
            // A handle that came back with an error still owns content.
            if (result.handle.is_valid() && _provider)
            {
                const ChunkUnloadResult undo = _provider->unload(coord, result.handle);
                if (!undo.ok())
                {
                    Logger::error("[Streaming] Failed to release partial load of ({}, {}): {}",
                                  coord.x, coord.z, undo.error);
                }
            }
            _entries.erase(it);
            if (result.error.empty())
            {
                result.error = "provider returned an invalid handle";
            }
            record_load_failure(coord, frame, std::move(result.error));
            return false;
        }

        entry.chunk.handle = result.handle;
        entry.chunk.state = ChunkState::Resident;
        _load_failures.erase(coord);
        _stats.loads++;
        Logger::debug("[Streaming] + chunk ({}, {})", coord.x, coord.z);
        return true;
    }

    void ChunkRegistry::record_load_failure(const ChunkCoord &coord, uint64_t frame, std::string cause)
    {
        LoadFailureRecord &rec = _load_failures[coord];
        rec.attempts++;
        rec.retry_frame = frame + RetryPolicy::delay_frames(rec.attempts,
                                                            _retry.load_base_delay_frames,
                                                            _retry.load_max_delay_frames);
        rec.last_error = std::move(cause);
        _stats.load_failures++;

        Logger::warn("[Streaming] Load failed for chunk ({}, {}) (attempt {}): {}. Retry at frame {}.",
                     coord.x, coord.z, rec.attempts, rec.last_error, rec.retry_frame);
    }

    bool ChunkRegistry::commit_unload(const ChunkCoord &coord, uint64_t frame)
    {
        auto it = _entries.find(coord);
        if (it == _entries.end())
        {
            return false;
        }

        Entry &entry = it->second;
        if (entry.chunk.state != ChunkState::Resident && entry.chunk.state != ChunkState::PendingUnload)
        {
            return false;
        }

        entry.chunk.state = ChunkState::PendingUnload;

        const ChunkUnloadResult result = _provider
                                             ? _provider->unload(coord, entry.chunk.handle)
                                             : ChunkUnloadResult::failure("no content provider");

        if (result.ok())
        {
            _entries.erase(it);
            _stats.unloads++;
            Logger::debug("[Streaming] - chunk ({}, {})", coord.x, coord.z);
            return true;
        }

        entry.unload_attempts++;
        entry.unload_retry_frame = frame + RetryPolicy::delay_frames(entry.unload_attempts,
                                                                     _retry.unload_base_delay_frames,
                                                                     _retry.unload_max_delay_frames);
        _stats.unload_failures++;

        const LogLevel level = (entry.unload_attempts >= _retry.unload_escalate_after) ? LogLevel::Error
                                                                                       : LogLevel::Warn;
        Logger::at(level, "[Streaming] Unload failed for chunk ({}, {}) (attempt {}): {}. Keeping content, retry at frame {}.",
                   coord.x, coord.z, entry.unload_attempts, result.error, entry.unload_retry_frame);
        return false;
    }

    bool ChunkRegistry::cancel_unload(const ChunkCoord &coord)
    {
        auto it = _entries.find(coord);
        if (it == _entries.end() || it->second.chunk.state != ChunkState::PendingUnload)
        {
            return false;
        }

        it->second.chunk.state = ChunkState::Resident;
        it->second.unload_attempts = 0;
        it->second.unload_retry_frame = 0;
        _stats.cancelled_unloads++;
        Logger::debug("[Streaming] Unload cancelled for chunk ({}, {})", coord.x, coord.z);
        return true;
    }

    size_t ChunkRegistry::release_all()
    {
        size_t failures = 0;
        for (const ResidentChunk &chunk : entries())
        {
            const ChunkUnloadResult result = _provider
                                                 ? _provider->unload(chunk.coord, chunk.handle)
                                                 : ChunkUnloadResult::failure("no content provider");
            if (result.ok())
            {
                _stats.unloads++;
            }
            else
            {
                failures++;
                _stats.unload_failures++;
                Logger::error("[Streaming] Release failed for chunk ({}, {}) handle {}: {}",
                              chunk.coord.x, chunk.coord.z, chunk.handle.value, result.error);
            }
        }

        _entries.clear();
        _load_failures.clear();
        return failures;
    }

    void ChunkRegistry::prune_failures(const ChunkCoord &center, int64_t keep_radius)
    {
        std::erase_if(_load_failures, [&](const auto &kv) {
            return ChunkGrid::chebyshev_distance(kv.first, center) > keep_radius;
        });
    }

    ChunkState ChunkRegistry::state(const ChunkCoord &coord) const
    {
        auto it = _entries.find(coord);
        return it != _entries.end() ? it->second.chunk.state : ChunkState::Unloaded;
    }

    const ResidentChunk *ChunkRegistry::find(const ChunkCoord &coord) const
    {
        auto it = _entries.find(coord);
        return it != _entries.end() ? &it->second.chunk : nullptr;
    }

    std::vector<ResidentChunk> ChunkRegistry::entries() const
    {
        std::vector<ResidentChunk> out;
        out.reserve(_entries.size());
        for (const auto &kv : _entries)
        {
            out.push_back(kv.second.chunk);
        }
        std::sort(out.begin(), out.end(),
                  [](const ResidentChunk &a, const ResidentChunk &b) { return a.coord < b.coord; });
        return out;
    }

    void ChunkRegistry::for_each(const std::function<void(const ResidentChunk &)> &fn) const
    {
        for (const auto &kv : _entries)
        {
            fn(kv.second.chunk);
        }
    }

    bool ChunkRegistry::load_retry_blocked(const ChunkCoord &coord, uint64_t frame) const
    {
        auto it = _load_failures.find(coord);
        return it != _load_failures.end() && frame < it->second.retry_frame;
    }

    bool ChunkRegistry::unload_retry_blocked(const ChunkCoord &coord, uint64_t frame) const
    {
        auto it = _entries.find(coord);
        if (it == _entries.end() || it->second.unload_attempts == 0)
        {
            return false;
        }
        return frame < it->second.unload_retry_frame;
    }

    uint32_t ChunkRegistry::unload_attempts(const ChunkCoord &coord) const
    {
        auto it = _entries.find(coord);
        return it != _entries.end() ? it->second.unload_attempts : 0u;
    }

    ChunkRegistry::Counts ChunkRegistry::counts() const
    {
        Counts c{};
        for (const auto &kv : _entries)
        {
            switch (kv.second.chunk.state)
            {
                case ChunkState::Pending: c.pending++; break;
                case ChunkState::Resident: c.resident++; break;
                case ChunkState::PendingUnload: c.pending_unload++; break;
                case ChunkState::Unloaded: break;
            }
        }
        c.failure_records = static_cast<uint32_t>(_load_failures.size());
        return c;
    }
} // namespace streaming
