#pragma once

#include "chunk_content.h"
#include "chunk_coord.h"
#include "streaming_config.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace streaming
{
    class ChunkGrid;

    enum class ChunkState : uint8_t
    {
        Unloaded = 0,     // implicit: no entry
        Pending = 1,      // loader call in progress
        Resident = 2,
        PendingUnload = 3 // unload requested, content still present
    };

    const char *chunk_state_name(ChunkState state);

    struct ResidentChunk
    {
        ChunkCoord coord{};
        ChunkContentHandle handle{};
        ChunkState state = ChunkState::Resident;
    };

    // Authoritative owner of chunk state and content handles.
    // Only the registry talks to the content provider; the provider must outlive it.
    class ChunkRegistry
    {
    public:
        struct Counts
        {
            uint32_t pending = 0;
            uint32_t resident = 0;
            uint32_t pending_unload = 0;
            uint32_t failure_records = 0;

            uint32_t total() const { return pending + resident + pending_unload; }
        };

        struct Stats
        {
            uint64_t loads = 0;
            uint64_t unloads = 0;
            uint64_t load_failures = 0;
            uint64_t unload_failures = 0;
            uint64_t cancelled_unloads = 0;
        };

        struct LoadFailureRecord
        {
            uint32_t attempts = 0;
            uint64_t retry_frame = 0;
            std::string last_error;
        };

        explicit ChunkRegistry(IChunkContentProvider *provider);
        ~ChunkRegistry();

        ChunkRegistry(const ChunkRegistry &) = delete;
        ChunkRegistry &operator=(const ChunkRegistry &) = delete;

        void set_retry_policy(const RetryPolicy &policy) { _retry = policy; }
        const RetryPolicy &retry_policy() const { return _retry; }

        // ------------------------------------------------------------------------
        // Transitions
        // ------------------------------------------------------------------------

        // Unloaded -> Pending -> Resident. On failure the coord returns to
        // Unloaded and is held back from planning until its retry frame.
        // Returns true when the chunk became Resident.
        bool commit_load(const ChunkCoord &coord, const ChunkGrid &grid, uint64_t frame);

        // Resident/PendingUnload -> PendingUnload -> removed. On failure the
        // entry stays PendingUnload with its handle. Returns true when removed.
        bool commit_unload(const ChunkCoord &coord, uint64_t frame);

        // PendingUnload -> Resident without touching the provider.
        bool cancel_unload(const ChunkCoord &coord);

        // Unloads everything (shutdown). Returns the number of unload failures.
        size_t release_all();

        // Drops load-failure records farther than keep_radius from center.
        void prune_failures(const ChunkCoord &center, int64_t keep_radius);

        // ------------------------------------------------------------------------
        // Queries
        // ------------------------------------------------------------------------

        ChunkState state(const ChunkCoord &coord) const;
        bool contains(const ChunkCoord &coord) const { return _entries.find(coord) != _entries.end(); }
        const ResidentChunk *find(const ChunkCoord &coord) const;

        size_t size() const { return _entries.size(); }
        bool empty() const { return _entries.empty(); }

        // Snapshot sorted by coord.
        std::vector<ResidentChunk> entries() const;

        void for_each(const std::function<void(const ResidentChunk &)> &fn) const;

        bool load_retry_blocked(const ChunkCoord &coord, uint64_t frame) const;
        bool unload_retry_blocked(const ChunkCoord &coord, uint64_t frame) const;
        uint32_t unload_attempts(const ChunkCoord &coord) const;

        const std::unordered_map<ChunkCoord, LoadFailureRecord, ChunkCoordHash> &failure_records() const
        {
            return _load_failures;
        }

        Counts counts() const;
        const Stats &stats() const { return _stats; }

    private:
        struct Entry
        {
            ResidentChunk chunk{};
            uint32_t unload_attempts = 0;
            uint64_t unload_retry_frame = 0;
        };

        void record_load_failure(const ChunkCoord &coord, uint64_t frame, std::string cause);

        IChunkContentProvider *_provider = nullptr;
        RetryPolicy _retry{};

        std::unordered_map<ChunkCoord, Entry, ChunkCoordHash> _entries;
        std::unordered_map<ChunkCoord, LoadFailureRecord, ChunkCoordHash> _load_failures;
        Stats _stats{};
    };
} // namespace streaming
