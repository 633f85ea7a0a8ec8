#pragma once

#include "chunk_grid.h"
#include "streaming_config.h"

#include <core/util/logger.h>

#include <cstdint>
#include <optional>
#include <string>

namespace streaming
{
    // Session settings for the streamer and its host.
    struct StreamingSettings
    {
        double chunk_size_m = ChunkGrid::kDefaultChunkSize;
        // Half-extent (in chunks) of the region that has content data.
        int32_t world_extent_chunks = 64;
        StreamingConfig config{};

        LogLevel log_level = LogLevel::Info;
        bool hud_enabled = true;
        uint32_t hud_interval_frames = 120;
    };

    // Load StreamingSettings from a JSON file. Missing fields keep their defaults.
    // Returns std::nullopt on parse/IO failure (errors logged via Logger).
    std::optional<StreamingSettings> load_streaming_settings(const std::string &json_path);

    // Parse from an in-memory JSON document.
    std::optional<StreamingSettings> parse_streaming_settings(const std::string &json_text);

    std::string serialize_streaming_settings(const StreamingSettings &settings);

    // Returns false on IO failure (errors logged via Logger).
    bool save_streaming_settings(const std::string &json_path, const StreamingSettings &settings);
} // namespace streaming
