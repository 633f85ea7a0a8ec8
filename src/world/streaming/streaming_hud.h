#pragma once

#include "streaming_manager.h"

#include <string>
#include <vector>

namespace streaming
{
    // Text readout of the streaming state. Never mutates anything.
    std::vector<std::string> format_hud_lines(const StreamingDiagnostics &diag);
} // namespace streaming
