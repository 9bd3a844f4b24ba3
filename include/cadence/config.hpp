#pragma once

#include <cadence/logger.hpp>
#include <string>
#include <utility>
#include <vector>

namespace cadence
{

// Runtime knobs for hosts and logging. Plain defaults; from_env() layers the
// CADENCE_* environment variables on top:
//
//   CADENCE_LOG_LEVEL       trace|debug|info|warn|error|critical|off
//   CADENCE_LOG_CATEGORIES  per-category overrides, e.g. "animate=trace,stage=warn"
//   CADENCE_LOG_FILE        append log lines to this file as well
//   CADENCE_TARGET_FPS      frame pacing for FrameClock (0 = uncapped)
//   CADENCE_FIXED_DT        constant dt for deterministic playback
struct EngineConfig
{
    LogLevel                                      log_level      = LogLevel::Info;
    std::vector<std::pair<std::string, LogLevel>> category_levels;   // override log_level per category
    bool                                          log_to_console = true;
    std::string                                   log_file;          // empty → no file sink
    float                                         target_fps     = 60.0f;
    float                                         max_frame_dt   = 0.25f;   // FrameStage clamp
    float                                         fixed_timestep = 0.0f;    // > 0 → FrameClock fixed dt

    static EngineConfig from_env();
    static EngineConfig from_env(const EngineConfig& base);
};

// Replace the logger's sinks and level according to `config`.
void apply_logging(const EngineConfig& config);

}   // namespace cadence
