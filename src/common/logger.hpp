#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace tkv {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger named "tkv" (server, CLI, benchmark).
// Safe to call more than once: later calls only change the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace tkv
