#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace segedit {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (for components that don't belong to a
// specific project: server startup, the HTTP layer, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a per-project logger.
//   project – project name embedded in every log line as [project-<name>]
//   level   – initial log level
std::shared_ptr<spdlog::logger> make_project_logger(
    const std::string& project,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace segedit
