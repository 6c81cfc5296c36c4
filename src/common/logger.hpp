#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace docdb {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (tools, early startup messages, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a per-component logger.
//   component – short name embedded in every log line, e.g. "engine", "query"
//   level     – initial log level; ignored when the logger already exists
std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& component,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args or configuration ("trace", "debug",
// "info", …).  Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace docdb
