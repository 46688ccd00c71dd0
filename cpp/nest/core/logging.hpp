#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/nest/core/logging.hpp
===========================================================
Purpose:
  - Run diagnostics for the integration loop and the samplers. Stopping
    decisions log at INFO; per-remainder detail at DEBUG.
  - One line per message, "[<UTC time>][<LEVEL>] text". Diagnostics (WARN and
    above) go to stderr so a caller can keep stdout for results.

Contract:
  - Every entry point is noexcept; a failing log call never aborts a run.
  - Callers building an expensive message check log_enabled() first.
  - The level is process-global and may be changed from any thread.
===========================================================
*/

#include <string>

namespace nest {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// True if a message at `lvl` would be emitted. Lets callers skip formatting.
bool log_enabled(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace nest
