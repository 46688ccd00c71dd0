/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/nest/core/logging.cpp
===========================================================
Purpose:
  - Implements the noexcept logging API.
  - Adds timestamp + level tag.

Hardening:
  - Formatting goes through C stdio, which reports failure by return code
    instead of throwing.
  - Coarse mutex makes multi-thread output readable. Locking is the only
    call that can throw (std::system_error); on failure the line is written
    without it.
===========================================================
*/

#include "nest/core/logging.hpp"

#include <atomic>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <system_error>

namespace nest {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel lvl) noexcept {
  return static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

// Writes "YYYY-MM-DDTHH:MM:SSZ" into buf; empty string if the clock is unusable.
static void utc_timestamp(char* buf, std::size_t n) noexcept {
  buf[0] = '\0';
  const std::time_t tt = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  if (gmtime_s(&tm, &tt) != 0) return;
#else
  if (gmtime_r(&tt, &tm) == nullptr) return;
#endif
  if (std::strftime(buf, n, "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) buf[0] = '\0';
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (!log_enabled(lvl)) return;

  char ts[32];
  utc_timestamp(ts, sizeof(ts));

  std::unique_lock<std::mutex> lk(g_log_mu, std::defer_lock);
  try {
    lk.lock();
  } catch (const std::system_error&) {
    // Lock unavailable: write unserialized, stdio still locks per call.
  }

  std::FILE* out = (lvl >= LogLevel::WARN) ? stderr : stdout;
  std::fprintf(out, "[%s][%s] %s\n", ts, level_tag(lvl), msg.c_str());
  std::fflush(out);
}

} // namespace nest
