// Repository: Talkturn
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission, one full line per call.
// Copyright (c) 2025 Talkturn

#ifndef TALKTURN_UTIL_LOGGER_HPP_
#define TALKTURN_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace talkturn::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from a live ingest thread and a rendering thread never
// interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when TALKTURN_DEBUG env is set (per-frame tracing)
// Error → stderr (upstream contract violations, bad input)
//
// Test-only: SetErrorSink installs a callback invoked for every Error() line
// (in addition to stderr). Used by tests to assert violation counts.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Error(const std::string& line);

  // True when TALKTURN_DEBUG is set. Lets callers skip building
  // per-frame debug lines.
  static bool DebugEnabled();

  // Test-only: capture Error() lines. Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace talkturn::util

#endif  // TALKTURN_UTIL_LOGGER_HPP_
