// Repository: TelloLink
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the orchestrator, socket and pipeline threads.
// Copyright (c) 2026 TelloLink

#ifndef TELLOLINK_UTIL_LOGGER_HPP_
#define TELLOLINK_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace tellolink::util {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

const char* LogLevelName(LogLevel level);

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. Lines from the orchestrator dispatch thread, the command channel
// receive thread and the transcode workers never interleave.
//
// Info  -> stdout (status transitions, commands, replies)
// Debug -> stdout only when TELLOLINK_DEBUG is set or SetDebugEnabled(true)
// Warn  -> stderr (degraded but recoverable conditions)
// Error -> stderr (failures surfaced to the operator)
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Overrides the TELLOLINK_DEBUG environment switch (CLI --verbose).
  static void SetDebugEnabled(bool enabled);
  static bool DebugEnabled();

  // Test-only: receives every emitted line with its level, in addition to
  // the console. Call with nullptr to clear.
  static void SetCaptureSink(std::function<void(LogLevel, const std::string&)> sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static std::function<void(LogLevel, const std::string&)> capture_sink_;
  static int debug_override_;  // -1 = follow environment, 0 = off, 1 = on
};

}  // namespace tellolink::util

#endif  // TELLOLINK_UTIL_LOGGER_HPP_
