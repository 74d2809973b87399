// Repository: TelloLink
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the orchestrator, socket and pipeline threads.
// Copyright (c) 2026 TelloLink

#include "tellolink/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace tellolink::util {

std::mutex Logger::mutex_;
std::function<void(LogLevel, const std::string&)> Logger::capture_sink_;
int Logger::debug_override_ = -1;

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

void Logger::SetCaptureSink(std::function<void(LogLevel, const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  capture_sink_ = std::move(sink);
}

void Logger::SetDebugEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  debug_override_ = enabled ? 1 : 0;
}

bool Logger::DebugEnabled() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (debug_override_ >= 0) return debug_override_ == 1;
  }
  return std::getenv("TELLOLINK_DEBUG") != nullptr;
}

void Logger::Info(const std::string& line) {
  Emit(LogLevel::kInfo, line);
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(LogLevel::kDebug, line);
}

void Logger::Warn(const std::string& line) {
  Emit(LogLevel::kWarn, line);
}

void Logger::Error(const std::string& line) {
  Emit(LogLevel::kError, line);
}

void Logger::Emit(LogLevel level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (capture_sink_) {
    capture_sink_(level, line);
  }
  if (level == LogLevel::kWarn || level == LogLevel::kError) {
    std::cerr << line << '\n';
    std::cerr.flush();
  } else {
    std::cout << line << '\n';
    std::cout.flush();
  }
}

}  // namespace tellolink::util
