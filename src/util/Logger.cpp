// Repository: Retrovue-camgate
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission, one whole line per call.
// Copyright (c) 2025 RetroVue

#include "camgate/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace camgate::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "UNKNOWN";
}

bool Logger::DebugEnabled() {
  static const bool enabled = std::getenv("CAMGATE_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::Emit(LogLevel level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, line);
  }
  std::ostream& out = (level >= LogLevel::kWarn) ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(LogLevel::kDebug, line);
}

void Logger::Info(const std::string& line) {
  Emit(LogLevel::kInfo, line);
}

void Logger::Warn(const std::string& line) {
  Emit(LogLevel::kWarn, line);
}

void Logger::Error(const std::string& line) {
  Emit(LogLevel::kError, line);
}

}  // namespace camgate::util
