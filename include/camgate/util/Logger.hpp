// Repository: Retrovue-camgate
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission, one whole line per call.
// Copyright (c) 2025 RetroVue

#ifndef CAMGATE_UTIL_LOGGER_HPP_
#define CAMGATE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace camgate::util {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
};

const char* LogLevelName(LogLevel level);

// Logger serializes log lines from the producer threads, the decode worker
// and the consumer event loop behind one static mutex. Every call writes
// and flushes one full line.
//
// Debug, Info → stdout. Debug only when CAMGATE_DEBUG is set (read once).
// Warn, Error → stderr.
//
// SetSink() installs a hook that sees every emitted line with its level,
// in addition to the stream. Contract tests use it to assert on failures.
class Logger {
 public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  static void Debug(const std::string& line);
  static void Info(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  // nullptr clears.
  static void SetSink(Sink sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static Sink sink_;
};

}  // namespace camgate::util

#endif  // CAMGATE_UTIL_LOGGER_HPP_
