// File: include/reel/core/util/log.hpp
#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace reel {

// Process-wide line logger.
// Info/Debug go to stdout, Warn/Error to stderr. Debug is silent unless REEL_DEBUG is set.
// Sinks see every line of their level before it is printed (tests use them to capture output).
// A sink is called without the logger lock held, so it may log itself.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

  // Suppress console output (sinks still fire). Used by tests and --quiet.
  static void SetQuiet(bool quiet);

 private:
  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
  static bool quiet_;
};

}  // namespace reel
