// File: src/core/util/log.cpp
#include "reel/core/util/log.hpp"

#include <cstdlib>
#include <iostream>

namespace reel {

std::mutex Logger::mutex_;
Logger::Sink Logger::info_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::error_sink_;
bool Logger::quiet_ = false;

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetQuiet(bool quiet) {
  std::lock_guard<std::mutex> lock(mutex_);
  quiet_ = quiet;
}

// Sinks run after the lock is released so a sink may log in turn.
void Logger::Info(const std::string& line) {
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = info_sink_;
  }
  if (sink) sink(line);

  std::lock_guard<std::mutex> lock(mutex_);
  if (quiet_) return;
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (std::getenv("REEL_DEBUG") == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (quiet_) return;
  std::cout << "[debug] " << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = warn_sink_;
  }
  if (sink) sink(line);

  std::lock_guard<std::mutex> lock(mutex_);
  if (quiet_) return;
  std::cerr << "warning: " << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sink = error_sink_;
  }
  if (sink) sink(line);

  std::lock_guard<std::mutex> lock(mutex_);
  if (quiet_) return;
  std::cerr << "error: " << line << '\n';
  std::cerr.flush();
}

}  // namespace reel
