// Repository: Talkturn
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission, one full line per call.
// Copyright (c) 2025 Talkturn

#include "talkturn/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace talkturn::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::error_sink_;

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

bool Logger::DebugEnabled() {
  return std::getenv("TALKTURN_DEBUG") != nullptr;
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace talkturn::util
