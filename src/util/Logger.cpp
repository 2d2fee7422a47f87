// Repository: ReelForge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by every export component.
// Copyright (c) 2025 ReelForge

#include "reelforge/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace reelforge::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::info_sink_;
std::function<void(const std::string&)> Logger::debug_sink_;

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetDebugSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  debug_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  const bool enabled = std::getenv("REELFORGE_DEBUG") != nullptr;
  std::lock_guard<std::mutex> lock(mutex_);
  if (debug_sink_) {
    debug_sink_(line);
  }
  if (!enabled) return;
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

JobLog::JobLog(const std::string& component, uint64_t job_id)
    : prefix_("[" + component + "] job=" + std::to_string(job_id) + " ") {}

std::string JobLog::Line(const std::string& message) const {
  return prefix_ + message;
}

void JobLog::Info(const std::string& message) const { Logger::Info(Line(message)); }
void JobLog::Debug(const std::string& message) const { Logger::Debug(Line(message)); }
void JobLog::Warn(const std::string& message) const { Logger::Warn(Line(message)); }
void JobLog::Error(const std::string& message) const { Logger::Error(Line(message)); }

}  // namespace reelforge::util
