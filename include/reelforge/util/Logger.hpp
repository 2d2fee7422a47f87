// Repository: ReelForge
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by every export component.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_UTIL_LOGGER_HPP_
#define REELFORGE_UTIL_LOGGER_HPP_

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace reelforge::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the coordinator worker, the encoder worker and
// the decode threads never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when REELFORGE_DEBUG env is set
// Warn  → stderr (degraded but recoverable: fallback engine, silent source)
// Error → stderr (job failures, subprocess crashes)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line
// of that level (in addition to the stream). Pass nullptr to clear. The
// debug sink sees lines even when REELFORGE_DEBUG is unset.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetDebugSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> debug_sink_;
};

// JobLog stamps every line with the emitting component and the export job
// it concerns: "[ExportCoordinator] job=7 queued". Cheap to copy; the
// prefix is built once.
class JobLog {
 public:
  JobLog(const std::string& component, uint64_t job_id);

  void Info(const std::string& message) const;
  void Debug(const std::string& message) const;
  void Warn(const std::string& message) const;
  void Error(const std::string& message) const;

  // The prefixed line, without emitting it.
  std::string Line(const std::string& message) const;
  const std::string& prefix() const { return prefix_; }

 private:
  std::string prefix_;
};

}  // namespace reelforge::util

#endif  // REELFORGE_UTIL_LOGGER_HPP_
