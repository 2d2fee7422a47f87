// Repository: ReelForge
// Component: Scoped Temp Directory
// Purpose: Per-job temp directory with guaranteed removal.
// Copyright (c) 2025 ReelForge

#include "reelforge/util/ScopedTempDir.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

#include "reelforge/util/Logger.hpp"

namespace reelforge::util {

namespace fs = std::filesystem;

ScopedTempDir::~ScopedTempDir() {
  Remove();
}

bool ScopedTempDir::Create(const std::string& root, const std::string& tag,
                           std::string* error) {
  if (IsValid()) {
    if (error) *error = "temp dir already created: " + path_;
    return false;
  }

  std::error_code ec;
  fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
  if (ec) {
    if (error) *error = "no system temp directory: " + ec.message();
    return false;
  }
  fs::create_directories(base, ec);
  if (ec) {
    if (error) *error = "cannot create temp root " + base.string() + ": " + ec.message();
    return false;
  }

  std::string templ = (base /
                       (std::string(kTempDirPrefix) + std::to_string(getpid()) +
                        "-" + tag + "-XXXXXX"))
                          .string();
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    if (error) *error = "mkdtemp failed for " + templ + ": " + std::strerror(errno);
    return false;
  }
  path_ = buf.data();
  Logger::Debug("[ScopedTempDir] created " + path_);
  return true;
}

bool ScopedTempDir::Remove() {
  if (path_.empty()) return true;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    Logger::Error("[ScopedTempDir] failed to remove " + path_ + ": " + ec.message());
    return false;
  }
  Logger::Debug("[ScopedTempDir] removed " + path_);
  path_.clear();
  return true;
}

int SweepStaleTempDirs(const std::string& root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return 0;

  const std::string prefix = kTempDirPrefix;
  int removed = 0;
  for (const auto& entry : fs::directory_iterator(root, ec)) {
    if (!entry.is_directory(ec)) continue;
    const std::string name = entry.path().filename().string();
    if (name.compare(0, prefix.size(), prefix) != 0) continue;

    // Name layout: reelforge-<pid>-<tag>-XXXXXX
    const char* pid_begin = name.c_str() + prefix.size();
    char* pid_end = nullptr;
    long pid = std::strtol(pid_begin, &pid_end, 10);
    if (pid_end == pid_begin || *pid_end != '-' || pid <= 0) continue;
    if (pid == static_cast<long>(getpid())) continue;
    if (kill(static_cast<pid_t>(pid), 0) == 0 || errno != ESRCH) continue;

    std::error_code rm_ec;
    fs::remove_all(entry.path(), rm_ec);
    if (rm_ec) {
      Logger::Warn("[ScopedTempDir] stale dir " + entry.path().string() +
                   " not removed: " + rm_ec.message());
      continue;
    }
    ++removed;
  }
  if (removed > 0) {
    Logger::Info("[ScopedTempDir] swept " + std::to_string(removed) +
                 " stale job dir(s) under " + root);
  }
  return removed;
}

}  // namespace reelforge::util
