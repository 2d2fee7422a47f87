// Repository: ReelForge
// Component: Scoped Temp Directory
// Purpose: Per-job temp directory with guaranteed removal.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_UTIL_SCOPED_TEMP_DIR_HPP_
#define REELFORGE_UTIL_SCOPED_TEMP_DIR_HPP_

#include <cstdint>
#include <string>

namespace reelforge::util {

// Prefix shared by every job directory; SweepStaleTempDirs keys on it.
inline constexpr const char* kTempDirPrefix = "reelforge-";

// ScopedTempDir owns one directory created with mkdtemp under a root.
// The directory name is "<kTempDirPrefix><pid>-<tag>-XXXXXX", unique across
// concurrent and retried jobs of this and other processes.
//
// The directory and everything below it is removed by Remove() or by the
// destructor, whichever comes first. Remove() is idempotent.
class ScopedTempDir {
 public:
  ScopedTempDir() = default;
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  // An empty root means the system temp directory.
  bool Create(const std::string& root, const std::string& tag,
              std::string* error);

  bool Remove();

  bool IsValid() const { return !path_.empty(); }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

// Removes job directories under `root` whose owning pid is no longer alive.
// Returns the number of directories removed.
int SweepStaleTempDirs(const std::string& root);

}  // namespace reelforge::util

#endif  // REELFORGE_UTIL_SCOPED_TEMP_DIR_HPP_
