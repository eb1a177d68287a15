#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <utility>

namespace storyflow {

// Exclusive advisory lock on a file (flock). Released on destruction or when
// the owning process dies. Lock files are left in place after release.
class FileLock {
public:
  // Poll for the lock until `timeout` elapses; a zero timeout tries once.
  // Returns nullopt if another holder kept it. Throws std::runtime_error if
  // the lock file cannot be opened.
  static std::optional<FileLock> acquire(const std::filesystem::path& path,
                                         std::chrono::milliseconds timeout);

  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;
  ~FileLock();

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  FileLock(std::filesystem::path path, int fd) : path_(std::move(path)), fd_(fd) {}
  void release();

  std::filesystem::path path_;
  int fd_ = -1;
};

} // namespace storyflow
