#include "storyflow/lock.hpp"

#include "storyflow/fs.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <thread>
#include <unistd.h>

namespace storyflow {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(20);

void write_owner(int fd) {
  // informational only: who holds the lock
  const std::string owner = std::to_string(::getpid()) + "\n";
  if (::ftruncate(fd, 0) == 0) {
    [[maybe_unused]] const auto n = ::pwrite(fd, owner.data(), owner.size(), 0);
  }
}
} // namespace

std::optional<FileLock> FileLock::acquire(const std::filesystem::path &path,
                                          std::chrono::milliseconds timeout) {
  fs::ensure_parent_dir(path);
  const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::runtime_error("open lock failed: " + path.string() + ": " + std::strerror(errno));
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      write_owner(fd);
      return FileLock{path, fd};
    }
    if (errno != EWOULDBLOCK && errno != EINTR) {
      const std::string why = std::strerror(errno);
      ::close(fd);
      throw std::runtime_error("flock failed: " + path.string() + ": " + why);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      ::close(fd);
      return std::nullopt;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

FileLock::FileLock(FileLock &&other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_) {
  other.fd_ = -1;
}

FileLock &FileLock::operator=(FileLock &&other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

FileLock::~FileLock() { release(); }

void FileLock::release() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace storyflow
