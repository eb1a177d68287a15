#include "storyflow/fs.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace storyflow::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + p.string() + ": " + ec.message());
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (p.has_parent_path())
    ensure_dir(p.parent_path());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  // pid-qualified so two processes never share a temp file
  auto tmp = p;
  tmp += ".tmp." + std::to_string(::getpid());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
  }
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  const auto *data = reinterpret_cast<const std::uint8_t *>(text.data());
  write_file_atomic(p, std::span(data, text.size()));
}

bool create_exclusive(const std::filesystem::path &p, std::string_view text) {
  ensure_parent_dir(p);
  const int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST)
      return false;
    throw std::runtime_error("create failed: " + p.string() + ": " + std::strerror(errno));
  }
  std::size_t off = 0;
  while (off < text.size()) {
    const auto n = ::write(fd, text.data() + off, text.size() - off);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      const std::string why = std::strerror(errno);
      ::close(fd);
      ::unlink(p.c_str());
      throw std::runtime_error("write failed: " + p.string() + ": " + why);
    }
    off += static_cast<std::size_t>(n);
  }
  if (::close(fd) != 0)
    throw std::runtime_error("close failed: " + p.string() + ": " + std::strerror(errno));
  return true;
}

bool is_symlink(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_symlink(std::filesystem::symlink_status(p, ec));
}

void replace_symlink(const std::filesystem::path &target, const std::filesystem::path &link) {
  ensure_parent_dir(link);
  auto tmp = link.parent_path() / ("." + link.filename().string() + ".tmp." +
                                   std::to_string(::getpid()));
  std::error_code ec;
  std::filesystem::remove(tmp, ec);
  std::filesystem::create_symlink(target, tmp, ec);
  if (ec)
    throw std::runtime_error("symlink failed: " + tmp.string() + ": " + ec.message());
  // rename(2) replaces an existing link atomically
  if (::rename(tmp.c_str(), link.c_str()) != 0) {
    const std::string why = std::strerror(errno);
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("link rename failed: " + link.string() + ": " + why);
  }
}

std::optional<std::int64_t> link_mtime_ns(const std::filesystem::path &p) {
  struct stat st {};
  if (::lstat(p.c_str(), &st) != 0)
    return std::nullopt;
  return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL +
         static_cast<std::int64_t>(st.st_mtim.tv_nsec);
}

bool remove_entry(const std::filesystem::path &p) {
  std::error_code ec;
  const bool removed = std::filesystem::remove(p, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + p.string() + ": " + ec.message());
  return removed;
}

} // namespace storyflow::fs
