#pragma once
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow::fs {

bool exists(const std::filesystem::path& p);
void ensure_dir(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

std::string read_text(const std::filesystem::path& p);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Create a file that must not exist yet. Returns false if it already exists.
bool create_exclusive(const std::filesystem::path& p, std::string_view text);

// Is `p` itself a symlink (dangling or not)?
bool is_symlink(const std::filesystem::path& p);

// Create (or atomically replace) a symlink at `link` pointing to `target`.
// The link is built under a temporary name and renamed into place.
void replace_symlink(const std::filesystem::path& target, const std::filesystem::path& link);

// Modification time of the link itself (lstat), nanoseconds since epoch.
std::optional<std::int64_t> link_mtime_ns(const std::filesystem::path& p);

// Remove a file or symlink; returns false if nothing was there.
bool remove_entry(const std::filesystem::path& p);

} // namespace storyflow::fs
