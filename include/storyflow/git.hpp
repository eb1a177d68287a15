#pragma once
#include "storyflow/context.hpp"
#include "storyflow/error.hpp"
#include "storyflow/process.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow {

struct GitOptions {
  std::chrono::milliseconds network_timeout{0}; // clone and fetch; 0 = none
  std::chrono::milliseconds local_timeout{std::chrono::seconds(60)};
};

// Wraps the external git tool. Every operation checks the state it is asked
// to produce first, so calling it twice has the effect of calling it once.
// Failures carry the operation, the redacted url, git's exit code and its
// stderr verbatim.
class GitRepositoryManager {
public:
  GitRepositoryManager(CommandRunner& runner, GitOptions options);

  // Returns true if a clone ran, false if `dest` already is a clone of `url`.
  auto clone_if_absent(Context& ctx, const std::string& url, const std::filesystem::path& dest)
      -> Result<bool>;

  // Check out `branch`, creating it from origin/<branch> or HEAD as needed.
  // A local branch whose history diverged from origin is a StateConflict.
  auto checkout_or_create_branch(Context& ctx, const std::filesystem::path& dir,
                                 const std::string& branch) -> Result<void>;

  // Fetch origin unless FETCH_HEAD is younger than `staleness`.
  // Returns true if a fetch ran.
  auto fetch_if_stale(Context& ctx, const std::filesystem::path& dir,
                      std::chrono::seconds staleness) -> Result<bool>;

  // `dir` is the top level of a git working tree.
  [[nodiscard]] bool is_worktree(const std::filesystem::path& dir);

  [[nodiscard]] auto origin_url(const std::filesystem::path& dir) -> std::optional<std::string>;
  [[nodiscard]] auto current_branch(const std::filesystem::path& dir)
      -> std::optional<std::string>;

  // "git version 2.x"; Git error if git cannot be run.
  auto version() -> Result<std::string>;

private:
  auto git(const std::optional<std::filesystem::path>& dir, std::vector<std::string> args,
           std::chrono::milliseconds timeout) -> ProcessResult;
  bool ref_exists(const std::filesystem::path& dir, const std::string& ref);

  CommandRunner& runner_;
  GitOptions options_;
};

// Build the error for a failed git call.
auto git_error(std::string_view operation, std::string_view url, const ProcessResult& r) -> Error;

} // namespace storyflow
