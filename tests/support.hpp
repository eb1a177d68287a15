#pragma once
#include "storyflow/process.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace testing {

// Throws so that main() can report the first failed expectation.
inline void expect(bool cond, const std::string &what) {
  if (!cond)
    throw std::runtime_error("expectation failed: " + what);
}

inline std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

inline void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &tag)
      : path_(fs::temp_directory_path() /
              ("storyflow_" + tag + "_" + std::to_string(std::random_device{}()))) {
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

/*
 * Stands in for the git binary. A "clone" is a directory with a .git folder
 * holding a few bookkeeping files:
 *   .git/fake-origin    remote url
 *   .git/fake-branches  local branch names, one per line
 *   .git/fake-HEAD      current branch
 *   .git/FETCH_HEAD     touched by fetch
 */
class FakeGitRunner : public storyflow::CommandRunner {
public:
  using CloneHook = std::function<storyflow::ProcessResult(const std::string &url, int attempt)>;

  std::atomic<int> clones{0};
  std::atomic<int> fetches{0};
  std::chrono::milliseconds clone_delay{0};
  std::set<std::string> remote_branches; // branches that exist on origin
  bool diverged = false;                 // merge-base --is-ancestor fails
  CloneHook clone_hook;                  // overrides the clone outcome

  storyflow::ProcessResult run(const storyflow::ProcessSpec &spec) override {
    std::vector<std::string> argv = spec.argv;
    std::optional<fs::path> dir;
    std::size_t i = 1;
    if (argv.size() > 2 && argv[1] == "-C") {
      dir = argv[2];
      i = 3;
    }
    const std::vector<std::string> rest(argv.begin() + static_cast<std::ptrdiff_t>(i), argv.end());
    if (rest.empty())
      return fail("usage");
    const std::string &cmd = rest[0];

    if (cmd == "--version")
      return ok("git version 2.99.0.fake\n");
    if (cmd == "clone")
      return clone(rest);
    if (!dir || !fs::exists(*dir / ".git"))
      return fail("fatal: not a git repository", 128);
    const fs::path git = *dir / ".git";

    if (cmd == "rev-parse" && rest.size() >= 2 && rest[1] == "--show-toplevel")
      return ok(dir->string() + "\n");
    if (cmd == "rev-parse" && rest.size() >= 4 && rest[1] == "--verify")
      return ref_exists(git, rest[3]) ? ok("0000000000000000000000000000000000000000\n")
                                      : fail("", 1);
    if (cmd == "config" && rest.size() >= 3 && rest[2] == "remote.origin.url")
      return ok(slurp(git / "fake-origin") + "\n");
    if (cmd == "symbolic-ref")
      return ok(slurp(git / "fake-HEAD") + "\n");
    if (cmd == "merge-base")
      return diverged ? fail("", 1) : ok("");
    if (cmd == "checkout")
      return checkout(git, rest);
    if (cmd == "fetch") {
      ++fetches;
      write_file(git / "FETCH_HEAD", "fetched\n");
      return ok("");
    }
    return fail("fake git: unsupported command " + cmd);
  }

private:
  static storyflow::ProcessResult ok(std::string out) {
    return storyflow::ProcessResult{.exit_code = 0, .out = std::move(out), .err = {},
                                    .timed_out = false};
  }
  static storyflow::ProcessResult fail(std::string err, int code = 1) {
    return storyflow::ProcessResult{.exit_code = code, .out = {}, .err = std::move(err),
                                    .timed_out = false};
  }

  bool ref_exists(const fs::path &git, const std::string &ref) {
    const std::string heads = "refs/heads/";
    const std::string remotes = "refs/remotes/origin/";
    if (ref.rfind(heads, 0) == 0) {
      std::istringstream iss(slurp(git / "fake-branches"));
      std::string line;
      while (std::getline(iss, line)) {
        if (line == ref.substr(heads.size()))
          return true;
      }
      return false;
    }
    if (ref.rfind(remotes, 0) == 0) {
      std::lock_guard<std::mutex> lk(mu_);
      return remote_branches.contains(ref.substr(remotes.size()));
    }
    return false;
  }

  storyflow::ProcessResult clone(const std::vector<std::string> &rest) {
    // clone -- <url> <dest>
    if (rest.size() != 4)
      return fail("fake git: bad clone arguments");
    const std::string url = rest[2];
    const fs::path dest = rest[3];
    const int attempt = ++clones;
    if (clone_delay.count() > 0)
      std::this_thread::sleep_for(clone_delay);
    if (clone_hook) {
      auto r = clone_hook(url, attempt);
      if (r.exit_code != 0 || r.timed_out) {
        // a failed clone may leave a partial directory behind
        fs::create_directories(dest / "partial");
        return r;
      }
    }
    if (fs::exists(dest) && !fs::is_empty(dest))
      return fail("fatal: destination path '" + dest.string() +
                      "' already exists and is not an empty directory.",
                  128);
    write_file(dest / ".git" / "fake-origin", url);
    write_file(dest / ".git" / "fake-branches", "main\n");
    write_file(dest / ".git" / "fake-HEAD", "main");
    write_file(dest / "README.md", "cloned from " + url + "\n");
    return ok("");
  }

  storyflow::ProcessResult checkout(const fs::path &git, const std::vector<std::string> &rest) {
    // checkout <b> | checkout -b <b> [--track origin/<b>]
    std::string branch;
    if (rest.size() >= 3 && rest[1] == "-b") {
      branch = rest[2];
      write_file(git / "fake-branches", slurp(git / "fake-branches") + branch + "\n");
    } else if (rest.size() == 2) {
      branch = rest[1];
      if (!ref_exists(git, "refs/heads/" + branch))
        return fail("error: pathspec '" + branch + "' did not match", 1);
    } else {
      return fail("fake git: bad checkout arguments");
    }
    write_file(git / "fake-HEAD", branch);
    return ok("");
  }

  std::mutex mu_;
};

} // namespace testing
