#include "storyflow/git.hpp"

#include "storyflow/fs.hpp"
#include "storyflow/util.hpp"

#include <sys/stat.h>

namespace stdfs = std::filesystem;

namespace storyflow {

namespace {

std::string first_line(std::string s) {
  const auto nl = s.find('\n');
  if (nl != std::string::npos)
    s.resize(nl);
  strutil::rstrip_newlines(s);
  return s;
}

bool same_dir(const stdfs::path &a, const stdfs::path &b) {
  std::error_code ec1;
  std::error_code ec2;
  const auto ca = stdfs::weakly_canonical(a, ec1);
  const auto cb = stdfs::weakly_canonical(b, ec2);
  if (ec1 || ec2)
    return a.lexically_normal() == b.lexically_normal();
  return ca == cb;
}

bool dir_is_empty(const stdfs::path &dir) {
  std::error_code ec;
  return stdfs::is_empty(dir, ec) && !ec;
}

} // namespace

Error git_error(std::string_view operation, std::string_view url, const ProcessResult &r) {
  const std::string redacted = redact_url(url);
  Error err;
  err.kind = r.timed_out ? ErrorKind::Timeout : ErrorKind::Git;
  err.message = r.timed_out ? "git " + std::string(operation) + " timed out"
                            : "git " + std::string(operation) + " failed with exit code " +
                                  std::to_string(r.exit_code);
  if (!redacted.empty())
    err.message += " (" + redacted + ")";
  err.git = GitFailure{.operation = std::string(operation),
                       .url = redacted,
                       .exit_code = r.exit_code,
                       .stderr_text = r.err};
  return err;
}

GitRepositoryManager::GitRepositoryManager(CommandRunner &runner, GitOptions options)
    : runner_(runner), options_(options) {}

ProcessResult GitRepositoryManager::git(const std::optional<stdfs::path> &dir,
                                        std::vector<std::string> args,
                                        std::chrono::milliseconds timeout) {
  ProcessSpec spec;
  spec.argv.reserve(args.size() + 3);
  spec.argv.emplace_back("git");
  if (dir) {
    spec.argv.emplace_back("-C");
    spec.argv.push_back(dir->string());
  }
  for (auto &a : args)
    spec.argv.push_back(std::move(a));
  // never block on a credential prompt
  spec.env = {{"GIT_TERMINAL_PROMPT", "0"}, {"LC_ALL", "C"}};
  spec.timeout = timeout;
  return runner_.run(spec);
}

bool GitRepositoryManager::is_worktree(const stdfs::path &dir) {
  if (!fs::exists(dir / ".git"))
    return false;
  const auto r = git(dir, {"rev-parse", "--show-toplevel"}, options_.local_timeout);
  if (r.exit_code != 0)
    return false;
  return same_dir(first_line(r.out), dir);
}

std::optional<std::string> GitRepositoryManager::origin_url(const stdfs::path &dir) {
  const auto r = git(dir, {"config", "--get", "remote.origin.url"}, options_.local_timeout);
  if (r.exit_code != 0)
    return std::nullopt;
  auto url = first_line(r.out);
  if (url.empty())
    return std::nullopt;
  return url;
}

std::optional<std::string> GitRepositoryManager::current_branch(const stdfs::path &dir) {
  const auto r = git(dir, {"symbolic-ref", "--quiet", "--short", "HEAD"}, options_.local_timeout);
  if (r.exit_code != 0)
    return std::nullopt; // detached or not a repository
  return first_line(r.out);
}

bool GitRepositoryManager::ref_exists(const stdfs::path &dir, const std::string &ref) {
  return git(dir, {"rev-parse", "--verify", "--quiet", ref}, options_.local_timeout).exit_code == 0;
}

Result<bool> GitRepositoryManager::clone_if_absent(Context &ctx, const std::string &url,
                                                   const stdfs::path &dest) {
  if (fs::exists(dest)) {
    if (is_worktree(dest)) {
      const auto origin = origin_url(dest);
      if (origin && *origin == url) {
        ctx.log().debug("{} already cloned from {}", dest.string(), redact_url(url));
        return false;
      }
      return make_error(ErrorKind::StateConflict,
                        dest.string() + " is a clone of " + redact_url(origin.value_or("?")) +
                            ", not " + redact_url(url));
    }
    if (!dir_is_empty(dest)) {
      return make_error(ErrorKind::StateConflict,
                        dest.string() + " exists but is not a git working tree",
                        "inspect the directory, or re-run with --force to remove it");
    }
  }
  fs::ensure_parent_dir(dest);
  ctx.log().info("cloning {} into {}", redact_url(url), dest.string());
  const auto r = git(std::nullopt, {"clone", "--", url, dest.string()}, options_.network_timeout);
  if (r.exit_code == 0 && !r.timed_out)
    return true;
  // a concurrent clone of the same url finished first
  if (r.err.find("already exists") != std::string::npos && is_worktree(dest) &&
      origin_url(dest) == url) {
    return false;
  }
  return git_error("clone", url, r);
}

Result<void> GitRepositoryManager::checkout_or_create_branch(Context &ctx, const stdfs::path &dir,
                                                             const std::string &branch) {
  if (!is_valid_branch_name(branch)) {
    return make_error(ErrorKind::Validation, "invalid branch name '" + branch + "'");
  }
  const std::string local = "refs/heads/" + branch;
  const std::string remote = "refs/remotes/origin/" + branch;
  const bool has_local = ref_exists(dir, local);
  const bool has_remote = ref_exists(dir, remote);

  if (has_local && has_remote) {
    const auto behind =
        git(dir, {"merge-base", "--is-ancestor", remote, local}, options_.local_timeout);
    const auto ahead =
        git(dir, {"merge-base", "--is-ancestor", local, remote}, options_.local_timeout);
    if (behind.exit_code != 0 && ahead.exit_code != 0) {
      Error err = make_error(ErrorKind::StateConflict,
                             "branch " + branch + " has diverged from origin/" + branch,
                             "reconcile the branch by hand; it is never overwritten");
      err.git = GitFailure{.operation = "merge-base",
                           .url = {},
                           .exit_code = behind.exit_code,
                           .stderr_text = behind.err};
      return err;
    }
  }

  if (current_branch(dir) == branch) {
    ctx.log().debug("{} already on {}", dir.string(), branch);
    return {};
  }

  ProcessResult r;
  if (has_local) {
    r = git(dir, {"checkout", branch}, options_.local_timeout);
  } else if (has_remote) {
    r = git(dir, {"checkout", "-b", branch, "--track", "origin/" + branch},
            options_.local_timeout);
  } else {
    r = git(dir, {"checkout", "-b", branch}, options_.local_timeout);
  }
  if (r.exit_code != 0 || r.timed_out)
    return git_error("checkout", origin_url(dir).value_or(""), r);
  ctx.log().info("{}: on branch {}", dir.string(), branch);
  return {};
}

Result<bool> GitRepositoryManager::fetch_if_stale(Context &ctx, const stdfs::path &dir,
                                                  std::chrono::seconds staleness) {
  if (!is_worktree(dir)) {
    return make_error(ErrorKind::StateConflict, dir.string() + " is not a git working tree");
  }
  struct stat st {};
  const auto fetch_head = dir / ".git" / "FETCH_HEAD";
  if (::stat(fetch_head.c_str(), &st) == 0) {
    const auto age = std::chrono::system_clock::now() -
                     std::chrono::system_clock::from_time_t(st.st_mtim.tv_sec);
    if (age < staleness) {
      ctx.log().debug("{}: fetched {}s ago, skipping", dir.string(),
                      std::chrono::duration_cast<std::chrono::seconds>(age).count());
      return false;
    }
  }
  const auto url = origin_url(dir).value_or("");
  const auto r = git(dir, {"fetch", "--prune", "origin"}, options_.network_timeout);
  if (r.exit_code != 0 || r.timed_out)
    return git_error("fetch", url, r);
  ctx.log().info("{}: fetched origin", dir.string());
  return true;
}

Result<std::string> GitRepositoryManager::version() {
  const auto r = git(std::nullopt, {"--version"}, options_.local_timeout);
  if (r.exit_code != 0 || r.timed_out) {
    Error err = git_error("--version", "", r);
    err.hint = "install git and make sure it is on PATH";
    return err;
  }
  return first_line(r.out);
}

} // namespace storyflow
