#include "storyflow/git.hpp"
#include "storyflow/workspace.hpp"

#include "support.hpp"

#include <iostream>

using testing::expect;

namespace {

storyflow::PosixCommandRunner runner;

void git_ok(const fs::path &dir, std::vector<std::string> args) {
  storyflow::ProcessSpec spec;
  spec.argv = {"git", "-C", dir.string(), "-c", "user.name=Story Flow",
               "-c", "user.email=storyflow@example.com"};
  spec.argv.insert(spec.argv.end(), args.begin(), args.end());
  spec.env = {{"GIT_TERMINAL_PROMPT", "0"}};
  const auto r = runner.run(spec);
  if (r.exit_code != 0)
    throw std::runtime_error("git " + args.front() + " failed: " + r.err);
}

void commit(const fs::path &dir, const std::string &file, const std::string &text) {
  testing::write_file(dir / file, text);
  git_ok(dir, {"add", file});
  git_ok(dir, {"commit", "-q", "-m", "edit " + file});
}

} // namespace

int main() {
  testing::TempDir tmp("git");
  try {
    storyflow::ProcessSpec version_check;
    version_check.argv = {"git", "--version"};
    if (runner.run(version_check).exit_code != 0) {
      std::cout << "git not installed; skipping\n";
      return 0;
    }

    auto ctx = storyflow::Context::quiet();
    storyflow::GitRepositoryManager git{
        runner, storyflow::GitOptions{.network_timeout = std::chrono::seconds(60),
                                      .local_timeout = std::chrono::seconds(60)}};
    expect(git.version().ok(), "version");

    const auto origin = tmp.path() / "origin";
    fs::create_directories(origin);
    git_ok(origin, {"init", "-q"});
    commit(origin, "README.md", "hello\n");
    const std::string url = origin.string();

    const auto clone = tmp.path() / "clone";
    auto cloned = git.clone_if_absent(ctx, url, clone);
    expect(cloned.ok() && cloned.value(), "clone");
    expect(git.is_worktree(clone), "worktree");
    expect(!git.is_worktree(clone / "missing"), "not a worktree");
    expect(git.origin_url(clone) == url, "origin url");
    auto again = git.clone_if_absent(ctx, url, clone);
    expect(again.ok() && !again.value(), "clone is idempotent");

    // new local branch
    expect(git.checkout_or_create_branch(ctx, clone, "story/T-1").ok(), "create branch");
    expect(git.current_branch(clone) == "story/T-1", "on new branch");
    expect(git.checkout_or_create_branch(ctx, clone, "story/T-1").ok(), "checkout is idempotent");

    // branch that only exists on origin
    git_ok(origin, {"branch", "feature"});
    auto fetched = git.fetch_if_stale(ctx, clone, std::chrono::seconds(0));
    expect(fetched.ok() && fetched.value(), "fetch");
    auto skipped = git.fetch_if_stale(ctx, clone, std::chrono::seconds(3600));
    expect(skipped.ok() && !skipped.value(), "recent fetch skipped");
    expect(git.checkout_or_create_branch(ctx, clone, "feature").ok(), "tracking branch");
    expect(git.current_branch(clone) == "feature", "on tracking branch");

    // both sides commit: the local branch is left alone
    git_ok(origin, {"checkout", "-q", "feature"});
    commit(origin, "upstream.txt", "theirs\n");
    commit(clone, "local.txt", "ours\n");
    expect(git.fetch_if_stale(ctx, clone, std::chrono::seconds(0)).ok(), "fetch diverged");
    auto diverged = git.checkout_or_create_branch(ctx, clone, "feature");
    expect(!diverged.ok() && diverged.error().kind == storyflow::ErrorKind::StateConflict,
           "divergence detected");
    expect(fs::exists(clone / "local.txt"), "local commit kept");

    // a missing repository is a permanent git failure with git's own message
    auto bad = git.clone_if_absent(ctx, (tmp.path() / "nope").string(), tmp.path() / "bad");
    expect(!bad.ok() && bad.error().kind == storyflow::ErrorKind::Git, "bad url");
    expect(bad.error().git && !bad.error().git->stderr_text.empty(), "stderr captured");
    expect(!storyflow::is_transient(bad.error()), "not transient");

    // a directory that is not a clone is never overwritten
    testing::write_file(tmp.path() / "occupied" / "file.txt", "x\n");
    auto occupied = git.clone_if_absent(ctx, url, tmp.path() / "occupied");
    expect(!occupied.ok() && occupied.error().kind == storyflow::ErrorKind::StateConflict,
           "occupied destination");

    std::cout << "git test OK\n";
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
