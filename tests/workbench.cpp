#include "storyflow/fs.hpp"
#include "storyflow/workbench.hpp"

#include "support.hpp"

#include <atomic>
#include <iostream>
#include <thread>

using testing::expect;
using storyflow::ErrorKind;
using storyflow::WorkspaceStatus;

namespace {

bool listed(const storyflow::BoardListing &board, const std::string &id) {
  for (const auto &e : board.entries) {
    if (e.story.id == id)
      return true;
  }
  return false;
}

storyflow::CreateStoryRequest request(std::string title, bool provision) {
  storyflow::CreateStoryRequest r;
  r.title = std::move(title);
  r.provision = provision;
  return r;
}

} // namespace

int main() {
  testing::TempDir tmp("workbench");
  try {
    auto ctx = storyflow::Context::quiet();
    const storyflow::Installation home{tmp.path() / "home"};
    const std::string url = "https://example.com/web.git";
    const auto path = tmp.path() / "web";

    storyflow::ProjectOptions opts;
    opts.name = "web";
    opts.remotes = {url};
    expect(storyflow::Project::create(ctx, path, opts, home).ok(), "project");
    // global layer: no clone retries
    testing::write_file(home.global_config(), "clone_retries: 0\nretry_backoff_ms: 1\n");

    testing::FakeGitRunner runner;
    auto opened = storyflow::Workbench::open(
        ctx, path,
        storyflow::WorkbenchOptions{.installation = home, .runner = &runner, .renderer = nullptr,
                                    .confirm_retry = {}});
    expect(opened.ok(), "open");
    auto &bench = *opened.value();
    expect(bench.settings().clone_retries == 0, "global layer applied");
    expect(bench.settings().workspace_root == bench.project().default_workspace_root(),
           "default workspace root");

    // a story without a workspace enters the first stage
    auto plain = bench.create_story(ctx, request("Write the docs", false));
    expect(plain.ok(), "create");
    const std::string doc_id = plain.value().story.id;
    expect(doc_id == "WEBXX-1", "first id");
    expect(plain.value().stage == "planning", "initial stage");
    expect(!plain.value().workspace, "no workspace");
    expect(runner.clones == 0, "nothing cloned");

    // move it and look at the board
    auto moved = bench.move_story(ctx, doc_id, "in-progress", std::nullopt);
    expect(moved.ok() && moved.value().changed, "move");
    expect(listed(bench.list(ctx, std::string("in-progress")).value(), doc_id), "listed in stage");
    expect(!listed(bench.list(ctx, std::string("planning")).value(), doc_id), "left old stage");
    auto wrong_from = bench.move_story(ctx, doc_id, "testing", std::string("planning"));
    expect(!wrong_from.ok() && wrong_from.error().kind == ErrorKind::Validation, "from check");

    // a story with a workspace, using the project's first remote
    auto full = bench.create_story(ctx, request("Add login", true));
    expect(full.ok(), "create with workspace");
    const std::string login_id = full.value().story.id;
    expect(full.value().story.repository && full.value().story.repository->url == url,
           "default remote");
    expect(full.value().workspace && full.value().workspace->status == WorkspaceStatus::Ready,
           "workspace ready");
    expect(full.value().workspace->branch == "story/" + login_id, "default branch template");
    expect(fs::exists(full.value().workspace->path / ".storyflow" / "story.md"), "scaffold");
    expect(runner.clones == 1, "one clone");

    // a failed clone leaves the story unstarted with its record intact
    runner.clone_hook = [](const std::string &, int) {
      return storyflow::ProcessResult{.exit_code = 128, .out = {},
                                      .err = "fatal: Authentication failed", .timed_out = false};
    };
    auto failed = bench.create_story(ctx, request("Add search", true));
    expect(!failed.ok(), "provision failure surfaces");
    expect(failed.error().kind == ErrorKind::Git, "git error");
    expect(failed.error().step == "provision workspace", "failing step named");
    expect(failed.error().hint.find("workspace provision") != std::string::npos, "retry hint");
    const std::string search_id = "WEBXX-3";
    auto pending = bench.show(ctx, search_id);
    expect(pending.ok() && !pending.value().stage, "unstarted after failure");
    expect(pending.value().workspace->status == WorkspaceStatus::Failed, "recorded as failed");

    runner.clone_hook = nullptr;
    auto retried = bench.provision(ctx, search_id, false);
    expect(retried.ok() && retried.value().status == WorkspaceStatus::Ready, "manual provision");
    expect(bench.show(ctx, search_id).value().stage == "planning", "entered first stage");

    // bad input never spends an id
    expect(bench.create_story(ctx, request("  ", false)).error().kind == ErrorKind::Validation,
           "empty title");
    auto bad_stage = request("Staged", false);
    bad_stage.stage = "backlog";
    expect(bench.create_story(ctx, bad_stage).error().kind == ErrorKind::Validation,
           "unknown stage");
    auto bad_branch = request("Branchy", false);
    bad_branch.branch_strategy = "bad..name";
    expect(bench.create_story(ctx, bad_branch).error().kind == ErrorKind::Validation,
           "invalid branch strategy");
    auto next = bench.create_story(ctx, request("Next one", false));
    expect(next.ok() && next.value().story.id == "WEBXX-4", "counter not advanced by failures");

    // board listing, unstarted stories included
    testing::write_file(bench.project().stories_dir() / "WEBXX-9.md", "# WEBXX-9: Hand written\n");
    auto board = bench.list(ctx, std::nullopt);
    expect(board.ok() && board.value().entries.size() == 5, "whole board");
    expect(board.value().entries.back().story.id == "WEBXX-9", "sorted by number");
    expect(!board.value().entries.back().stage, "hand written story is unstarted");

    auto info = bench.info(ctx);
    expect(info.ok() && info.value().total_stories == 5, "info total");
    expect(info.value().unstarted == 1, "info unstarted");
    expect(info.value().stages.front().stage == "planning" && info.value().stages.front().count == 3,
           "planning count");

    // a configured stage whose directory is missing does not hide the rest of the board
    const auto testing_dir = bench.project().stage_dir("testing");
    fs::remove_all(testing_dir);
    auto partial = bench.list(ctx, std::nullopt);
    expect(partial.ok(), "listing survives a missing stage directory");
    expect(partial.value().entries.size() == 5, "other stages still listed");
    expect(partial.value().problems.size() == 1 &&
               partial.value().problems[0].kind == ErrorKind::StateConflict,
           "missing stage directory reported");
    auto only_testing = bench.list(ctx, std::string("testing"));
    expect(only_testing.ok() && only_testing.value().entries.empty() &&
               only_testing.value().problems.size() == 1,
           "missing stage lists as empty");
    fs::create_directories(testing_dir);

    // deleting a story takes its workspace and links with it
    const auto login_ws = full.value().workspace->path;
    expect(bench.delete_story(ctx, login_id, false).ok(), "delete story");
    expect(!fs::exists(login_ws), "workspace removed");
    expect(bench.show(ctx, login_id).error().kind == ErrorKind::NotFound, "story gone");
    expect(!listed(bench.list(ctx, std::nullopt).value(), login_id), "not on the board");
    expect(bench.delete_story(ctx, login_id, false).error().kind == ErrorKind::NotFound,
           "second delete");
    expect(bench.move_story(ctx, "../etc", "planning", std::nullopt).error().kind ==
               ErrorKind::Validation,
           "id with a separator");

    // a delete racing a move of the same story never leaves a link behind
    const std::vector<std::string> stages = bench.project().config().stages;
    for (int round = 0; round < 40; ++round) {
      auto doomed = bench.create_story(ctx, request("Doomed " + std::to_string(round), false));
      expect(doomed.ok(), "create doomed story");
      const std::string id = doomed.value().story.id;
      std::atomic<bool> started{false};
      std::atomic<bool> stop{false};
      std::thread mover([&] {
        auto lctx = storyflow::Context::quiet();
        for (std::size_t i = 0; !stop; ++i) {
          auto t = bench.move_story(lctx, id, stages[i % stages.size()], std::nullopt);
          started = true;
          if (!t.ok())
            break; // NotFound once the delete has run
        }
      });
      while (!started)
        std::this_thread::yield();
      auto deleted = bench.delete_story(ctx, id, true);
      stop = true;
      mover.join();
      expect(deleted.ok(), "delete during moves");
      expect(!fs::exists(bench.project().stories_dir() / (id + ".md")), "story file gone");
      for (const auto &s : stages) {
        expect(!storyflow::fs::is_symlink(bench.project().stage_dir(s) / id),
               "no link left for " + id + " in " + s);
      }
    }

    // the project goes last
    expect(bench.delete_project(ctx, false).error().kind == ErrorKind::Validation,
           "stories block deletion");
    expect(bench.delete_project(ctx, true).ok(), "forced project delete");
    expect(!fs::exists(path / ".storyflow"), "data dir removed");
    expect(home.registered().empty(), "prefix released");

    std::cout << "workbench test OK\n";
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
