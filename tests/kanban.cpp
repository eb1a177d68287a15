#include "storyflow/fs.hpp"
#include "storyflow/kanban.hpp"
#include "storyflow/lock.hpp"

#include "support.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <iostream>
#include <thread>

using testing::expect;

namespace {

// Give the link itself (not its target) a fixed mtime.
void set_link_mtime(const fs::path &link, long seconds) {
  struct timespec times[2];
  times[0].tv_sec = seconds;
  times[0].tv_nsec = 0;
  times[1] = times[0];
  if (::utimensat(AT_FDCWD, link.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0)
    throw std::runtime_error("utimensat failed: " + link.string());
}

fs::path target_of(const std::string &id) { return fs::path("..") / ".." / "stories" / (id + ".md"); }

bool has_story(const storyflow::StageListing &l, const std::string &id) {
  for (const auto &s : l.stories) {
    if (s.id == id)
      return true;
  }
  return false;
}

} // namespace

int main() {
  testing::TempDir tmp("kanban");
  try {
    auto ctx = storyflow::Context::quiet();
    const storyflow::Installation home{tmp.path() / "home"};
    storyflow::ProjectOptions opts;
    opts.prefix = "KAN";
    auto created = storyflow::Project::create(ctx, tmp.path() / "board", opts, home);
    expect(created.ok(), "project");
    auto &project = created.value();
    storyflow::StoryRegistry stories{project, std::chrono::seconds(2)};
    for (int i = 1; i <= 12; ++i) {
      storyflow::StoryDraft d;
      d.title = "Story " + std::to_string(i);
      expect(stories.create(ctx, "KAN-" + std::to_string(i), d).ok(), "story " + std::to_string(i));
    }
    storyflow::KanbanStateMachine board{project, stories, std::chrono::milliseconds(200)};

    // unstarted until the first transition
    auto stage = board.current_stage(ctx, "KAN-1");
    expect(stage.ok() && !stage.value(), "unstarted");

    auto t = board.transition(ctx, "KAN-1", std::nullopt, "planning");
    expect(t.ok() && t.value().changed && !t.value().from, "enter planning");
    const auto link = board.link_path("planning", "KAN-1");
    expect(storyflow::fs::is_symlink(link) && fs::exists(link), "link resolves");
    expect(fs::read_symlink(link) == target_of("KAN-1"), "relative link target");

    // idempotent: the same move again changes nothing
    auto again = board.transition(ctx, "KAN-1", std::nullopt, "planning");
    expect(again.ok() && !again.value().changed, "second move is a no-op");
    expect(storyflow::fs::link_mtime_ns(link).has_value(), "link still there");

    // validation
    expect(board.transition(ctx, "KAN-1", std::string("testing"), "pr").error().kind ==
               storyflow::ErrorKind::Validation,
           "wrong from stage");
    expect(board.transition(ctx, "KAN-1", std::nullopt, "nowhere").error().kind ==
               storyflow::ErrorKind::Validation,
           "unknown stage");
    expect(board.transition(ctx, "KAN-77", std::nullopt, "planning").error().kind ==
               storyflow::ErrorKind::NotFound,
           "unknown story");
    expect(board.current_stage(ctx, "KAN-77").error().kind == storyflow::ErrorKind::NotFound,
           "current stage of unknown story");

    auto moved = board.transition(ctx, "KAN-1", std::string("planning"), "in-progress");
    expect(moved.ok() && moved.value().from == "planning", "planning -> in-progress");
    expect(!storyflow::fs::is_symlink(link), "old link removed");
    expect(board.current_stage(ctx, "KAN-1").value() == "in-progress", "current stage");
    expect(has_story(board.list_stage(ctx, "in-progress").value(), "KAN-1"), "listed in new stage");
    expect(!has_story(board.list_stage(ctx, "planning").value(), "KAN-1"), "not in old stage");
    expect(board.list_stage(ctx, "bogus").error().kind == storyflow::ErrorKind::Validation,
           "list unknown stage");

    // interrupted transition: new link created, old link not yet removed, marker present
    expect(board.transition(ctx, "KAN-2", std::nullopt, "planning").ok(), "KAN-2 planning");
    storyflow::fs::replace_symlink(target_of("KAN-2"), board.link_path("in-progress", "KAN-2"));
    testing::write_file(project.locks_dir() / "KAN-2.pending", "in-progress\n");
    // readers skip the stage being left
    expect(!has_story(board.list_stage(ctx, "planning").value(), "KAN-2"), "in flight: not in old");
    expect(has_story(board.list_stage(ctx, "in-progress").value(), "KAN-2"), "in flight: in new");
    // the marker names the winner even when the old link is newer
    set_link_mtime(board.link_path("in-progress", "KAN-2"), 1000);
    set_link_mtime(board.link_path("planning", "KAN-2"), 2000);
    auto repaired = board.current_stage(ctx, "KAN-2");
    expect(repaired.ok() && repaired.value() == "in-progress", "new link wins");
    expect(!storyflow::fs::is_symlink(board.link_path("planning", "KAN-2")), "old link repaired");
    expect(!fs::exists(project.locks_dir() / "KAN-2.pending"), "marker cleared");

    // duplicates without a marker: newest link wins
    storyflow::fs::replace_symlink(target_of("KAN-3"), board.link_path("testing", "KAN-3"));
    storyflow::fs::replace_symlink(target_of("KAN-3"), board.link_path("pr", "KAN-3"));
    set_link_mtime(board.link_path("testing", "KAN-3"), 5000);
    set_link_mtime(board.link_path("pr", "KAN-3"), 4000);
    expect(board.current_stage(ctx, "KAN-3").value() == "testing", "newest wins");
    expect(!storyflow::fs::is_symlink(board.link_path("pr", "KAN-3")), "older removed");

    // identical timestamps: smallest stage name wins
    storyflow::fs::replace_symlink(target_of("KAN-4"), board.link_path("testing", "KAN-4"));
    storyflow::fs::replace_symlink(target_of("KAN-4"), board.link_path("pr", "KAN-4"));
    set_link_mtime(board.link_path("testing", "KAN-4"), 6000);
    set_link_mtime(board.link_path("pr", "KAN-4"), 6000);
    expect(board.current_stage(ctx, "KAN-4").value() == "pr", "tie-break by name");
    expect(board.current_stage(ctx, "KAN-4").value() == "pr", "repair is stable");

    // while another invocation holds the story lock: report, do not repair, Busy on moves
    storyflow::fs::replace_symlink(target_of("KAN-5"), board.link_path("planning", "KAN-5"));
    storyflow::fs::replace_symlink(target_of("KAN-5"), board.link_path("complete", "KAN-5"));
    set_link_mtime(board.link_path("planning", "KAN-5"), 7000);
    set_link_mtime(board.link_path("complete", "KAN-5"), 8000);
    {
      auto held = storyflow::FileLock::acquire(project.locks_dir() / "KAN-5.lock",
                                               std::chrono::milliseconds(0));
      expect(held.has_value(), "test holds the lock");
      expect(board.current_stage(ctx, "KAN-5").value() == "complete", "winner reported");
      expect(storyflow::fs::is_symlink(board.link_path("planning", "KAN-5")), "no repair under lock");
      auto busy = board.transition(ctx, "KAN-5", std::nullopt, "pr");
      expect(!busy.ok() && busy.error().kind == storyflow::ErrorKind::Busy, "busy");
    }
    expect(board.current_stage(ctx, "KAN-5").value() == "complete", "repaired after release");
    expect(!storyflow::fs::is_symlink(board.link_path("planning", "KAN-5")), "loser removed");

    // dangling links are reported, not thrown
    storyflow::fs::replace_symlink(target_of("KAN-99"), board.link_path("complete", "KAN-99"));
    auto listing = board.list_stage(ctx, "complete");
    expect(listing.ok(), "listing with a dangling link");
    expect(has_story(listing.value(), "KAN-5"), "healthy story still listed");
    expect(listing.value().problems.size() == 1 &&
               listing.value().problems[0].kind == storyflow::ErrorKind::StateConflict,
           "dangling link reported");

    // removal drops every link of a story together with its file
    auto erased = board.remove_story(ctx, "KAN-99");
    expect(erased.ok() && erased.value() == 1, "dangling link removed");
    auto erased_live = board.remove_story(ctx, "KAN-1");
    expect(erased_live.ok() && erased_live.value() == 1, "live link removed");
    expect(!stories.exists("KAN-1"), "story file removed");
    expect(board.current_stage(ctx, "KAN-1").error().kind == storyflow::ErrorKind::NotFound,
           "removed story is gone");
    expect(board.transition(ctx, "KAN-1", std::nullopt, "planning").error().kind ==
               storyflow::ErrorKind::NotFound,
           "removed story cannot move");

    // different stories move concurrently without blocking each other
    std::vector<std::thread> workers;
    std::atomic<int> failures{0};
    for (int i = 6; i <= 12; ++i) {
      workers.emplace_back([&, i] {
        const std::string id = "KAN-" + std::to_string(i);
        auto lctx = storyflow::Context::quiet();
        for (const char *s : {"planning", "in-progress", "testing"}) {
          if (!board.transition(lctx, id, std::nullopt, s).ok())
            ++failures;
        }
      });
    }
    for (auto &w : workers)
      w.join();
    expect(failures == 0, "independent stories never busy");
    for (int i = 6; i <= 12; ++i)
      expect(board.current_stage(ctx, "KAN-" + std::to_string(i)).value() == "testing",
             "final stage of KAN-" + std::to_string(i));

    // one story moved by racing invocations ends up in exactly one stage
    storyflow::KanbanStateMachine patient{project, stories, std::chrono::seconds(10)};
    workers.clear();
    const std::vector<std::string> targets = {"planning", "in-progress", "testing", "pr",
                                              "complete"};
    for (const auto &target : targets) {
      workers.emplace_back([&, target] {
        auto lctx = storyflow::Context::quiet();
        for (int round = 0; round < 5; ++round) {
          if (!patient.transition(lctx, "KAN-6", std::nullopt, target).ok())
            ++failures;
        }
      });
    }
    for (auto &w : workers)
      w.join();
    expect(failures == 0, "same-story moves serialize");
    int links = 0;
    for (const auto &s : targets)
      links += storyflow::fs::is_symlink(board.link_path(s, "KAN-6")) ? 1 : 0;
    expect(links == 1, "exactly one link after racing moves");
    expect(!fs::exists(project.locks_dir() / "KAN-6.pending"), "no marker left");

    std::cout << "kanban test OK\n";
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
