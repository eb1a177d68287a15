#include "storyflow/kanban.hpp"

#include "storyflow/consts.hpp"
#include "storyflow/fs.hpp"
#include "storyflow/lock.hpp"
#include "storyflow/util.hpp"

#include <algorithm>
#include <system_error>

namespace stdfs = std::filesystem;

namespace storyflow {

namespace {

// Relative target of a stage link: kanban/<stage>/<id> -> ../../stories/<id>.md
stdfs::path link_target(std::string_view id) {
  return stdfs::path("..") / ".." / consts::kStoriesDir /
         (std::string(id) + std::string(consts::kStoryExt));
}

Error busy(std::string_view id) {
  return make_error(ErrorKind::Busy, "story " + std::string(id) + " is locked by another invocation",
                    "retry later or raise lock_timeout_seconds");
}

} // namespace

KanbanStateMachine::KanbanStateMachine(const Project &project, StoryRegistry &stories,
                                       std::chrono::milliseconds lock_timeout)
    : project_(project), stories_(stories), lock_timeout_(lock_timeout) {}

auto KanbanStateMachine::link_path(std::string_view stage, std::string_view id) const
    -> stdfs::path {
  return project_.stage_dir(stage) / std::string(id);
}

auto KanbanStateMachine::lock_path(std::string_view id) const -> stdfs::path {
  return project_.locks_dir() / (std::string(id) + std::string(consts::kLockExt));
}

auto KanbanStateMachine::marker_path(std::string_view id) const -> stdfs::path {
  return project_.locks_dir() / (std::string(id) + std::string(consts::kPendingExt));
}

auto KanbanStateMachine::pending_stage(std::string_view id) const -> std::optional<std::string> {
  const auto marker = marker_path(id);
  if (!fs::exists(marker))
    return std::nullopt;
  try {
    const auto text = fs::read_text(marker);
    auto stage = strutil::trim(std::string_view(text).substr(0, text.find('\n')));
    if (stage.empty() || !project_.has_stage(stage))
      return std::nullopt;
    return stage;
  } catch (const std::exception &) {
    // removed between the check and the read: the transition finished
    return std::nullopt;
  }
}

auto KanbanStateMachine::scan_links(std::string_view id) const -> std::vector<LinkInfo> {
  std::vector<LinkInfo> links;
  for (const auto &stage : project_.config().stages) {
    const auto mtime = fs::link_mtime_ns(link_path(stage, id));
    if (mtime)
      links.push_back(LinkInfo{.stage = stage, .mtime_ns = *mtime});
  }
  return links;
}

auto KanbanStateMachine::pick_winner(const std::vector<LinkInfo> &links,
                                     const std::optional<std::string> &pending) const
    -> std::string {
  if (pending) {
    const bool present = std::ranges::any_of(links, [&](const LinkInfo &l) {
      return l.stage == *pending;
    });
    if (present)
      return *pending;
  }
  const auto best = std::ranges::min_element(links, [](const LinkInfo &a, const LinkInfo &b) {
    if (a.mtime_ns != b.mtime_ns)
      return a.mtime_ns > b.mtime_ns;
    return a.stage < b.stage;
  });
  return best->stage;
}

auto KanbanStateMachine::repair_locked(Context &ctx, std::string_view id)
    -> std::optional<std::string> {
  const auto links = scan_links(id);
  const auto pending = pending_stage(id);
  std::optional<std::string> winner;
  if (!links.empty()) {
    winner = pick_winner(links, pending);
    for (const auto &l : links) {
      if (l.stage == *winner)
        continue;
      fs::remove_entry(link_path(l.stage, id));
      ctx.log().warn("story {}: removed duplicate link in stage {} (kept {})", id, l.stage,
                     *winner);
    }
  }
  // holding the lock means no transition is in flight; any marker is left over
  if (fs::remove_entry(marker_path(id)))
    ctx.log().warn("story {}: cleared interrupted transition marker", id);
  return winner;
}

auto KanbanStateMachine::current_stage(Context &ctx, std::string_view id)
    -> Result<std::optional<std::string>> {
  if (!stories_.exists(id)) {
    return make_error(ErrorKind::NotFound, "story " + std::string(id) + " not found");
  }
  try {
    const auto links = scan_links(id);
    const auto pending = pending_stage(id);
    if (links.size() <= 1 && !fs::exists(marker_path(id))) {
      if (links.empty())
        return std::optional<std::string>{};
      return std::optional<std::string>{links.front().stage};
    }
    // repair only when nobody else is working on the story
    if (auto lock = FileLock::acquire(lock_path(id), std::chrono::milliseconds(0))) {
      return repair_locked(ctx, id);
    }
    if (links.empty())
      return std::optional<std::string>{};
    auto stage = pick_winner(links, pending);
    ctx.log().debug("story {}: transition in flight, reporting {}", id, stage);
    return std::optional<std::string>{std::move(stage)};
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
}

auto KanbanStateMachine::transition(Context &ctx, std::string_view id,
                                    const std::optional<std::string> &from, const std::string &to)
    -> Result<Transition> {
  if (!project_.has_stage(to)) {
    return make_error(ErrorKind::Validation, "unknown stage '" + to + "'",
                      "configured stages: " + strutil::join(project_.config().stages, ", "));
  }
  if (from && !project_.has_stage(*from)) {
    return make_error(ErrorKind::Validation, "unknown stage '" + *from + "'",
                      "configured stages: " + strutil::join(project_.config().stages, ", "));
  }
  if (!stories_.exists(id)) {
    return make_error(ErrorKind::NotFound, "story " + std::string(id) + " not found");
  }

  try {
    auto lock = FileLock::acquire(lock_path(id), lock_timeout_);
    if (!lock)
      return busy(id);
    // a delete may have finished while we waited for the lock
    if (!stories_.exists(id)) {
      return make_error(ErrorKind::NotFound, "story " + std::string(id) + " not found");
    }

    const auto current = repair_locked(ctx, id);
    Transition t{.story_id = std::string(id), .from = current, .to = to, .changed = false};
    if (current && *current == to) {
      ctx.log().debug("story {} already in {}", id, to);
      return t;
    }
    if (from && current != from) {
      return make_error(ErrorKind::Validation,
                        "story " + std::string(id) + " is in " +
                            current.value_or("no stage") + ", not " + *from);
    }

    const auto new_link = link_path(to, id);
    fs::write_text_atomic(marker_path(id), to + "\n");
    fs::replace_symlink(link_target(id), new_link);
    if (!fs::exists(new_link)) {
      // the link must resolve before the old one goes away
      fs::remove_entry(new_link);
      fs::remove_entry(marker_path(id));
      return make_error(ErrorKind::StateConflict,
                        "new link " + new_link.string() + " does not resolve to the story file");
    }
    if (current)
      fs::remove_entry(link_path(*current, id));
    fs::remove_entry(marker_path(id));

    t.changed = true;
    ctx.log().info("moved {} from {} to {}", id, current.value_or("unstarted"), to);
    return t;
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
}

auto KanbanStateMachine::list_stage(Context &ctx, std::string_view stage) const
    -> Result<StageListing> {
  if (!project_.has_stage(stage)) {
    return make_error(ErrorKind::Validation, "unknown stage '" + std::string(stage) + "'",
                      "configured stages: " + strutil::join(project_.config().stages, ", "));
  }
  StageListing listing;
  listing.stage = std::string(stage);

  const auto dir = project_.stage_dir(stage);
  std::error_code ec;
  stdfs::directory_iterator it(dir, ec);
  if (ec == std::errc::no_such_file_or_directory) {
    // a stage added to the configuration after the board was laid out
    auto err = make_error(ErrorKind::StateConflict, "stage directory " + dir.string() + " is missing",
                          "create it with 'mkdir -p " + dir.string() + "'");
    ctx.log().warn("{}", err.message);
    listing.problems.push_back(std::move(err));
    return listing;
  }
  if (ec) {
    return make_error(ErrorKind::Io, "cannot read " + dir.string() + ": " + ec.message());
  }
  for (const auto &entry : it) {
    const std::string id = entry.path().filename().string();
    if (id.empty() || id.front() == '.')
      continue; // temp links of an in-flight rename
    if (const auto pending = pending_stage(id); pending && *pending != stage &&
                                                fs::is_symlink(link_path(*pending, id))) {
      continue; // moving away from this stage
    }
    if (!fs::exists(entry.path())) {
      auto err = make_error(ErrorKind::StateConflict,
                            "dangling link " + entry.path().string() + " (story " + id +
                                " has no record)",
                            "run 'storyflow story delete " + id + " --force' to remove it");
      ctx.log().warn("{}", err.message);
      listing.problems.push_back(std::move(err));
      continue;
    }
    auto story = stories_.load(id);
    if (!story) {
      listing.problems.push_back(std::move(story.error()));
      continue;
    }
    listing.stories.push_back(std::move(story).value());
  }
  std::ranges::sort(listing.stories, [](const Story &a, const Story &b) {
    const auto na = story_number(a.id);
    const auto nb = story_number(b.id);
    if (na && nb && *na != *nb)
      return *na < *nb;
    return a.id < b.id;
  });
  return listing;
}

auto KanbanStateMachine::remove_story(Context &ctx, std::string_view id) -> Result<std::size_t> {
  try {
    auto lock = FileLock::acquire(lock_path(id), lock_timeout_);
    if (!lock)
      return busy(id);
    std::size_t removed = 0;
    std::error_code ec;
    // every stage directory, configured or not
    for (const auto &entry : stdfs::directory_iterator(project_.kanban_dir(), ec)) {
      if (!entry.is_directory())
        continue;
      if (fs::remove_entry(entry.path() / std::string(id)))
        ++removed;
    }
    if (ec) {
      return make_error(ErrorKind::Io,
                        "cannot read " + project_.kanban_dir().string() + ": " + ec.message());
    }
    fs::remove_entry(marker_path(id));
    ctx.log().info("removed {} stage link(s) of {}", removed, id);
    if (stories_.exists(id)) {
      if (auto ok = stories_.remove(ctx, id); !ok)
        return std::move(ok.error());
    }
    return removed;
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
}

} // namespace storyflow
