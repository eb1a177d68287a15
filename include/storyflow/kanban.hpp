#pragma once
#include "storyflow/context.hpp"
#include "storyflow/error.hpp"
#include "storyflow/project.hpp"
#include "storyflow/story.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow {

// Stories of one stage plus the links that could not be resolved.
struct StageListing {
  std::string stage;
  std::vector<Story> stories;
  std::vector<Error> problems;
};

struct Transition {
  std::string story_id;
  std::optional<std::string> from; // nullopt = the story was unstarted
  std::string to;
  bool changed = false;
};

/*
 * Stage membership of stories, kept as symlinks
 *   kanban/<stage>/<id> -> ../../stories/<id>.md
 *
 * A story is in at most one stage; no link means unstarted. Transitions of one
 * story are serialized by locks/<id>.lock, and locks/<id>.pending records the
 * target stage while a transition is in flight.
 *
 * Duplicate links are resolved in this order:
 *   1. the stage named by the pending marker
 *   2. the link with the newest lstat mtime (nanoseconds)
 *   3. the lexicographically smallest stage name
 * Losing links are removed only when the story lock is free.
 */
class KanbanStateMachine {
public:
  KanbanStateMachine(const Project& project, StoryRegistry& stories,
                     std::chrono::milliseconds lock_timeout);

  // nullopt = unstarted. NotFound if the story has no record.
  auto current_stage(Context& ctx, std::string_view id) -> Result<std::optional<std::string>>;

  // Move `id` into `to`. With `from`, the story must currently be there.
  // Moving into the current stage is a no-op.
  auto transition(Context& ctx, std::string_view id, const std::optional<std::string>& from,
                  const std::string& to) -> Result<Transition>;

  // Lock-free read of one stage. Dangling links are reported in `problems`.
  auto list_stage(Context& ctx, std::string_view stage) const -> Result<StageListing>;

  // Remove every link, the pending marker and the story file of `id` under
  // one hold of the story lock. Returns the number of links removed.
  auto remove_story(Context& ctx, std::string_view id) -> Result<std::size_t>;

  [[nodiscard]] auto link_path(std::string_view stage, std::string_view id) const
      -> std::filesystem::path;

private:
  struct LinkInfo {
    std::string stage;
    std::int64_t mtime_ns = 0;
  };

  [[nodiscard]] auto lock_path(std::string_view id) const -> std::filesystem::path;
  [[nodiscard]] auto marker_path(std::string_view id) const -> std::filesystem::path;
  [[nodiscard]] auto pending_stage(std::string_view id) const -> std::optional<std::string>;
  [[nodiscard]] auto scan_links(std::string_view id) const -> std::vector<LinkInfo>;

  // Pick the surviving stage among `links` (non-empty).
  [[nodiscard]] auto pick_winner(const std::vector<LinkInfo>& links,
                                 const std::optional<std::string>& pending) const -> std::string;

  // Caller holds the story lock: drop duplicate links and a finished marker.
  auto repair_locked(Context& ctx, std::string_view id) -> std::optional<std::string>;

  const Project& project_;
  StoryRegistry& stories_;
  std::chrono::milliseconds lock_timeout_;
};

} // namespace storyflow
