#pragma once
#include "storyflow/context.hpp"
#include "storyflow/error.hpp"
#include "storyflow/project.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow {

struct RepositoryRef {
  std::string url;
  std::string branch_strategy; // empty = project branch template
};

// Canonical story record. The stage is deliberately absent: it is derived
// from the board by KanbanStateMachine.
struct Story {
  std::string id;
  std::string title;
  std::string description;
  std::string created_at;
  std::optional<RepositoryRef> repository;
  std::filesystem::path file;
};

struct StoryDraft {
  std::string title;
  std::string description;
  std::optional<RepositoryRef> repository;
};

// Discovery result: records that parsed plus the files that did not.
struct StoryIndex {
  std::vector<Story> stories;
  std::vector<Error> problems;
};

// Owns the story files under <data>/stories.
class StoryRegistry {
public:
  StoryRegistry(Project& project, std::chrono::milliseconds lock_timeout);

  [[nodiscard]] auto file_for(std::string_view id) const -> std::filesystem::path;
  [[nodiscard]] bool exists(std::string_view id) const;

  // Next unused "<PREFIX>-<n>"; the counter is persisted before returning.
  auto allocate_id(Context& ctx) -> Result<std::string>;

  // Write a new story file. Fails if the id already has a file.
  auto create(Context& ctx, const std::string& id, const StoryDraft& draft) -> Result<Story>;

  auto load(std::string_view id) const -> Result<Story>;

  // All story files, sorted by sequence number.
  auto discover() const -> StoryIndex;

  // Remove the story file. Callers route this through KanbanStateMachine.
  auto remove(Context& ctx, std::string_view id) -> Result<void>;

private:
  Project& project_;
  std::chrono::milliseconds lock_timeout_;
};

auto render_story(const std::string& id, const StoryDraft& draft, std::string_view created_at)
    -> std::string;

// Parse story markdown. The file stem is the fallback title.
auto parse_story(std::string_view id, std::string_view text) -> Story;

// Trailing sequence number of an id ("FILTE-12" -> 12); nullopt if none.
auto story_number(std::string_view id) -> std::optional<long long>;

// Ids become file and link names: no separators, no leading dot.
bool is_valid_story_id(std::string_view id);

} // namespace storyflow
