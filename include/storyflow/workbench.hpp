#pragma once
#include "storyflow/config.hpp"
#include "storyflow/context.hpp"
#include "storyflow/error.hpp"
#include "storyflow/git.hpp"
#include "storyflow/kanban.hpp"
#include "storyflow/process.hpp"
#include "storyflow/project.hpp"
#include "storyflow/scaffold.hpp"
#include "storyflow/story.hpp"
#include "storyflow/workspace.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace storyflow {

struct WorkbenchOptions {
  Installation installation;
  CommandRunner* runner = nullptr;      // nullptr: run the real git
  ScaffoldRenderer* renderer = nullptr; // nullptr: templates of the project
  std::function<bool(const Error&)> confirm_retry;
};

struct CreateStoryRequest {
  std::string title;
  std::string description;
  std::optional<std::string> repo; // nullopt: first project remote, if any
  std::string branch_strategy;
  std::optional<std::string> stage; // nullopt: first configured stage
  bool provision = true;
};

struct StoryView {
  Story story;
  std::optional<std::string> stage; // nullopt = unstarted
  std::optional<WorkspaceRecord> workspace;
};

struct BoardListing {
  std::vector<StoryView> entries;
  std::vector<Error> problems; // reported next to the partial result
};

// One open project with its components wired together. Multi-step commands
// are pipelines over the components and stop at the first failing step.
class Workbench {
  struct Key {
    explicit Key() = default;
  };

public:
  // Only open() can make the key.
  Workbench(Key, Project project, Settings settings, WorkbenchOptions options);

  static auto open(Context& ctx, const std::filesystem::path& project_path,
                   WorkbenchOptions options) -> Result<std::unique_ptr<Workbench>>;

  Workbench(const Workbench&) = delete;
  Workbench& operator=(const Workbench&) = delete;

  // resolve project -> allocate id -> create record -> provision workspace
  // -> enter initial stage
  auto create_story(Context& ctx, const CreateStoryRequest& request) -> Result<StoryView>;
  auto move_story(Context& ctx, const std::string& id, const std::string& to,
                  const std::optional<std::string>& from) -> Result<Transition>;
  // Every story with its stage, or only the stories of `stage`.
  auto list(Context& ctx, const std::optional<std::string>& stage) -> Result<BoardListing>;
  auto show(Context& ctx, const std::string& id) -> Result<StoryView>;
  // teardown workspace -> remove stage links and story file under the story lock
  auto delete_story(Context& ctx, const std::string& id, bool force) -> Result<void>;

  // provision -> enter the first stage if the story was unstarted
  auto provision(Context& ctx, const std::string& id, bool force) -> Result<WorkspaceRecord>;
  auto workspace_status(const std::string& id) -> Result<WorkspaceRecord>;
  auto teardown(Context& ctx, const std::string& id, bool force) -> Result<bool>;
  auto fetch(Context& ctx, const std::string& id) -> Result<bool>;

  auto info(Context& ctx) -> Result<ProjectInfo>;
  // Tear down every workspace, remove the data directory and release the prefix.
  auto delete_project(Context& ctx, bool force) -> Result<void>;

  [[nodiscard]] const Project& project() const { return project_; }
  [[nodiscard]] const Settings& settings() const { return settings_; }

private:
  Project project_;
  Settings settings_;
  Installation installation_;
  std::unique_ptr<CommandRunner> owned_runner_;
  std::unique_ptr<ScaffoldRenderer> owned_renderer_;
  StoryRegistry stories_;
  KanbanStateMachine kanban_;
  GitRepositoryManager git_;
  WorkspaceProvisioner provisioner_;
};

// Effective settings of a project: global, project, workspace and
// environment layers.
auto load_settings(const Project& project, const Installation& installation) -> Result<Settings>;

} // namespace storyflow
