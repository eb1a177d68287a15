#pragma once
#include "storyflow/config.hpp"
#include "storyflow/consts.hpp"
#include "storyflow/context.hpp"
#include "storyflow/error.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow {

// Story prefix derived from a project name: lowercase, drop a trailing run of
// '-', '_' and digits, keep five characters, upper-case, pad with 'X'.
//   "filter" -> "FILTE", "app" -> "APPXX", "project_2024" -> "PROJE"
auto generate_prefix(std::string_view project_name) -> std::string;

// The managing installation: a home directory holding the registry of every
// project's prefix and the global configuration layer.
class Installation {
public:
  explicit Installation(std::filesystem::path home);

  // $STORYFLOW_HOME, else $HOME/.storyflow
  static Installation from_env();

  [[nodiscard]] const std::filesystem::path& home() const { return home_; }
  [[nodiscard]] auto registry_file() const -> std::filesystem::path {
    return home_ / consts::kRegistryFile;
  }
  [[nodiscard]] auto registry_lock() const -> std::filesystem::path {
    return home_ / consts::kRegistryLock;
  }
  [[nodiscard]] auto global_config() const -> std::filesystem::path {
    return home_ / consts::kGlobalConfig;
  }

  // prefix (upper-case) -> project data directory
  [[nodiscard]] auto registered() const -> std::map<std::string, std::filesystem::path>;

  // Reserve `prefix` for `data_dir`. Validation error if another project owns it.
  auto register_project(std::string_view prefix, const std::filesystem::path& data_dir,
                        std::chrono::milliseconds lock_timeout) const -> Result<void>;

  // Drop every entry pointing at `data_dir`.
  auto unregister_project(const std::filesystem::path& data_dir,
                          std::chrono::milliseconds lock_timeout) const -> Result<void>;

private:
  std::filesystem::path home_;
};

struct ProjectOptions {
  std::string name;   // defaults to the directory name
  std::string prefix; // defaults to generate_prefix(name)
  std::vector<std::string> remotes;
  std::vector<std::string> maintainers;
  std::vector<std::string> stages; // defaults to consts::kDefaultStages
};

struct StageCount {
  std::string stage;
  std::size_t count = 0;
};

struct ProjectInfo {
  std::filesystem::path project_path;
  std::filesystem::path data_dir;
  std::string name;
  std::string prefix;
  std::size_t total_stories = 0;
  std::size_t unstarted = 0;
  std::vector<StageCount> stages;
  std::vector<std::string> remotes;
  std::vector<std::string> maintainers;
};

// A project directory and its .storyflow data directory.
class Project {
public:
  // Open an existing project at `project_path`.
  static auto open(const std::filesystem::path& project_path) -> Result<Project>;

  // Create the data directory, register the prefix and write config + README.
  static auto create(Context& ctx, const std::filesystem::path& project_path,
                     const ProjectOptions& options, const Installation& installation)
      -> Result<Project>;

  // Core paths
  [[nodiscard]] const std::filesystem::path& project_path() const { return project_path_; }
  [[nodiscard]] auto data_dir() const -> std::filesystem::path {
    return project_path_ / consts::kDataDir;
  }
  [[nodiscard]] auto stories_dir() const -> std::filesystem::path {
    return data_dir() / consts::kStoriesDir;
  }
  [[nodiscard]] auto kanban_dir() const -> std::filesystem::path {
    return data_dir() / consts::kKanbanDir;
  }
  [[nodiscard]] auto stage_dir(std::string_view stage) const -> std::filesystem::path {
    return kanban_dir() / stage;
  }
  [[nodiscard]] auto locks_dir() const -> std::filesystem::path {
    return data_dir() / consts::kLocksDir;
  }
  [[nodiscard]] auto templates_dir() const -> std::filesystem::path {
    return data_dir() / consts::kTemplatesDir;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return data_dir() / consts::kConfigFile;
  }
  [[nodiscard]] auto audit_log() const -> std::filesystem::path {
    return data_dir() / consts::kAuditLog;
  }
  [[nodiscard]] auto default_workspace_root() const -> std::filesystem::path {
    return data_dir() / consts::kWorkspacesDir;
  }

  [[nodiscard]] const ProjectConfig& config() const { return config_; }
  [[nodiscard]] bool has_stage(std::string_view stage) const;
  [[nodiscard]] auto initial_stage() const -> const std::string& { return config_.stages.front(); }

  // Re-read config.yml (other processes may have advanced the story counter).
  auto reload() -> Result<void>;

  // Read-modify-write of config.yml under the project lock.
  auto bump_story_number(std::chrono::milliseconds lock_timeout) -> Result<long long>;

private:
  Project(std::filesystem::path project_path, ProjectConfig config);

  std::filesystem::path project_path_;
  ProjectConfig config_;
};

// Fails unless the data directory exists and has stories/ and kanban/.
auto check_structure(const std::filesystem::path& project_path) -> Result<void>;

} // namespace storyflow
