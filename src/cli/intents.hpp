#pragma once
#include "cli/registry.hpp"
#include "storyflow/error.hpp"
#include "storyflow/project.hpp"
#include "storyflow/workbench.hpp"

#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace storyflow::cli {

// Result of scanning one command's arguments.
struct ParsedArgs {
  std::vector<std::string> positional;
  std::multimap<std::string, std::string> values;
  std::set<std::string> flags;

  [[nodiscard]] auto value(const std::string& name) const -> std::optional<std::string>;
  [[nodiscard]] auto all(const std::string& name) const -> std::vector<std::string>;
  [[nodiscard]] bool has(const std::string& name) const { return flags.contains(name); }
};

// `value_opts` take an argument ("--repo URL" or "--repo=URL"); `flag_opts`
// do not. "--" ends option parsing. Unknown options are a Validation error.
auto scan_args(const std::vector<std::string>& args,
               std::initializer_list<std::string_view> value_opts,
               std::initializer_list<std::string_view> flag_opts) -> Result<ParsedArgs>;

struct CommandLine {
  GlobalOptions globals;
  std::string command;
  std::vector<std::string> args;
};

// argv without the program name.
auto parse_command_line(const std::vector<std::string>& argv) -> Result<CommandLine>;

// project
struct ProjectCreate {
  std::optional<std::filesystem::path> path; // nullopt: the -p path
  ProjectOptions options;
};
struct ProjectDelete {
  std::optional<std::filesystem::path> path;
  bool force = false;
};
struct ProjectShow {
  std::optional<std::filesystem::path> path;
};
using ProjectIntent = std::variant<ProjectCreate, ProjectDelete, ProjectShow>;

// story
struct StoryCreate {
  CreateStoryRequest request;
};
struct StoryMove {
  std::string id;
  std::string to;
  std::optional<std::string> from;
};
struct StoryList {
  std::optional<std::string> stage;
};
struct StoryShow {
  std::string id;
};
struct StoryDelete {
  std::string id;
  bool force = false;
};
using StoryIntent = std::variant<StoryCreate, StoryMove, StoryList, StoryShow, StoryDelete>;

// workspace
struct WorkspaceProvision {
  std::string id;
  bool force = false;
};
struct WorkspaceShow {
  std::string id;
};
struct WorkspaceTeardown {
  std::string id;
  bool force = false;
};
struct WorkspaceFetch {
  std::string id;
};
using WorkspaceIntent =
    std::variant<WorkspaceProvision, WorkspaceShow, WorkspaceTeardown, WorkspaceFetch>;

auto parse_project_intent(const std::vector<std::string>& args) -> Result<ProjectIntent>;
auto parse_story_intent(const std::vector<std::string>& args) -> Result<StoryIntent>;
auto parse_workspace_intent(const std::vector<std::string>& args) -> Result<WorkspaceIntent>;

} // namespace storyflow::cli
