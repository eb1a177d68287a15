#pragma once
#include "storyflow/error.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storyflow {

// Top level of a YAML configuration file: scalar values and lists of
// scalars. An empty value ("key:") reads as an empty list.
struct ConfigDoc {
  std::map<std::string, std::string> scalars;
  std::map<std::string, std::vector<std::string>> lists;
};

// Validation error on malformed YAML or nested mappings; `source` names the
// file in messages.
auto parse_config(std::string_view text, std::string_view source) -> Result<ConfigDoc>;

// One configuration source. Unset fields defer to lower-precedence layers.
struct SettingsLayer {
  std::optional<std::filesystem::path> workspace_root;
  std::optional<int> lock_timeout_seconds;
  std::optional<int> clone_retries;
  std::optional<int> clone_timeout_seconds;
  std::optional<int> retry_backoff_ms;
  std::optional<int> fetch_staleness_seconds;
  std::optional<std::string> branch_template;
};

// Fields set in `over` replace those of `base`.
auto merge(const SettingsLayer& base, const SettingsLayer& over) -> SettingsLayer;

// Read the settings keys of `doc`. Relative paths are resolved against
// `base_dir`; `source` names the file in error messages.
auto layer_from_doc(const ConfigDoc& doc, const std::filesystem::path& base_dir,
                    std::string_view source) -> Result<SettingsLayer>;

// Missing file -> empty layer.
auto load_layer(const std::filesystem::path& file, const std::filesystem::path& base_dir)
    -> Result<SettingsLayer>;

// STORYFLOW_LOCK_TIMEOUT
auto environment_layer() -> Result<SettingsLayer>;

// STORYFLOW_NON_INTERACTIVE
auto non_interactive_from_env() -> bool;

// Effective settings after the merge, with defaults filled in.
struct Settings {
  std::filesystem::path workspace_root;
  std::chrono::seconds lock_timeout{};
  int clone_retries = 0;
  std::chrono::seconds clone_timeout{};
  std::chrono::milliseconds retry_backoff{};
  std::chrono::seconds fetch_staleness{};
  std::string branch_template;
  bool non_interactive = false;
};

auto resolve(const SettingsLayer& merged, const std::filesystem::path& default_workspace_root)
    -> Settings;

// Layers in increasing precedence.
struct ConfigLayers {
  SettingsLayer global;
  SettingsLayer project;
  SettingsLayer workspace;
  SettingsLayer environment;
};

// global < project < workspace < environment
auto resolve_layers(const ConfigLayers& layers,
                    const std::filesystem::path& default_workspace_root) -> Settings;

// The project's own file: identity, stages, remotes plus optional overrides.
struct ProjectConfig {
  std::string project_name;
  std::string prefix;
  long long last_story_number = 0;
  std::string created_at;
  std::vector<std::string> stages;
  std::vector<std::string> remotes;
  std::vector<std::string> maintainers;
  SettingsLayer overrides;
  // settings and unknown keys exactly as written, so a save keeps them
  std::map<std::string, std::string> extra;
  std::map<std::string, std::vector<std::string>> extra_lists;
};

auto load_project_config(const std::filesystem::path& file,
                         const std::filesystem::path& project_path) -> Result<ProjectConfig>;

// Overwrites the file atomically. Throws std::runtime_error on I/O failure.
void save_project_config(const std::filesystem::path& file, const ProjectConfig& cfg);

} // namespace storyflow
