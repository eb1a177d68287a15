#include "storyflow/config.hpp"

#include "storyflow/consts.hpp"
#include "storyflow/fs.hpp"
#include "storyflow/util.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace storyflow {

namespace {

constexpr std::string_view kWorkspaceRoot = "workspace_root";
constexpr std::string_view kLockTimeout = "lock_timeout_seconds";
constexpr std::string_view kCloneRetries = "clone_retries";
constexpr std::string_view kCloneTimeout = "clone_timeout_seconds";
constexpr std::string_view kRetryBackoff = "retry_backoff_ms";
constexpr std::string_view kFetchStaleness = "fetch_staleness_seconds";
constexpr std::string_view kBranchTemplate = "branch_template";

constexpr std::string_view kProjectName = "project_name";
constexpr std::string_view kPrefix = "prefix";
constexpr std::string_view kLastStory = "last_story_number";
constexpr std::string_view kCreatedAt = "created_at";
constexpr std::string_view kStages = "kanban_stages";
constexpr std::string_view kRemotes = "remotes";
constexpr std::string_view kMaintainers = "maintainers";

Error bad_number(std::string_view source, std::string_view key, std::string_view value) {
  return make_error(ErrorKind::Validation, std::string(source) + ": " + std::string(key) +
                                               ": expected a non-negative integer, got '" +
                                               std::string(value) + "'");
}

// Reads doc[key] into `out` if present; false on a malformed value.
bool read_int(const ConfigDoc &doc, std::string_view key, std::optional<int> &out) {
  const auto it = doc.scalars.find(std::string(key));
  if (it == doc.scalars.end())
    return true;
  const auto v = strutil::parse_int(it->second);
  if (!v || *v > std::numeric_limits<int>::max())
    return false;
  out = static_cast<int>(*v);
  return true;
}

} // namespace

Result<ConfigDoc> parse_config(std::string_view text, std::string_view source) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::Exception &e) {
    return make_error(ErrorKind::Validation, std::string(source) + ": " + e.what());
  }
  ConfigDoc doc;
  if (!root || root.IsNull())
    return doc; // empty file
  if (!root.IsMap()) {
    return make_error(ErrorKind::Validation,
                      std::string(source) + ": expected a mapping of keys to values");
  }
  for (const auto &entry : root) {
    const auto key = entry.first.as<std::string>();
    const YAML::Node &value = entry.second;
    if (value.IsNull()) {
      doc.lists[key]; // "key:" with nothing after it is an empty list
    } else if (value.IsScalar()) {
      doc.scalars[key] = value.Scalar();
    } else if (value.IsSequence()) {
      auto &items = doc.lists[key];
      for (const auto &item : value) {
        if (!item.IsScalar()) {
          return make_error(ErrorKind::Validation,
                            std::string(source) + ": " + key + ": expected a list of strings");
        }
        items.push_back(item.Scalar());
      }
    } else {
      return make_error(ErrorKind::Validation,
                        std::string(source) + ": " + key + ": nested mappings are not supported");
    }
  }
  return doc;
}

SettingsLayer merge(const SettingsLayer &base, const SettingsLayer &over) {
  SettingsLayer out = base;
  if (over.workspace_root)
    out.workspace_root = over.workspace_root;
  if (over.lock_timeout_seconds)
    out.lock_timeout_seconds = over.lock_timeout_seconds;
  if (over.clone_retries)
    out.clone_retries = over.clone_retries;
  if (over.clone_timeout_seconds)
    out.clone_timeout_seconds = over.clone_timeout_seconds;
  if (over.retry_backoff_ms)
    out.retry_backoff_ms = over.retry_backoff_ms;
  if (over.fetch_staleness_seconds)
    out.fetch_staleness_seconds = over.fetch_staleness_seconds;
  if (over.branch_template)
    out.branch_template = over.branch_template;
  return out;
}

Result<SettingsLayer> layer_from_doc(const ConfigDoc &doc, const std::filesystem::path &base_dir,
                                     std::string_view source) {
  SettingsLayer layer;
  if (const auto it = doc.scalars.find(std::string(kWorkspaceRoot)); it != doc.scalars.end()) {
    std::filesystem::path p{it->second};
    layer.workspace_root = p.is_absolute() ? p : (base_dir / p).lexically_normal();
  }
  const std::pair<std::string_view, std::optional<int> *> ints[] = {
      {kLockTimeout, &layer.lock_timeout_seconds},
      {kCloneRetries, &layer.clone_retries},
      {kCloneTimeout, &layer.clone_timeout_seconds},
      {kRetryBackoff, &layer.retry_backoff_ms},
      {kFetchStaleness, &layer.fetch_staleness_seconds},
  };
  for (const std::string_view key : {kWorkspaceRoot, kLockTimeout, kCloneRetries, kCloneTimeout,
                                     kRetryBackoff, kFetchStaleness, kBranchTemplate}) {
    if (const auto it = doc.lists.find(std::string(key)); it != doc.lists.end() &&
                                                          !it->second.empty()) {
      return make_error(ErrorKind::Validation,
                        std::string(source) + ": " + std::string(key) + ": expected a single value");
    }
  }
  for (const auto &[key, slot] : ints) {
    if (!read_int(doc, key, *slot))
      return bad_number(source, key, doc.scalars.at(std::string(key)));
  }
  if (const auto it = doc.scalars.find(std::string(kBranchTemplate)); it != doc.scalars.end())
    layer.branch_template = it->second;
  return layer;
}

Result<SettingsLayer> load_layer(const std::filesystem::path &file,
                                 const std::filesystem::path &base_dir) {
  if (!fs::exists(file))
    return SettingsLayer{};
  std::string text;
  try {
    text = fs::read_text(file);
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
  auto doc = parse_config(text, file.string());
  if (!doc)
    return std::move(doc.error());
  return layer_from_doc(doc.value(), base_dir, file.string());
}

Result<SettingsLayer> environment_layer() {
  SettingsLayer layer;
  if (const char *v = std::getenv(consts::kEnvLockTimeout); v && *v) {
    const auto n = strutil::parse_int(v);
    if (!n || *n > std::numeric_limits<int>::max())
      return bad_number("environment", consts::kEnvLockTimeout, v);
    layer.lock_timeout_seconds = static_cast<int>(*n);
  }
  return layer;
}

bool non_interactive_from_env() {
  const char *v = std::getenv(consts::kEnvNonInteractive);
  if (!v)
    return false;
  const auto s = strutil::to_lower(strutil::trim(v));
  return s == "1" || s == "true" || s == "yes" || s == "on";
}

Settings resolve(const SettingsLayer &merged, const std::filesystem::path &default_workspace_root) {
  Settings s;
  s.workspace_root = merged.workspace_root.value_or(default_workspace_root);
  s.lock_timeout =
      std::chrono::seconds(merged.lock_timeout_seconds.value_or(consts::kDefaultLockTimeoutSeconds));
  s.clone_retries = merged.clone_retries.value_or(consts::kDefaultCloneRetries);
  s.clone_timeout = std::chrono::seconds(
      merged.clone_timeout_seconds.value_or(consts::kDefaultCloneTimeoutSeconds));
  s.retry_backoff =
      std::chrono::milliseconds(merged.retry_backoff_ms.value_or(consts::kDefaultRetryBackoffMs));
  s.fetch_staleness = std::chrono::seconds(
      merged.fetch_staleness_seconds.value_or(consts::kDefaultFetchStaleSeconds));
  s.branch_template =
      merged.branch_template.value_or(std::string(consts::kDefaultBranchTemplate));
  s.non_interactive = non_interactive_from_env();
  return s;
}

Settings resolve_layers(const ConfigLayers &layers,
                        const std::filesystem::path &default_workspace_root) {
  // a workspace-level file lives inside the workspace root, so it cannot move it
  SettingsLayer workspace = layers.workspace;
  workspace.workspace_root.reset();
  SettingsLayer merged = merge(layers.global, layers.project);
  merged = merge(merged, workspace);
  merged = merge(merged, layers.environment);
  return resolve(merged, default_workspace_root);
}

Result<ProjectConfig> load_project_config(const std::filesystem::path &file,
                                          const std::filesystem::path &project_path) {
  std::string text;
  try {
    text = fs::read_text(file);
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
  auto parsed = parse_config(text, file.string());
  if (!parsed)
    return std::move(parsed.error());
  const ConfigDoc &doc = parsed.value();

  ProjectConfig cfg;
  const auto scalar = [&](std::string_view key) -> std::string {
    const auto it = doc.scalars.find(std::string(key));
    return it == doc.scalars.end() ? std::string{} : it->second;
  };
  cfg.project_name = scalar(kProjectName);
  cfg.prefix = scalar(kPrefix);
  cfg.created_at = scalar(kCreatedAt);
  if (cfg.prefix.empty()) {
    return make_error(ErrorKind::Validation, file.string() + ": missing 'prefix'");
  }
  if (const auto last = scalar(kLastStory); !last.empty()) {
    const auto n = strutil::parse_int(last);
    if (!n)
      return bad_number(file.string(), kLastStory, last);
    cfg.last_story_number = *n;
  }
  for (const std::string_view key : {kStages, kRemotes, kMaintainers}) {
    if (doc.scalars.contains(std::string(key))) {
      return make_error(ErrorKind::Validation,
                        file.string() + ": " + std::string(key) + ": expected a list",
                        "write it as '" + std::string(key) + ": [a, b]' or one '- item' per line");
    }
  }
  if (const auto it = doc.lists.find(std::string(kStages)); it != doc.lists.end())
    cfg.stages = it->second;
  if (cfg.stages.empty()) {
    for (const auto s : consts::kDefaultStages)
      cfg.stages.emplace_back(s);
  }
  if (const auto it = doc.lists.find(std::string(kRemotes)); it != doc.lists.end())
    cfg.remotes = it->second;
  if (const auto it = doc.lists.find(std::string(kMaintainers)); it != doc.lists.end())
    cfg.maintainers = it->second;

  auto overrides = layer_from_doc(doc, project_path, file.string());
  if (!overrides)
    return std::move(overrides.error());
  cfg.overrides = std::move(overrides).value();

  for (const auto &[key, value] : doc.scalars) {
    if (key != kProjectName && key != kPrefix && key != kLastStory && key != kCreatedAt)
      cfg.extra[key] = value;
  }
  for (const auto &[key, items] : doc.lists) {
    if (key != kStages && key != kRemotes && key != kMaintainers)
      cfg.extra_lists[key] = items;
  }
  return cfg;
}

void save_project_config(const std::filesystem::path &file, const ProjectConfig &cfg) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << std::string(kProjectName) << YAML::Value << cfg.project_name;
  out << YAML::Key << std::string(kPrefix) << YAML::Value << cfg.prefix;
  out << YAML::Key << std::string(kLastStory) << YAML::Value << cfg.last_story_number;
  out << YAML::Key << std::string(kCreatedAt) << YAML::Value << cfg.created_at;
  const auto write_list = [&out](std::string_view key, const std::vector<std::string> &items) {
    out << YAML::Key << std::string(key) << YAML::Value;
    if (items.empty())
      out << YAML::Flow;
    out << YAML::BeginSeq;
    for (const auto &item : items)
      out << item;
    out << YAML::EndSeq;
  };
  write_list(kStages, cfg.stages);
  write_list(kRemotes, cfg.remotes);
  write_list(kMaintainers, cfg.maintainers);
  for (const auto &[key, value] : cfg.extra)
    out << YAML::Key << key << YAML::Value << value;
  for (const auto &[key, items] : cfg.extra_lists)
    write_list(key, items);
  out << YAML::EndMap;
  if (!out.good())
    throw std::runtime_error("cannot write " + file.string() + ": " + out.GetLastError());
  fs::write_text_atomic(file, std::string(out.c_str()) + "\n");
}

} // namespace storyflow
