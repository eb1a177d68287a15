#include "storyflow/project.hpp"

#include "storyflow/fs.hpp"
#include "storyflow/lock.hpp"
#include "storyflow/time.hpp"
#include "storyflow/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace stdfs = std::filesystem;

namespace {

std::string readme_text(const storyflow::ProjectConfig &cfg) {
  std::ostringstream os;
  os << "# " << cfg.project_name << "\n\n"
     << "This directory is managed by storyflow. Stories use the prefix `" << cfg.prefix
     << "`.\n\n"
     << "## Directory Structure\n\n"
     << "- `stories/` - canonical story markdown files\n"
     << "- `kanban/` - one directory per stage, holding links to stories\n";
  for (const auto &stage : cfg.stages)
    os << "  - `" << stage << "/`\n";
  os << "- `locks/` - lock files and transition markers (do not edit)\n"
     << "- `workspaces/` - per-story git working trees\n\n"
     << "## Usage\n\n"
     << "```bash\n"
     << "storyflow story create \"Story title\"\n"
     << "storyflow story move <story-id> <stage>\n"
     << "storyflow story list --stage " << cfg.stages.front() << "\n"
     << "storyflow workspace provision <story-id>\n"
     << "```\n";
  return os.str();
}

storyflow::Error io_error(const std::exception &e) {
  return storyflow::make_error(storyflow::ErrorKind::Io, e.what());
}

} // namespace

namespace storyflow {

std::string generate_prefix(std::string_view project_name) {
  std::string clean = strutil::to_lower(project_name);
  while (!clean.empty() &&
         (clean.back() == '-' || clean.back() == '_' ||
          std::isdigit(static_cast<unsigned char>(clean.back())))) {
    clean.pop_back();
  }
  if (clean.size() >= consts::kPrefixLen) {
    return strutil::to_upper(clean.substr(0, consts::kPrefixLen));
  }
  std::string prefix = strutil::to_upper(clean);
  prefix.resize(consts::kPrefixLen, consts::kPrefixPad);
  return prefix;
}

// Installation

Installation::Installation(stdfs::path home) : home_(std::move(home)) {}

Installation Installation::from_env() {
  if (const char *h = std::getenv(consts::kEnvHome); h && *h)
    return Installation{stdfs::path(h)};
  if (const char *h = std::getenv("HOME"); h && *h)
    return Installation{stdfs::path(h) / consts::kHomeDir};
  return Installation{stdfs::current_path() / consts::kHomeDir};
}

auto Installation::registered() const -> std::map<std::string, stdfs::path> {
  std::map<std::string, stdfs::path> out;
  if (!fs::exists(registry_file()))
    return out;
  std::istringstream iss(fs::read_text(registry_file()));
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    const auto tab = line.find('\t');
    if (line.empty() || line[0] == '#' || tab == std::string::npos)
      continue;
    out[strutil::to_upper(line.substr(0, tab))] = stdfs::path(line.substr(tab + 1));
  }
  return out;
}

namespace {

void write_registry(const stdfs::path &file, const std::map<std::string, stdfs::path> &entries) {
  std::string text;
  for (const auto &[prefix, dir] : entries)
    text += prefix + "\t" + dir.string() + "\n";
  fs::write_text_atomic(file, text);
}

} // namespace

auto Installation::register_project(std::string_view prefix, const stdfs::path &data_dir,
                                    std::chrono::milliseconds lock_timeout) const
    -> Result<void> {
  try {
    auto lock = FileLock::acquire(registry_lock(), lock_timeout);
    if (!lock) {
      return make_error(ErrorKind::Busy, "project registry is locked: " + registry_lock().string());
    }
    auto entries = registered();
    const std::string key = strutil::to_upper(prefix);
    if (const auto it = entries.find(key); it != entries.end() && it->second != data_dir) {
      // a registry entry whose project is gone is stale and may be reclaimed
      if (fs::exists(it->second)) {
        return make_error(ErrorKind::Validation,
                          "prefix '" + key + "' is already used by " + it->second.string(),
                          "choose another prefix with --prefix");
      }
    }
    entries[key] = data_dir;
    write_registry(registry_file(), entries);
    return {};
  } catch (const std::exception &e) {
    return io_error(e);
  }
}

auto Installation::unregister_project(const stdfs::path &data_dir,
                                      std::chrono::milliseconds lock_timeout) const
    -> Result<void> {
  try {
    auto lock = FileLock::acquire(registry_lock(), lock_timeout);
    if (!lock) {
      return make_error(ErrorKind::Busy, "project registry is locked: " + registry_lock().string());
    }
    auto entries = registered();
    std::erase_if(entries, [&](const auto &kv) { return kv.second == data_dir; });
    write_registry(registry_file(), entries);
    return {};
  } catch (const std::exception &e) {
    return io_error(e);
  }
}

// Project

Project::Project(stdfs::path project_path, ProjectConfig config)
    : project_path_(std::move(project_path)), config_(std::move(config)) {}

auto check_structure(const stdfs::path &project_path) -> Result<void> {
  const auto data = project_path / consts::kDataDir;
  if (!fs::exists(data)) {
    return make_error(ErrorKind::NotFound, "no storyflow project found at " + project_path.string(),
                      "run 'storyflow project create' first");
  }
  for (const auto sub : {consts::kStoriesDir, consts::kKanbanDir}) {
    if (!fs::exists(data / sub)) {
      return make_error(ErrorKind::StateConflict,
                        "missing required directory: " + (data / sub).string(),
                        "project structure may be corrupted");
    }
  }
  return {};
}

auto Project::open(const stdfs::path &project_path) -> Result<Project> {
  auto root = stdfs::absolute(project_path).lexically_normal();
  if (auto ok = check_structure(root); !ok)
    return std::move(ok.error());
  auto cfg = load_project_config(root / consts::kDataDir / consts::kConfigFile, root);
  if (!cfg)
    return std::move(cfg.error());
  return Project{std::move(root), std::move(cfg).value()};
}

auto Project::create(Context &ctx, const stdfs::path &project_path, const ProjectOptions &options,
                     const Installation &installation) -> Result<Project> {
  auto root = stdfs::absolute(project_path).lexically_normal();
  if (root.filename().empty())
    root = root.parent_path();
  const auto data = root / consts::kDataDir;
  if (fs::exists(data)) {
    return make_error(ErrorKind::Validation, "storyflow project already exists at " + data.string());
  }

  ProjectConfig cfg;
  cfg.project_name = options.name.empty() ? root.filename().string() : options.name;
  cfg.prefix = strutil::to_upper(options.prefix.empty() ? generate_prefix(cfg.project_name)
                                                        : options.prefix);
  cfg.created_at = timeutil::now_iso8601();
  cfg.stages = options.stages;
  if (cfg.stages.empty()) {
    for (const auto s : consts::kDefaultStages)
      cfg.stages.emplace_back(s);
  }
  cfg.remotes = options.remotes;
  cfg.maintainers = options.maintainers;

  const bool prefix_ok =
      !cfg.prefix.empty() && std::ranges::all_of(cfg.prefix, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
      });
  if (!prefix_ok) {
    return make_error(ErrorKind::Validation, "invalid prefix '" + cfg.prefix + "'",
                      "prefixes may contain letters, digits, '-' and '_'");
  }
  for (const auto &stage : cfg.stages) {
    if (stage.empty() || stage.front() == '.' || stage.find('/') != std::string::npos) {
      return make_error(ErrorKind::Validation, "invalid stage name '" + stage + "'");
    }
  }

  // registry first: a collision must stop creation before anything is written
  const auto lock_timeout = std::chrono::milliseconds(
      std::chrono::seconds(consts::kDefaultLockTimeoutSeconds));
  if (auto reg = installation.register_project(cfg.prefix, data, lock_timeout); !reg)
    return std::move(reg.error());

  try {
    fs::ensure_dir(data / consts::kStoriesDir);
    fs::ensure_dir(data / consts::kLocksDir);
    for (const auto &stage : cfg.stages) {
      fs::ensure_dir(data / consts::kKanbanDir / stage);
      ctx.log().debug("created stage directory {}", stage);
    }
    save_project_config(data / consts::kConfigFile, cfg);
    fs::write_text_atomic(data / consts::kReadmeFile, readme_text(cfg));
  } catch (const std::exception &e) {
    std::error_code ec;
    stdfs::remove_all(data, ec);
    if (auto undo = installation.unregister_project(data, lock_timeout); !undo)
      ctx.log().warn("could not unregister {}: {}", data.string(), undo.error().message);
    return io_error(e);
  }
  ctx.log().info("created project {} (prefix {}) at {}", cfg.project_name, cfg.prefix,
                 data.string());
  return Project{std::move(root), std::move(cfg)};
}

bool Project::has_stage(std::string_view stage) const {
  return std::ranges::find(config_.stages, stage) != config_.stages.end();
}

auto Project::reload() -> Result<void> {
  auto cfg = load_project_config(config_file(), project_path_);
  if (!cfg)
    return std::move(cfg.error());
  config_ = std::move(cfg).value();
  return {};
}

auto Project::bump_story_number(std::chrono::milliseconds lock_timeout) -> Result<long long> {
  try {
    auto lock = FileLock::acquire(locks_dir() / consts::kProjectLock, lock_timeout);
    if (!lock) {
      return make_error(ErrorKind::Busy, "project is locked by another invocation");
    }
    if (auto ok = reload(); !ok)
      return std::move(ok.error());
    config_.last_story_number += 1;
    save_project_config(config_file(), config_);
    return config_.last_story_number;
  } catch (const std::exception &e) {
    return io_error(e);
  }
}

} // namespace storyflow
