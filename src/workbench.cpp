#include "storyflow/workbench.hpp"

#include "storyflow/consts.hpp"
#include "storyflow/fs.hpp"
#include "storyflow/pipeline.hpp"
#include "storyflow/util.hpp"

#include <algorithm>
#include <set>

namespace stdfs = std::filesystem;

namespace storyflow {

namespace {

bool by_number(const StoryView &a, const StoryView &b) {
  const auto na = story_number(a.story.id);
  const auto nb = story_number(b.story.id);
  if (na && nb && *na != *nb)
    return *na < *nb;
  return a.story.id < b.story.id;
}

Error invalid_id(const std::string &id) {
  return make_error(ErrorKind::Validation, "invalid story id '" + id + "'");
}

} // namespace

Result<Settings> load_settings(const Project &project, const Installation &installation) {
  ConfigLayers layers;
  auto global = load_layer(installation.global_config(), installation.home());
  if (!global)
    return std::move(global.error());
  layers.global = std::move(global).value();
  layers.project = project.config().overrides;
  auto env = environment_layer();
  if (!env)
    return std::move(env.error());
  layers.environment = std::move(env).value();

  // the workspace layer lives in the root chosen by the layers below it
  const auto root = merge(layers.global, layers.project)
                        .workspace_root.value_or(project.default_workspace_root());
  auto workspace = load_layer(root / consts::kWsConfigFile, root);
  if (!workspace)
    return std::move(workspace.error());
  layers.workspace = std::move(workspace).value();

  return resolve_layers(layers, project.default_workspace_root());
}

Workbench::Workbench(Key, Project project, Settings settings, WorkbenchOptions options)
    : project_(std::move(project)), settings_(std::move(settings)),
      installation_(std::move(options.installation)),
      owned_runner_(options.runner ? nullptr : std::make_unique<PosixCommandRunner>()),
      owned_renderer_(options.renderer ? nullptr
                                       : std::make_unique<TemplateDirRenderer>(
                                             project_.templates_dir())),
      stories_(project_, settings_.lock_timeout),
      kanban_(project_, stories_, settings_.lock_timeout),
      git_(options.runner ? *options.runner : *owned_runner_,
           GitOptions{.network_timeout = settings_.clone_timeout,
                      .local_timeout = std::chrono::seconds(60)}),
      provisioner_(git_, options.renderer ? *options.renderer : *owned_renderer_,
                   ProvisionerOptions{.root = settings_.workspace_root,
                                      .lock_timeout = settings_.lock_timeout,
                                      .clone_retries = settings_.clone_retries,
                                      .retry_backoff = settings_.retry_backoff,
                                      .non_interactive = settings_.non_interactive,
                                      .confirm_retry = std::move(options.confirm_retry)}) {}

Result<std::unique_ptr<Workbench>> Workbench::open(Context &ctx, const stdfs::path &project_path,
                                                   WorkbenchOptions options) {
  auto project = Project::open(project_path);
  if (!project)
    return std::move(project.error());
  auto settings = load_settings(project.value(), options.installation);
  if (!settings)
    return std::move(settings.error());
  ctx.log().debug("project {} (prefix {}), workspace root {}", project.value().config().project_name,
                  project.value().config().prefix, settings.value().workspace_root.string());
  return std::make_unique<Workbench>(Key{}, std::move(project).value(), std::move(settings).value(),
                                     std::move(options));
}

Result<StoryView> Workbench::create_story(Context &ctx, const CreateStoryRequest &request) {
  struct Creation {
    std::string id;
    StoryDraft draft;
    std::string stage;
    StoryView view;
  };

  return start(ctx, "resolve project",
               [&]() -> Result<Creation> {
                 if (auto ok = project_.reload(); !ok)
                   return std::move(ok.error());
                 if (strutil::trim(request.title).empty())
                   return make_error(ErrorKind::Validation, "story title must not be empty");
                 Creation c;
                 c.stage = request.stage.value_or(project_.initial_stage());
                 if (!project_.has_stage(c.stage)) {
                   return make_error(ErrorKind::Validation, "unknown stage '" + c.stage + "'",
                                     "configured stages: " +
                                         strutil::join(project_.config().stages, ", "));
                 }
                 c.draft.title = strutil::trim(request.title);
                 c.draft.description = request.description;
                 std::string url = request.repo.value_or(
                     project_.config().remotes.empty() ? std::string{}
                                                       : project_.config().remotes.front());
                 if (!url.empty()) {
                   c.draft.repository =
                       RepositoryRef{.url = url, .branch_strategy = request.branch_strategy};
                   // reject a bad strategy before an id is spent on it
                   auto branch = branch_for("X-1", request.branch_strategy,
                                            settings_.branch_template);
                   if (!branch)
                     return std::move(branch.error());
                 }
                 return c;
               })
      .then("allocate id",
            [&](Creation c) -> Result<Creation> {
              auto id = stories_.allocate_id(ctx);
              if (!id)
                return std::move(id.error());
              c.id = std::move(id).value();
              return c;
            })
      .then("create record",
            [&](Creation c) -> Result<Creation> {
              auto story = stories_.create(ctx, c.id, c.draft);
              if (!story)
                return std::move(story.error());
              c.view.story = std::move(story).value();
              return c;
            })
      .then("provision workspace",
            [&](Creation c) -> Result<Creation> {
              if (!c.view.story.repository || !request.provision) {
                ctx.log().debug("story {}: no workspace requested", c.id);
                return c;
              }
              auto rec = provisioner_.provision(
                  ctx, ProvisionRequest{.story = c.view.story,
                                        .project_name = project_.config().project_name,
                                        .branch_template = settings_.branch_template,
                                        .force = false});
              if (!rec) {
                Error err = std::move(rec.error());
                if (err.hint.empty())
                  err.hint = "story " + c.id + " was created; retry with 'storyflow workspace "
                                               "provision " + c.id + "'";
                return err;
              }
              c.view.workspace = std::move(rec).value();
              return c;
            })
      .then("enter initial stage",
            [&](Creation c) -> Result<StoryView> {
              auto t = kanban_.transition(ctx, c.id, std::nullopt, c.stage);
              if (!t)
                return std::move(t.error());
              c.view.stage = t.value().to;
              return std::move(c.view);
            })
      .finish();
}

Result<Transition> Workbench::move_story(Context &ctx, const std::string &id,
                                         const std::string &to,
                                         const std::optional<std::string> &from) {
  if (!is_valid_story_id(id))
    return invalid_id(id);
  return kanban_.transition(ctx, id, from, to);
}

Result<BoardListing> Workbench::list(Context &ctx, const std::optional<std::string> &stage) {
  BoardListing board;
  std::set<std::string> seen;
  std::set<std::string> doubled;
  const std::vector<std::string> stages =
      stage ? std::vector<std::string>{*stage} : project_.config().stages;
  for (const auto &s : stages) {
    auto listing = kanban_.list_stage(ctx, s);
    if (!listing) {
      // an unknown stage is the caller's mistake; anything else is reported
      if (stage || listing.error().kind == ErrorKind::Validation)
        return std::move(listing.error());
      board.problems.push_back(std::move(listing.error()));
      continue;
    }
    for (auto &story : listing.value().stories) {
      if (!seen.insert(story.id).second) {
        doubled.insert(story.id);
        continue;
      }
      board.entries.push_back(StoryView{.story = std::move(story), .stage = s, .workspace = {}});
    }
    for (auto &p : listing.value().problems)
      board.problems.push_back(std::move(p));
  }

  // a story seen in two stages is settled by the state machine
  for (auto &entry : board.entries) {
    if (!doubled.contains(entry.story.id))
      continue;
    auto current = kanban_.current_stage(ctx, entry.story.id);
    if (!current) {
      board.problems.push_back(std::move(current.error()));
      continue;
    }
    entry.stage = current.value();
  }
  if (stage) {
    std::erase_if(board.entries, [&](const StoryView &v) { return v.stage != stage; });
  } else {
    auto index = stories_.discover();
    for (auto &story : index.stories) {
      if (!seen.contains(story.id))
        board.entries.push_back(StoryView{.story = std::move(story), .stage = {}, .workspace = {}});
    }
    for (auto &p : index.problems)
      board.problems.push_back(std::move(p));
  }
  std::ranges::sort(board.entries, by_number);
  return board;
}

Result<StoryView> Workbench::show(Context &ctx, const std::string &id) {
  if (!is_valid_story_id(id))
    return invalid_id(id);
  auto story = stories_.load(id);
  if (!story)
    return std::move(story.error());
  auto stage = kanban_.current_stage(ctx, id);
  if (!stage)
    return std::move(stage.error());
  auto ws = provisioner_.status(id);
  if (!ws)
    return std::move(ws.error());
  return StoryView{.story = std::move(story).value(),
                   .stage = std::move(stage).value(),
                   .workspace = std::move(ws).value()};
}

Result<void> Workbench::delete_story(Context &ctx, const std::string &id, bool force) {
  if (!is_valid_story_id(id))
    return invalid_id(id);
  const bool has_links = std::ranges::any_of(project_.config().stages, [&](const std::string &s) {
    return fs::is_symlink(kanban_.link_path(s, id));
  });
  if (!stories_.exists(id) && !has_links && !fs::exists(provisioner_.record_path(id)))
    return make_error(ErrorKind::NotFound, "story " + id + " not found");

  auto done = start(ctx, "teardown workspace",
                    [&]() { return provisioner_.teardown(ctx, id, force); })
                  .then("remove story",
                        [&](bool) { return kanban_.remove_story(ctx, id); })
                  .finish();
  if (!done)
    return std::move(done.error());
  ctx.log().info("deleted story {}", id);
  return {};
}

Result<WorkspaceRecord> Workbench::provision(Context &ctx, const std::string &id, bool force) {
  if (!is_valid_story_id(id))
    return invalid_id(id);
  struct Provisioned {
    Story story;
    WorkspaceRecord record;
  };
  return start(ctx, "load story", [&]() { return stories_.load(id); })
      .then("provision workspace",
            [&](Story story) -> Result<Provisioned> {
              auto rec = provisioner_.provision(
                  ctx, ProvisionRequest{.story = story,
                                        .project_name = project_.config().project_name,
                                        .branch_template = settings_.branch_template,
                                        .force = force});
              if (!rec)
                return std::move(rec.error());
              return Provisioned{.story = std::move(story), .record = std::move(rec).value()};
            })
      .then("enter initial stage",
            [&](Provisioned p) -> Result<WorkspaceRecord> {
              auto stage = kanban_.current_stage(ctx, id);
              if (!stage)
                return std::move(stage.error());
              if (!stage.value()) {
                auto t = kanban_.transition(ctx, id, std::nullopt, project_.initial_stage());
                if (!t)
                  return std::move(t.error());
              }
              return std::move(p.record);
            })
      .finish();
}

Result<WorkspaceRecord> Workbench::workspace_status(const std::string &id) {
  if (!is_valid_story_id(id))
    return invalid_id(id);
  if (!stories_.exists(id) && !fs::exists(provisioner_.record_path(id)))
    return make_error(ErrorKind::NotFound, "story " + id + " not found");
  return provisioner_.status(id);
}

Result<bool> Workbench::teardown(Context &ctx, const std::string &id, bool force) {
  if (!is_valid_story_id(id))
    return invalid_id(id);
  return provisioner_.teardown(ctx, id, force);
}

Result<bool> Workbench::fetch(Context &ctx, const std::string &id) {
  if (!is_valid_story_id(id))
    return invalid_id(id);
  return provisioner_.fetch(ctx, id, settings_.fetch_staleness);
}

Result<ProjectInfo> Workbench::info(Context &ctx) {
  if (auto ok = project_.reload(); !ok)
    return std::move(ok.error());
  const auto &cfg = project_.config();
  ProjectInfo out;
  out.project_path = project_.project_path();
  out.data_dir = project_.data_dir();
  out.name = cfg.project_name;
  out.prefix = cfg.prefix;
  out.remotes = cfg.remotes;
  out.maintainers = cfg.maintainers;

  auto board = list(ctx, std::nullopt);
  if (!board)
    return std::move(board.error());
  out.total_stories = board.value().entries.size();
  for (const auto &stage : cfg.stages) {
    const auto n = std::ranges::count_if(board.value().entries, [&](const StoryView &v) {
      return v.stage == stage;
    });
    out.stages.push_back(StageCount{.stage = stage, .count = static_cast<std::size_t>(n)});
  }
  out.unstarted = static_cast<std::size_t>(std::ranges::count_if(
      board.value().entries, [](const StoryView &v) { return !v.stage; }));
  for (const auto &p : board.value().problems)
    ctx.log().warn("{}", describe(p));
  return out;
}

Result<void> Workbench::delete_project(Context &ctx, bool force) {
  const auto index = stories_.discover();
  if (!index.stories.empty() && !force) {
    return make_error(ErrorKind::Validation,
                      "project has " + std::to_string(index.stories.size()) + " stories",
                      "re-run with --force to delete it anyway");
  }
  for (const auto &story : index.stories) {
    auto removed = provisioner_.teardown(ctx, story.id, false);
    if (!removed) {
      Error err = std::move(removed.error());
      err.step = "teardown workspace of " + story.id;
      return err;
    }
  }
  const auto data = project_.data_dir();
  if (auto ok = installation_.unregister_project(data, settings_.lock_timeout); !ok)
    return std::move(ok.error());
  std::error_code ec;
  stdfs::remove_all(data, ec);
  if (ec)
    return make_error(ErrorKind::Io, "cannot remove " + data.string() + ": " + ec.message());
  ctx.log().info("deleted project {} at {}", project_.config().project_name,
                 project_.project_path().string());
  return {};
}

} // namespace storyflow
