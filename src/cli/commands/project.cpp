#include "cli/common.hpp"
#include "cli/intents.hpp"

#include "storyflow/project.hpp"
#include "storyflow/util.hpp"

#include <iostream>
#include <string>
#include <variant>

namespace storyflow::cli {

namespace {

int run_create(Invocation &inv, const ProjectCreate &c) {
  const auto path = c.path.value_or(inv.globals.project);
  auto project = Project::create(inv.ctx, path, c.options, Installation::from_env());
  if (!project)
    return report(project.error());
  const auto &p = project.value();
  try {
    inv.ctx.attach_audit_log(p.audit_log());
    inv.ctx.log().info("project {} created with prefix {}", p.config().project_name,
                       p.config().prefix);
  } catch (const std::exception &e) {
    inv.ctx.log().warn("audit log unavailable: {}", e.what());
  }
  std::cout << "Created project '" << p.config().project_name << "' at " << p.data_dir().string()
            << "\n";
  std::cout << "Prefix: " << p.config().prefix << "\n";
  std::cout << "Stages: " << strutil::join(p.config().stages, ", ") << "\n";
  if (!p.config().remotes.empty())
    std::cout << "Remotes: " << strutil::join(p.config().remotes, ", ") << "\n";
  return 0;
}

int run_delete(Invocation &inv, const ProjectDelete &d) {
  auto bench = open_workbench(inv, d.path.value_or(inv.globals.project));
  if (!bench)
    return report(bench.error());
  auto &wb = *bench.value();
  bool force = d.force;
  if (!force && interactive()) {
    auto info = wb.info(inv.ctx);
    if (!info)
      return report(info.error());
    if (info.value().total_stories > 0) {
      if (!confirm("Delete project '" + info.value().name + "' and its " +
                   std::to_string(info.value().total_stories) + " stories?")) {
        std::cout << "Aborted.\n";
        return 0;
      }
      force = true;
    }
  }
  const auto data_dir = wb.project().data_dir();
  if (auto ok = wb.delete_project(inv.ctx, force); !ok)
    return report(ok.error());
  std::cout << "Deleted project at " << data_dir.string() << "\n";
  return 0;
}

int run_info(Invocation &inv, const ProjectShow &s) {
  auto bench = open_workbench(inv, s.path.value_or(inv.globals.project));
  if (!bench)
    return report(bench.error());
  auto info = bench.value()->info(inv.ctx);
  if (!info)
    return report(info.error());
  const auto &i = info.value();
  std::cout << "Project: " << i.name << "\n";
  std::cout << "Path: " << i.project_path.string() << "\n";
  std::cout << "Data directory: " << i.data_dir.string() << "\n";
  std::cout << "Prefix: " << i.prefix << "\n";
  std::cout << "Total stories: " << i.total_stories << "\n";
  std::cout << "Stories by stage:\n";
  for (const auto &count : i.stages)
    std::cout << "  " << count.stage << ": " << count.count << "\n";
  std::cout << "  unstarted: " << i.unstarted << "\n";
  std::cout << "Remotes: " << (i.remotes.empty() ? "(none)" : strutil::join(i.remotes, ", "))
            << "\n";
  std::cout << "Maintainers: "
            << (i.maintainers.empty() ? "(none)" : strutil::join(i.maintainers, ", ")) << "\n";
  return 0;
}

} // namespace

int cmd_project(Invocation &inv, const std::vector<std::string> &args) {
  auto intent = parse_project_intent(args);
  if (!intent)
    return report(intent.error());
  return std::visit(overloaded{
                        [&](const ProjectCreate &c) { return run_create(inv, c); },
                        [&](const ProjectDelete &d) { return run_delete(inv, d); },
                        [&](const ProjectShow &s) { return run_info(inv, s); },
                    },
                    intent.value());
}

} // namespace storyflow::cli
