#include "cli/common.hpp"
#include "cli/intents.hpp"

#include "storyflow/workspace.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <variant>

namespace storyflow::cli {

namespace {

void print_problems(const std::vector<Error> &problems) {
  for (const auto &p : problems) {
    std::cerr << "warning: " << describe(p) << "\n";
    if (!p.hint.empty())
      std::cerr << "hint: " << p.hint << "\n";
  }
}

std::string workspace_line(const WorkspaceRecord &rec) {
  std::string line(status_name(rec.status));
  if (rec.status == WorkspaceStatus::Unprovisioned)
    return line;
  line += " at " + rec.path.string();
  if (!rec.branch.empty())
    line += " (branch " + rec.branch + ")";
  return line;
}

int run_create(Invocation &inv, Workbench &wb, const StoryCreate &c) {
  auto view = wb.create_story(inv.ctx, c.request);
  if (!view)
    return report(view.error());
  const auto &v = view.value();
  std::cout << "Created story " << v.story.id << ": " << v.story.title << "\n";
  std::cout << "File: " << v.story.file.string() << "\n";
  std::cout << "Stage: " << v.stage.value_or("unstarted") << "\n";
  if (v.workspace)
    std::cout << "Workspace: " << workspace_line(*v.workspace) << "\n";
  else
    std::cout << "Workspace: not provisioned\n";
  return 0;
}

int run_move(Invocation &inv, Workbench &wb, const StoryMove &m) {
  auto t = wb.move_story(inv.ctx, m.id, m.to, m.from);
  if (!t)
    return report(t.error());
  if (!t.value().changed)
    std::cout << m.id << " is already in " << m.to << "\n";
  else
    std::cout << "Moved " << m.id << " from " << t.value().from.value_or("unstarted") << " to "
              << m.to << "\n";
  return 0;
}

int run_list(Invocation &inv, Workbench &wb, const StoryList &l) {
  auto board = wb.list(inv.ctx, l.stage);
  if (!board)
    return report(board.error());
  const auto &entries = board.value().entries;
  if (l.stage)
    std::cout << "Stories in " << *l.stage << ":\n";
  if (entries.empty()) {
    std::cout << "  (none)\n";
  }
  for (const auto &e : entries) {
    std::cout << "  " << std::left << std::setw(14) << e.story.id;
    if (!l.stage)
      std::cout << std::setw(14) << e.stage.value_or("unstarted");
    std::cout << e.story.title << "\n";
  }
  print_problems(board.value().problems);
  return 0;
}

int run_show(Invocation &inv, Workbench &wb, const StoryShow &s) {
  auto view = wb.show(inv.ctx, s.id);
  if (!view)
    return report(view.error());
  const auto &v = view.value();
  std::cout << "Story: " << v.story.id << "\n";
  std::cout << "Title: " << v.story.title << "\n";
  std::cout << "Created: " << v.story.created_at << "\n";
  std::cout << "Stage: " << v.stage.value_or("unstarted") << "\n";
  if (v.story.repository) {
    std::cout << "Repository: " << v.story.repository->url << "\n";
    if (!v.story.repository->branch_strategy.empty())
      std::cout << "Branch strategy: " << v.story.repository->branch_strategy << "\n";
  }
  if (v.workspace) {
    std::cout << "Workspace: " << workspace_line(*v.workspace) << "\n";
    if (!v.workspace->error.empty())
      std::cout << "Last error: " << v.workspace->error << "\n";
  }
  if (!v.story.description.empty())
    std::cout << "\n" << v.story.description << "\n";
  return 0;
}

int run_delete(Invocation &inv, Workbench &wb, const StoryDelete &d) {
  if (!d.force) {
    if (!interactive()) {
      return report(make_error(ErrorKind::Validation,
                               "refusing to delete " + d.id + " without confirmation",
                               "pass --force in non-interactive mode"));
    }
    if (!confirm("Delete story " + d.id + " and its workspace?")) {
      std::cout << "Aborted.\n";
      return 0;
    }
  }
  if (auto ok = wb.delete_story(inv.ctx, d.id, d.force); !ok)
    return report(ok.error());
  std::cout << "Deleted story " << d.id << "\n";
  return 0;
}

} // namespace

int cmd_story(Invocation &inv, const std::vector<std::string> &args) {
  auto intent = parse_story_intent(args);
  if (!intent)
    return report(intent.error());
  auto bench = open_workbench(inv, inv.globals.project);
  if (!bench)
    return report(bench.error());
  Workbench &wb = *bench.value();
  return std::visit(overloaded{
                        [&](const StoryCreate &c) { return run_create(inv, wb, c); },
                        [&](const StoryMove &m) { return run_move(inv, wb, m); },
                        [&](const StoryList &l) { return run_list(inv, wb, l); },
                        [&](const StoryShow &s) { return run_show(inv, wb, s); },
                        [&](const StoryDelete &d) { return run_delete(inv, wb, d); },
                    },
                    intent.value());
}

} // namespace storyflow::cli
