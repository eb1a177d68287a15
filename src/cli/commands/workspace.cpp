#include "cli/common.hpp"
#include "cli/intents.hpp"

#include "storyflow/workspace.hpp"

#include <iostream>
#include <string>
#include <variant>

namespace storyflow::cli {

namespace {

int run_provision(Invocation &inv, Workbench &wb, const WorkspaceProvision &p) {
  auto rec = wb.provision(inv.ctx, p.id, p.force);
  if (!rec)
    return report(rec.error());
  std::cout << "Workspace of " << p.id << " ready at " << rec.value().path.string() << "\n";
  std::cout << "Branch: " << (rec.value().branch.empty() ? "(default)" : rec.value().branch)
            << "\n";
  return 0;
}

int run_status(Workbench &wb, const WorkspaceShow &s) {
  auto rec = wb.workspace_status(s.id);
  if (!rec)
    return report(rec.error());
  const auto &r = rec.value();
  std::cout << "Story: " << s.id << "\n";
  std::cout << "Status: " << status_name(r.status) << "\n";
  std::cout << "Path: " << r.path.string() << "\n";
  if (r.status == WorkspaceStatus::Unprovisioned)
    return 0;
  std::cout << "Remote: " << r.remote << "\n";
  std::cout << "Branch: " << (r.branch.empty() ? "(default)" : r.branch) << "\n";
  std::cout << "Attempts: " << r.attempts << "\n";
  std::cout << "Updated: " << r.updated << " by pid " << r.owner << "\n";
  if (!r.error.empty())
    std::cout << "Last error: " << r.error << "\n";
  return 0;
}

int run_teardown(Invocation &inv, Workbench &wb, const WorkspaceTeardown &t) {
  auto removed = wb.teardown(inv.ctx, t.id, t.force);
  if (!removed)
    return report(removed.error());
  if (removed.value())
    std::cout << "Removed workspace of " << t.id << "\n";
  else
    std::cout << t.id << " has no workspace\n";
  return 0;
}

int run_fetch(Invocation &inv, Workbench &wb, const WorkspaceFetch &f) {
  auto fetched = wb.fetch(inv.ctx, f.id);
  if (!fetched)
    return report(fetched.error());
  std::cout << (fetched.value() ? "Fetched origin for " : "Recently fetched, skipped ") << f.id
            << "\n";
  return 0;
}

} // namespace

int cmd_workspace(Invocation &inv, const std::vector<std::string> &args) {
  auto intent = parse_workspace_intent(args);
  if (!intent)
    return report(intent.error());
  auto bench = open_workbench(inv, inv.globals.project);
  if (!bench)
    return report(bench.error());
  Workbench &wb = *bench.value();
  return std::visit(overloaded{
                        [&](const WorkspaceProvision &p) { return run_provision(inv, wb, p); },
                        [&](const WorkspaceShow &s) { return run_status(wb, s); },
                        [&](const WorkspaceTeardown &t) { return run_teardown(inv, wb, t); },
                        [&](const WorkspaceFetch &f) { return run_fetch(inv, wb, f); },
                    },
                    intent.value());
}

} // namespace storyflow::cli
