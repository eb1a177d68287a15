#include "cli/common.hpp"

#include "storyflow/git.hpp"
#include "storyflow/process.hpp"
#include "storyflow/project.hpp"

#include <iostream>

namespace storyflow::cli {

int cmd_status(Invocation &inv, const std::vector<std::string> &args) {
  if (!args.empty()) {
    std::cerr << "usage: storyflow status\n";
    return 1;
  }
  PosixCommandRunner runner;
  GitRepositoryManager git{runner, GitOptions{}};
  auto version = git.version();
  if (!version)
    return report(version.error());
  inv.ctx.log().debug("git available: {}", version.value());
  std::cout << "git: " << version.value() << "\n";

  // the project is optional here
  if (auto project = Project::open(inv.globals.project)) {
    std::cout << "project: " << project.value().config().project_name << " ("
              << project.value().config().prefix << ") at "
              << project.value().data_dir().string() << "\n";
  } else {
    std::cout << "project: none at " << inv.globals.project.string() << "\n";
  }
  return 0;
}

} // namespace storyflow::cli
