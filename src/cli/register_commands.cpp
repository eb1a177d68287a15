#include "cli/registry.hpp"

namespace storyflow::cli {

int cmd_project(Invocation &inv, const std::vector<std::string> &args);
int cmd_story(Invocation &inv, const std::vector<std::string> &args);
int cmd_workspace(Invocation &inv, const std::vector<std::string> &args);
int cmd_status(Invocation &inv, const std::vector<std::string> &args);

void register_all_commands() {
  register_command("project", cmd_project,
                   "    create [path] [--name N] [--prefix P] [--repo URL]... [--maintainer M]...\n"
                   "           [--stages a,b,c]\n"
                   "    delete [path] [--force]\n"
                   "    info [path]\n");
  register_command("story", cmd_story,
                   "    create <title> [--description D] [--repo URL] [--branch-strategy S]\n"
                   "           [--stage S] [--no-provision]\n"
                   "    move <id> <stage> [--from <stage>]\n"
                   "    list [--stage S]\n"
                   "    show <id>\n"
                   "    delete <id> [--force]\n");
  register_command("workspace", cmd_workspace,
                   "    provision <id> [--force]\n"
                   "    status <id>\n"
                   "    teardown <id> [--force]\n"
                   "    fetch <id>\n");
  register_command("status", cmd_status, "    check that git is available\n");
}

} // namespace storyflow::cli
