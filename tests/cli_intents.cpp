#include "cli/intents.hpp"

#include "support.hpp"

#include <iostream>

using testing::expect;
using namespace storyflow::cli;

int main() {
  try {
    // global options come before the command
    auto cl = parse_command_line({"-v", "--project=/tmp/web", "story", "list"});
    expect(cl.ok(), "command line");
    expect(cl.value().globals.verbose, "verbose");
    expect(cl.value().globals.project == "/tmp/web", "project path");
    expect(cl.value().command == "story", "command");
    expect(cl.value().args == std::vector<std::string>{"list"}, "arguments");
    expect(parse_command_line({"--help"}).value().command == "help", "help alias");
    expect(!parse_command_line({"-p"}).ok(), "-p needs a value");
    expect(!parse_command_line({"--bogus", "story"}).ok(), "unknown global option");
    expect(!parse_command_line({}).ok(), "missing command");

    // option scanning
    auto scanned = scan_args({"a", "--repo", "u1", "--repo=u2", "--force", "--", "--not-an-option"},
                             {"--repo"}, {"--force"});
    expect(scanned.ok(), "scan");
    expect(scanned.value().positional == std::vector<std::string>{"a", "--not-an-option"},
           "positionals");
    expect(scanned.value().all("--repo") == std::vector<std::string>{"u1", "u2"}, "repeated value");
    expect(scanned.value().value("--repo") == "u2", "last value wins");
    expect(scanned.value().has("--force"), "flag");
    expect(scan_args({"--repo"}, {"--repo"}, {}).error().kind == storyflow::ErrorKind::Validation,
           "missing value");
    expect(!scan_args({"--force=yes"}, {}, {"--force"}).ok(), "flags take no value");

    // project
    auto create = parse_project_intent(
        {"create", "web", "--prefix", "web", "--repo", "git@x:web.git", "--stages", "todo, doing,done"});
    expect(create.ok(), "project create");
    const auto &pc = std::get<ProjectCreate>(create.value());
    expect(pc.path == fs::path("web"), "project path");
    expect(pc.options.prefix == "web" && pc.options.remotes.size() == 1, "project options");
    expect(pc.options.stages == std::vector<std::string>{"todo", "doing", "done"}, "stages");
    auto del = parse_project_intent({"delete", "--force"});
    expect(del.ok() && std::get<ProjectDelete>(del.value()).force &&
               !std::get<ProjectDelete>(del.value()).path,
           "project delete");
    expect(std::holds_alternative<ProjectShow>(parse_project_intent({"info"}).value()), "info");
    expect(!parse_project_intent({"rename"}).ok(), "unknown subcommand");

    // story
    auto story = parse_story_intent({"create", "Add login", "--description", "OAuth",
                                     "--branch-strategy", "feature", "--no-provision"});
    expect(story.ok(), "story create");
    const auto &sc = std::get<StoryCreate>(story.value()).request;
    expect(sc.title == "Add login" && sc.description == "OAuth", "title and description");
    expect(sc.branch_strategy == "feature" && !sc.provision && !sc.repo, "create options");
    auto move = parse_story_intent({"move", "WEB-1", "testing", "--from", "pr"});
    expect(move.ok(), "story move");
    const auto &sm = std::get<StoryMove>(move.value());
    expect(sm.id == "WEB-1" && sm.to == "testing" && sm.from == "pr", "move fields");
    expect(!parse_story_intent({"move", "WEB-1"}).ok(), "move needs a stage");
    auto list = parse_story_intent({"list", "--stage", "pr"});
    expect(list.ok() && std::get<StoryList>(list.value()).stage == "pr", "list filter");
    expect(!parse_story_intent({"create"}).ok(), "create needs a title");
    expect(parse_story_intent({"show", "a", "b"}).error().hint.find("help") != std::string::npos,
           "usage hint");

    // workspace
    auto prov = parse_workspace_intent({"provision", "WEB-2", "--force"});
    expect(prov.ok() && std::get<WorkspaceProvision>(prov.value()).force, "provision");
    expect(std::holds_alternative<WorkspaceFetch>(parse_workspace_intent({"fetch", "WEB-2"}).value()),
           "fetch");
    expect(std::holds_alternative<WorkspaceShow>(parse_workspace_intent({"status", "WEB-2"}).value()),
           "status");
    expect(!parse_workspace_intent({"status"}).ok(), "status needs an id");

    // command table
    register_all_commands();
    expect(find_command("story") != nullptr && find_command("clone") == nullptr, "registry");
    std::ostringstream help;
    expect(print_command_usage(help, "workspace"), "command help");
    expect(help.str().find("provision <id>") != std::string::npos, "help text");
    expect(!print_command_usage(help, "bogus"), "unknown command help");
    std::ostringstream usage;
    print_usage(usage);
    expect(usage.str().find("STORYFLOW_LOCK_TIMEOUT") != std::string::npos, "environment listed");

    std::cout << "cli test OK\n";
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
