#include "storyflow/config.hpp"

#include "support.hpp"

#include <iostream>

using testing::expect;

int main() {
  testing::TempDir tmp("config");
  try {
    // parser: scalars, lists, comments, quotes
    const auto parsed = storyflow::parse_config("# comment\n"
                                                "project_name: \"demo app\"\n"
                                                "kanban_stages:\n"
                                                "  - todo\n"
                                                "  - done\n"
                                                "remotes: []\n"
                                                "maintainers:\n"
                                                "clone_retries: 5\n",
                                                "inline");
    expect(parsed.ok(), "parse");
    const auto &doc = parsed.value();
    expect(doc.scalars.at("project_name") == "demo app", "quoted scalar");
    expect(doc.lists.at("kanban_stages") == std::vector<std::string>{"todo", "done"}, "list");
    expect(doc.lists.at("remotes").empty(), "empty list");
    expect(doc.lists.at("maintainers").empty(), "key without value is an empty list");
    expect(doc.scalars.at("clone_retries") == "5", "numeric scalar");

    // flow-style lists read the same as block lists
    const auto flow = storyflow::parse_config("kanban_stages: [planning, review, done]\n", "inline");
    expect(flow.ok() && flow.value().lists.at("kanban_stages") ==
                            std::vector<std::string>{"planning", "review", "done"},
           "flow list");

    // what cannot be read is rejected, not guessed at
    const auto broken = storyflow::parse_config("kanban_stages: [planning, review\n", "broken.yml");
    expect(!broken.ok() && broken.error().kind == storyflow::ErrorKind::Validation,
           "unterminated flow list");
    expect(broken.error().message.find("broken.yml") != std::string::npos, "source named");
    const auto nested = storyflow::parse_config("remotes:\n  origin: x\n", "inline");
    expect(!nested.ok() && nested.error().kind == storyflow::ErrorKind::Validation,
           "nested mapping rejected");
    expect(!storyflow::parse_config("- a\n- b\n", "inline").ok(), "top level must be a mapping");
    expect(storyflow::parse_config("", "inline").ok(), "empty file");

    // malformed numbers name the key
    const auto bad = storyflow::layer_from_doc(
        storyflow::parse_config("lock_timeout_seconds: soon\n", "global").value(), tmp.path(),
        "global");
    expect(!bad, "malformed number rejected");
    expect(bad.error().kind == storyflow::ErrorKind::Validation, "validation kind");
    expect(bad.error().message.find("lock_timeout_seconds") != std::string::npos, "key named");
    const auto listed = storyflow::layer_from_doc(
        storyflow::parse_config("clone_retries: [1, 2]\n", "global").value(), tmp.path(), "global");
    expect(!listed && listed.error().kind == storyflow::ErrorKind::Validation,
           "list for a single setting");

    // precedence: global < project < workspace < environment
    storyflow::ConfigLayers layers;
    layers.global.lock_timeout_seconds = 10;
    layers.global.clone_retries = 1;
    layers.global.branch_template = "global/{id}";
    layers.project.clone_retries = 2;
    layers.project.branch_template = "project/{id}";
    layers.workspace.branch_template = "ws/{id}";
    layers.workspace.workspace_root = tmp.path() / "ignored";
    layers.environment.lock_timeout_seconds = 3;
    const auto s = storyflow::resolve_layers(layers, tmp.path() / "default");
    expect(s.lock_timeout == std::chrono::seconds(3), "environment wins");
    expect(s.clone_retries == 2, "project over global");
    expect(s.branch_template == "ws/{id}", "workspace over project");
    expect(s.workspace_root == tmp.path() / "default", "workspace layer cannot move the root");
    expect(s.clone_timeout == std::chrono::seconds(300), "default clone timeout");
    expect(s.retry_backoff == std::chrono::milliseconds(500), "default backoff");

    // relative workspace_root resolves against the file's directory
    const auto rel = storyflow::layer_from_doc(
        storyflow::parse_config("workspace_root: ws\n", "project").value(), tmp.path(), "project");
    expect(rel && rel.value().workspace_root == tmp.path() / "ws", "relative root");

    // project config keeps lists, counters and unknown keys across a save
    const auto file = tmp.path() / "config.yml";
    testing::write_file(file, "project_name: demo\n"
                              "prefix: DEMO\n"
                              "last_story_number: 7\n"
                              "kanban_stages:\n"
                              "  - todo\n"
                              "  - doing\n"
                              "maintainers:\n"
                              "  - ada\n"
                              "clone_retries: 4\n"
                              "colour: blue\n"
                              "labels: [ui, api]\n");
    auto cfg = storyflow::load_project_config(file, tmp.path());
    expect(cfg.ok(), "load project config");
    expect(cfg.value().last_story_number == 7, "counter");
    expect(cfg.value().stages.size() == 2 && cfg.value().stages[1] == "doing", "stages");
    expect(cfg.value().overrides.clone_retries == 4, "override layer");
    cfg.value().last_story_number = 8;
    storyflow::save_project_config(file, cfg.value());
    const auto again = storyflow::load_project_config(file, tmp.path());
    expect(again.ok() && again.value().last_story_number == 8, "counter saved");
    expect(again.value().extra.at("colour") == "blue", "unknown key kept");
    expect(again.value().overrides.clone_retries == 4, "override kept");
    expect(again.value().maintainers == std::vector<std::string>{"ada"}, "maintainers kept");
    expect(again.value().extra_lists.at("labels") == std::vector<std::string>{"ui", "api"},
           "unknown list kept");
    expect(again.value().stages == std::vector<std::string>{"todo", "doing"}, "stages saved");

    // configured stages written as a flow list are honoured
    testing::write_file(file, "prefix: WEB\nkanban_stages: [planning, review, done]\n");
    const auto flowed = storyflow::load_project_config(file, tmp.path());
    expect(flowed.ok() && flowed.value().stages ==
                              std::vector<std::string>{"planning", "review", "done"},
           "flow-style stages");

    // a list key given a single value is an error, not a silent default
    testing::write_file(file, "prefix: WEB\nkanban_stages: planning\n");
    const auto scalar_stages = storyflow::load_project_config(file, tmp.path());
    expect(!scalar_stages.ok() && scalar_stages.error().kind == storyflow::ErrorKind::Validation,
           "scalar stages rejected");
    testing::write_file(file, "prefix: WEB\nkanban_stages: [planning, review\n");
    const auto unreadable = storyflow::load_project_config(file, tmp.path());
    expect(!unreadable.ok() && unreadable.error().kind == storyflow::ErrorKind::Validation,
           "unreadable config rejected");

    // default stages when none are configured
    testing::write_file(file, "prefix: X\n");
    const auto bare = storyflow::load_project_config(file, tmp.path());
    expect(bare.ok() && bare.value().stages.size() == 5 && bare.value().stages[0] == "planning",
           "default stages");

    std::cout << "config test OK\n";
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
