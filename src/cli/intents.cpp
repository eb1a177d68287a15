#include "cli/intents.hpp"

#include "storyflow/util.hpp"

#include <algorithm>
#include <iterator>

namespace storyflow::cli {

namespace {

Error usage(std::string message) {
  return make_error(ErrorKind::Validation, std::move(message),
                    "run 'storyflow help' for usage");
}

bool listed(std::initializer_list<std::string_view> opts, std::string_view name) {
  return std::ranges::find(opts, name) != opts.end();
}

Result<std::string> subcommand(const std::vector<std::string> &args, std::string_view group) {
  if (args.empty())
    return usage(std::string(group) + ": missing subcommand");
  return args.front();
}

std::vector<std::string> rest(const std::vector<std::string> &args) {
  return {args.begin() + 1, args.end()};
}

// Exactly `n` positionals, named in the error message.
Result<ParsedArgs> expect(Result<ParsedArgs> parsed, std::size_t n, std::string_view what) {
  if (!parsed)
    return parsed;
  if (parsed.value().positional.size() != n)
    return usage("expected " + std::string(what));
  return parsed;
}

} // namespace

std::optional<std::string> ParsedArgs::value(const std::string &name) const {
  // the last occurrence wins
  const auto [lo, hi] = values.equal_range(name);
  if (lo == hi)
    return std::nullopt;
  return std::prev(hi)->second;
}

std::vector<std::string> ParsedArgs::all(const std::string &name) const {
  std::vector<std::string> out;
  const auto [lo, hi] = values.equal_range(name);
  for (auto it = lo; it != hi; ++it)
    out.push_back(it->second);
  return out;
}

Result<ParsedArgs> scan_args(const std::vector<std::string> &args,
                             std::initializer_list<std::string_view> value_opts,
                             std::initializer_list<std::string_view> flag_opts) {
  ParsedArgs out;
  bool options_done = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &a = args[i];
    if (options_done || a.size() < 2 || a[0] != '-' || a == "-") {
      out.positional.push_back(a);
      continue;
    }
    if (a == "--") {
      options_done = true;
      continue;
    }
    std::string name = a;
    std::optional<std::string> inline_value;
    if (const auto eq = a.find('='); eq != std::string::npos && a.rfind("--", 0) == 0) {
      name = a.substr(0, eq);
      inline_value = a.substr(eq + 1);
    }
    if (listed(value_opts, name)) {
      if (inline_value) {
        out.values.emplace(name, *inline_value);
      } else if (i + 1 < args.size()) {
        out.values.emplace(name, args[++i]);
      } else {
        return usage("option " + name + " needs a value");
      }
    } else if (listed(flag_opts, name) && !inline_value) {
      out.flags.insert(name);
    } else {
      return usage("unknown option " + a);
    }
  }
  return out;
}

Result<CommandLine> parse_command_line(const std::vector<std::string> &argv) {
  CommandLine cl;
  std::size_t i = 0;
  for (; i < argv.size(); ++i) {
    const std::string &a = argv[i];
    if (a == "-v" || a == "--verbose") {
      cl.globals.verbose = true;
    } else if (a == "-p" || a == "--project") {
      if (i + 1 >= argv.size())
        return usage(a + " needs a path");
      cl.globals.project = argv[++i];
    } else if (a.rfind("--project=", 0) == 0) {
      cl.globals.project = a.substr(10);
    } else if (!a.empty() && a[0] == '-' && a != "-h" && a != "--help") {
      return usage("unknown option " + a);
    } else {
      break;
    }
  }
  if (i >= argv.size())
    return usage("missing command");
  cl.command = argv[i] == "-h" || argv[i] == "--help" ? "help" : argv[i];
  cl.args.assign(argv.begin() + static_cast<std::ptrdiff_t>(i) + 1, argv.end());
  return cl;
}

Result<ProjectIntent> parse_project_intent(const std::vector<std::string> &args) {
  auto sub = subcommand(args, "project");
  if (!sub)
    return std::move(sub.error());
  const std::string &name = sub.value();

  if (name == "create") {
    auto parsed = scan_args(rest(args),
                            {"--name", "--prefix", "--repo", "--maintainer", "--stages"}, {});
    if (!parsed)
      return std::move(parsed.error());
    const auto &p = parsed.value();
    if (p.positional.size() > 1)
      return usage("project create takes at most one path");
    ProjectCreate c;
    if (!p.positional.empty())
      c.path = p.positional.front();
    c.options.name = p.value("--name").value_or("");
    c.options.prefix = p.value("--prefix").value_or("");
    c.options.remotes = p.all("--repo");
    c.options.maintainers = p.all("--maintainer");
    if (const auto stages = p.value("--stages")) {
      for (auto &s : strutil::split(*stages, ',')) {
        auto t = strutil::trim(s);
        if (!t.empty())
          c.options.stages.push_back(std::move(t));
      }
    }
    return ProjectIntent{std::move(c)};
  }
  if (name == "delete") {
    auto parsed = scan_args(rest(args), {}, {"--force"});
    if (!parsed)
      return std::move(parsed.error());
    const auto &p = parsed.value();
    if (p.positional.size() > 1)
      return usage("project delete takes at most one path");
    ProjectDelete d;
    if (!p.positional.empty())
      d.path = p.positional.front();
    d.force = p.has("--force");
    return ProjectIntent{std::move(d)};
  }
  if (name == "info") {
    auto parsed = scan_args(rest(args), {}, {});
    if (!parsed)
      return std::move(parsed.error());
    const auto &p = parsed.value();
    if (p.positional.size() > 1)
      return usage("project info takes at most one path");
    ProjectShow s;
    if (!p.positional.empty())
      s.path = p.positional.front();
    return ProjectIntent{std::move(s)};
  }
  return usage("unknown project subcommand '" + name + "'");
}

Result<StoryIntent> parse_story_intent(const std::vector<std::string> &args) {
  auto sub = subcommand(args, "story");
  if (!sub)
    return std::move(sub.error());
  const std::string &name = sub.value();

  if (name == "create") {
    auto parsed =
        expect(scan_args(rest(args), {"--description", "--repo", "--branch-strategy", "--stage"},
                         {"--no-provision"}),
               1, "story create <title>");
    if (!parsed)
      return std::move(parsed.error());
    const auto &p = parsed.value();
    StoryCreate c;
    c.request.title = p.positional.front();
    c.request.description = p.value("--description").value_or("");
    c.request.repo = p.value("--repo");
    c.request.branch_strategy = p.value("--branch-strategy").value_or("");
    c.request.stage = p.value("--stage");
    c.request.provision = !p.has("--no-provision");
    return StoryIntent{std::move(c)};
  }
  if (name == "move") {
    auto parsed = expect(scan_args(rest(args), {"--from"}, {}), 2, "story move <id> <stage>");
    if (!parsed)
      return std::move(parsed.error());
    const auto &p = parsed.value();
    return StoryIntent{
        StoryMove{.id = p.positional[0], .to = p.positional[1], .from = p.value("--from")}};
  }
  if (name == "list") {
    auto parsed = expect(scan_args(rest(args), {"--stage"}, {}), 0, "story list [--stage S]");
    if (!parsed)
      return std::move(parsed.error());
    return StoryIntent{StoryList{.stage = parsed.value().value("--stage")}};
  }
  if (name == "show") {
    auto parsed = expect(scan_args(rest(args), {}, {}), 1, "story show <id>");
    if (!parsed)
      return std::move(parsed.error());
    return StoryIntent{StoryShow{.id = parsed.value().positional.front()}};
  }
  if (name == "delete") {
    auto parsed = expect(scan_args(rest(args), {}, {"--force"}), 1, "story delete <id>");
    if (!parsed)
      return std::move(parsed.error());
    const auto &p = parsed.value();
    return StoryIntent{StoryDelete{.id = p.positional.front(), .force = p.has("--force")}};
  }
  return usage("unknown story subcommand '" + name + "'");
}

Result<WorkspaceIntent> parse_workspace_intent(const std::vector<std::string> &args) {
  auto sub = subcommand(args, "workspace");
  if (!sub)
    return std::move(sub.error());
  const std::string &name = sub.value();

  if (name == "provision" || name == "teardown") {
    auto parsed =
        expect(scan_args(rest(args), {}, {"--force"}), 1, "workspace " + name + " <id>");
    if (!parsed)
      return std::move(parsed.error());
    const auto &p = parsed.value();
    if (name == "provision")
      return WorkspaceIntent{
          WorkspaceProvision{.id = p.positional.front(), .force = p.has("--force")}};
    return WorkspaceIntent{WorkspaceTeardown{.id = p.positional.front(), .force = p.has("--force")}};
  }
  if (name == "status" || name == "fetch") {
    auto parsed = expect(scan_args(rest(args), {}, {}), 1, "workspace " + name + " <id>");
    if (!parsed)
      return std::move(parsed.error());
    const auto &id = parsed.value().positional.front();
    if (name == "status")
      return WorkspaceIntent{WorkspaceShow{.id = id}};
    return WorkspaceIntent{WorkspaceFetch{.id = id}};
  }
  return usage("unknown workspace subcommand '" + name + "'");
}

} // namespace storyflow::cli
