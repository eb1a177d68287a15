#include "cli/registry.hpp"

#include "storyflow/consts.hpp"

#include <algorithm>

namespace storyflow::cli {

namespace {

struct Entry {
  std::string name;
  command_fn fn;
  std::string help;
};

// kept in registration order, which is the order usage lists them in
std::vector<Entry> &table() {
  static std::vector<Entry> t;
  return t;
}

const Entry *lookup(const std::string &name) {
  const auto &t = table();
  const auto it = std::ranges::find(t, name, &Entry::name);
  return it == t.end() ? nullptr : &*it;
}

} // namespace

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  auto &t = table();
  if (auto it = std::ranges::find(t, name, &Entry::name); it != t.end()) {
    it->fn = fn;
    it->help = help;
    return;
  }
  t.push_back(Entry{.name = name, .fn = fn, .help = help});
}

command_fn find_command(const std::string &name) {
  const Entry *e = lookup(name);
  return e ? e->fn : nullptr;
}

void print_usage(std::ostream &out) {
  out << "usage: storyflow [-p <project-path>] [-v] <command> [args]\n\n";
  out << "commands:\n";
  for (const auto &e : table())
    out << "  " << e.name << "\n" << e.help;
  out << "\nenvironment:\n"
      << "  " << consts::kEnvHome << "              installation home (default $HOME/"
      << consts::kHomeDir << ")\n"
      << "  " << consts::kEnvLockTimeout << "      lock wait in seconds\n"
      << "  " << consts::kEnvNonInteractive << "   never prompt\n"
      << "  " << consts::kEnvLogLevel << "         trace|debug|info|warn|error|off\n";
}

bool print_command_usage(std::ostream &out, const std::string &name) {
  const Entry *e = lookup(name);
  if (!e)
    return false;
  out << "usage: storyflow " << e->name << " <subcommand> [args]\n" << e->help;
  return true;
}

} // namespace storyflow::cli
