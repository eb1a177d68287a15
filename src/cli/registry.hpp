#pragma once
#include "storyflow/context.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace storyflow::cli {

// Options that precede the command: storyflow [-p <path>] [-v] <command> ...
struct GlobalOptions {
  std::filesystem::path project = ".";
  bool verbose = false;
};

struct Invocation {
  Context& ctx;
  GlobalOptions globals;
};

// Handlers receive the arguments after the command name.
using command_fn = int (*)(Invocation& inv, const std::vector<std::string>& args);

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);
void print_usage(std::ostream& out);
// Help of one command; false if no such command is registered.
bool print_command_usage(std::ostream& out, const std::string& name);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace storyflow::cli
