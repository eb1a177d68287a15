#include "cli/common.hpp"
#include "cli/intents.hpp"
#include "cli/registry.hpp"

#include "storyflow/context.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  storyflow::cli::register_all_commands(); // defined in register_commands.cpp

  const std::vector<std::string> args(argv + 1, argv + argc);
  auto cl = storyflow::cli::parse_command_line(args);
  if (!cl) {
    storyflow::cli::print_usage(std::cerr);
    return storyflow::cli::report(cl.error());
  }
  const std::string &cmd = cl.value().command;
  if (cmd == "help") {
    const auto &topic = cl.value().args;
    if (topic.empty() || !storyflow::cli::print_command_usage(std::cout, topic.front()))
      storyflow::cli::print_usage(std::cout);
    return 0;
  }

  const auto fn = storyflow::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    storyflow::cli::print_usage(std::cerr);
    return 1;
  }

  try {
    auto ctx = storyflow::Context::for_cli(storyflow::cli::console_level(cl.value().globals.verbose));
    storyflow::cli::Invocation inv{.ctx = ctx, .globals = cl.value().globals};
    ctx.log().debug("storyflow {} (cid {})", cmd, ctx.correlation_id());
    return fn(inv, cl.value().args);
  } catch (const std::exception &e) {
    std::cerr << "storyflow: " << e.what() << "\n";
    return 1;
  }
}
