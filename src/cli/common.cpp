#include "cli/common.hpp"

#include "storyflow/config.hpp"
#include "storyflow/consts.hpp"
#include "storyflow/util.hpp"

#include <cstdlib>
#include <iostream>
#include <unistd.h>

namespace storyflow::cli {

int report(const Error &err) {
  std::cerr << "error: " << describe(err) << "\n";
  if (err.git && !err.git->stderr_text.empty()) {
    std::cerr << "git " << err.git->operation << " said:\n";
    for (const auto &line : strutil::split(err.git->stderr_text, '\n')) {
      if (!line.empty())
        std::cerr << "  " << line << "\n";
    }
  }
  if (!err.hint.empty())
    std::cerr << "hint: " << err.hint << "\n";
  return exit_code_for(err.kind);
}

bool interactive() { return !non_interactive_from_env() && ::isatty(STDIN_FILENO) == 1; }

bool confirm(const std::string &question) {
  std::cerr << question << " [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer))
    return false;
  answer = strutil::to_lower(strutil::trim(answer));
  return answer == "y" || answer == "yes";
}

spdlog::level::level_enum console_level(bool verbose) {
  if (const char *env = std::getenv(consts::kEnvLogLevel); env && *env) {
    const auto level = spdlog::level::from_str(strutil::to_lower(env));
    // from_str maps unknown names to off
    if (level != spdlog::level::off || strutil::to_lower(env) == "off")
      return level;
  }
  return verbose ? spdlog::level::debug : spdlog::level::warn;
}

Result<std::unique_ptr<Workbench>> open_workbench(Invocation &inv,
                                                  const std::filesystem::path &path) {
  WorkbenchOptions options{.installation = Installation::from_env(),
                           .runner = nullptr,
                           .renderer = nullptr,
                           .confirm_retry = {}};
  if (interactive()) {
    options.confirm_retry = [](const Error &err) {
      return confirm("clone kept failing (" + err.message + "). Try again?");
    };
  }
  auto bench = Workbench::open(inv.ctx, path, std::move(options));
  if (!bench)
    return bench;
  try {
    inv.ctx.attach_audit_log(bench.value()->project().audit_log());
  } catch (const std::exception &e) {
    // the command still runs without its audit trail
    inv.ctx.log().warn("audit log unavailable: {}", e.what());
  }
  return bench;
}

} // namespace storyflow::cli
