#pragma once
#include "cli/registry.hpp"
#include "storyflow/error.hpp"
#include "storyflow/workbench.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/common.h>

namespace storyflow::cli {

// Visitor built from lambdas, for dispatching command intents.
template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Print the error (with hint and git's stderr) and return its exit code.
int report(const Error& err);

// stdin is a terminal and STORYFLOW_NON_INTERACTIVE is not set.
bool interactive();

// Ask a yes/no question on stderr; anything but y/yes is "no".
bool confirm(const std::string& question);

// warn, or debug with --verbose; STORYFLOW_LOG_LEVEL overrides both.
auto console_level(bool verbose) -> spdlog::level::level_enum;

// Open the project at `path` and attach its audit log to the context.
auto open_workbench(Invocation& inv, const std::filesystem::path& path)
    -> Result<std::unique_ptr<Workbench>>;

} // namespace storyflow::cli
