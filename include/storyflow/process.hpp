#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace storyflow {

struct ProcessSpec {
  std::vector<std::string> argv;
  std::optional<std::filesystem::path> cwd;
  std::vector<std::pair<std::string, std::string>> env; // added to the inherited environment
  std::chrono::milliseconds timeout{0};                 // 0 = no deadline
};

struct ProcessResult {
  int exit_code = -1; // 127 if the program could not be started
  std::string out;
  std::string err;
  bool timed_out = false;
};

// Seam between the git layer and the operating system.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual ProcessResult run(const ProcessSpec& spec) = 0;
};

// fork/exec with both output streams captured. On timeout the child's whole
// process group is killed.
class PosixCommandRunner : public CommandRunner {
public:
  ProcessResult run(const ProcessSpec& spec) override;
};

} // namespace storyflow
