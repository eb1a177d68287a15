#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace storyflow {

// Per-invocation state handed to every component call: a correlation id
// stamped on each log line and the logger that receives them.
class Context {
public:
  Context(std::string correlation_id, std::shared_ptr<spdlog::logger> logger);

  // stderr sink at `console_level`; the correlation id is generated.
  static Context for_cli(spdlog::level::level_enum console_level);

  // Discards everything. Used by tests and library callers that do not log.
  static Context quiet();

  // Add a file sink appending to `log_file` (the project audit log).
  void attach_audit_log(const std::filesystem::path& log_file);

  [[nodiscard]] const std::string& correlation_id() const { return correlation_id_; }
  [[nodiscard]] spdlog::logger& log() const { return *logger_; }

private:
  std::string correlation_id_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace storyflow
