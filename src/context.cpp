#include "storyflow/context.hpp"

#include "storyflow/fs.hpp"
#include "storyflow/util.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace storyflow {

namespace {

std::string pattern_for(const std::string &cid) {
  return "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] [" + cid + "] %v";
}

} // namespace

Context::Context(std::string correlation_id, std::shared_ptr<spdlog::logger> logger)
    : correlation_id_(std::move(correlation_id)), logger_(std::move(logger)) {}

Context Context::for_cli(spdlog::level::level_enum console_level) {
  auto cid = random_token();
  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_level(console_level);
  // loggers are not registered globally; each invocation owns its own
  auto logger = std::make_shared<spdlog::logger>("storyflow", console);
  logger->set_level(spdlog::level::trace);
  logger->set_pattern(pattern_for(cid));
  return Context{std::move(cid), std::move(logger)};
}

Context Context::quiet() {
  auto logger =
      std::make_shared<spdlog::logger>("storyflow", std::make_shared<spdlog::sinks::null_sink_mt>());
  logger->set_level(spdlog::level::off);
  return Context{random_token(), std::move(logger)};
}

void Context::attach_audit_log(const std::filesystem::path &log_file) {
  fs::ensure_parent_dir(log_file);
  auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
  file->set_level(spdlog::level::info);
  file->set_pattern(pattern_for(correlation_id_));
  logger_->sinks().push_back(std::move(file));
  logger_->flush_on(spdlog::level::info);
}

} // namespace storyflow
