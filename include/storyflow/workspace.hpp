#pragma once
#include "storyflow/context.hpp"
#include "storyflow/error.hpp"
#include "storyflow/git.hpp"
#include "storyflow/scaffold.hpp"
#include "storyflow/story.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace storyflow {

enum class WorkspaceStatus : std::uint8_t { Unprovisioned, Cloning, Ready, Failed };

auto status_name(WorkspaceStatus s) -> std::string_view;
auto parse_status(std::string_view s) -> std::optional<WorkspaceStatus>;

// Persisted in <workspace-root>/.records/<id>.record. The last line is a
// CRC-32 of everything above it; a record that fails the check is read back
// as Failed.
struct WorkspaceRecord {
  std::string story_id;
  std::filesystem::path path;
  std::string remote; // redacted
  std::string branch; // empty = remote default branch
  WorkspaceStatus status = WorkspaceStatus::Unprovisioned;
  std::string owner;   // pid of the last writer
  std::string updated; // ISO-8601
  int attempts = 0;    // provisioning attempts so far
  std::string error;   // last failure, one line
};

auto serialize_record(const WorkspaceRecord& rec) -> std::string;
auto parse_record(std::string_view text) -> WorkspaceRecord;

// Branch name for a story. `strategy` is a keyword (story, feature, fix...),
// "none", or a template with {id}, {prefix} and {number}; empty selects
// `project_template`. nullopt means "stay on the default branch".
auto branch_for(std::string_view story_id, std::string_view strategy,
                std::string_view project_template) -> Result<std::optional<std::string>>;

// Network failures worth another attempt. Authentication and missing
// repositories are not.
bool is_transient(const Error& err);

struct ProvisionerOptions {
  std::filesystem::path root;
  std::chrono::milliseconds lock_timeout{std::chrono::seconds(30)};
  int clone_retries = 3;
  std::chrono::milliseconds retry_backoff{500};
  bool non_interactive = false;
  // Asked after retries are exhausted on a transient failure, with no lock
  // held. Returning true provisions again from scratch.
  std::function<bool(const Error&)> confirm_retry;
};

struct ProvisionRequest {
  const Story& story;
  std::string project_name;
  std::string branch_template;
  bool force = false; // remove a path that exists without a record
};

// Materializes one git working tree per story under the workspace root.
// Provisioning is serialized per workspace path by a lock named after the
// SHA-1 of the path.
class WorkspaceProvisioner {
public:
  WorkspaceProvisioner(GitRepositoryManager& git, ScaffoldRenderer& renderer,
                       ProvisionerOptions options);

  auto provision(Context& ctx, const ProvisionRequest& request) -> Result<WorkspaceRecord>;

  // Record of `id`; status Unprovisioned if there is none.
  auto status(std::string_view id) const -> Result<WorkspaceRecord>;

  // Remove the working tree and record. A path without a record is only
  // removed with `force`. Returns false if there was nothing to remove.
  auto teardown(Context& ctx, std::string_view id, bool force) -> Result<bool>;

  // fetch-if-stale on a ready workspace.
  auto fetch(Context& ctx, std::string_view id, std::chrono::seconds staleness) -> Result<bool>;

  [[nodiscard]] auto workspace_path(std::string_view id) const -> std::filesystem::path;
  [[nodiscard]] auto record_path(std::string_view id) const -> std::filesystem::path;
  [[nodiscard]] auto lock_path(const std::filesystem::path& workspace) const
      -> std::filesystem::path;

private:
  auto read_record(std::string_view id) const -> std::optional<WorkspaceRecord>;
  void write_record(WorkspaceRecord& rec) const;
  bool usable(const WorkspaceRecord& rec, std::string_view id);
  // One locked provisioning run, clone retries included.
  auto provision_once(Context& ctx, const ProvisionRequest& request) -> Result<WorkspaceRecord>;
  auto clone_with_retry(Context& ctx, const std::string& url, const std::filesystem::path& dest)
      -> Result<bool>;
  auto write_scaffold(const std::filesystem::path& dir, const ScaffoldVars& vars) -> Result<void>;
  auto fail(Context& ctx, WorkspaceRecord& rec, Error err) const -> Error;

  GitRepositoryManager& git_;
  ScaffoldRenderer& renderer_;
  ProvisionerOptions options_;
};

} // namespace storyflow
