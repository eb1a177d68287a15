#include "storyflow/workspace.hpp"

#include "storyflow/consts.hpp"
#include "storyflow/fs.hpp"
#include "storyflow/hash.hpp"
#include "storyflow/lock.hpp"
#include "storyflow/time.hpp"
#include "storyflow/util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace stdfs = std::filesystem;

namespace storyflow {

namespace {

constexpr std::string_view kChecksumKey = "checksum";

// stderr fragments of network failures that may succeed on a second try
constexpr std::array<std::string_view, 9> kTransientMarkers = {
    "connection reset",      "connection refused", "could not resolve host",
    "timed out",             "early eof",          "the remote end hung up",
    "temporary failure",     "network is unreachable",
    "rpc failed",
};

constexpr auto kMaxBackoff = std::chrono::seconds(30);

std::string one_line(std::string s) {
  std::ranges::replace(s, '\n', ' ');
  std::ranges::replace(s, '\r', ' ');
  return strutil::trim(s);
}

} // namespace

std::string_view status_name(WorkspaceStatus s) {
  switch (s) {
  case WorkspaceStatus::Unprovisioned:
    return "unprovisioned";
  case WorkspaceStatus::Cloning:
    return "cloning";
  case WorkspaceStatus::Ready:
    return "ready";
  case WorkspaceStatus::Failed:
    return "failed";
  }
  return "unknown";
}

std::optional<WorkspaceStatus> parse_status(std::string_view s) {
  for (const auto st : {WorkspaceStatus::Unprovisioned, WorkspaceStatus::Cloning,
                        WorkspaceStatus::Ready, WorkspaceStatus::Failed}) {
    if (status_name(st) == s)
      return st;
  }
  return std::nullopt;
}

std::string serialize_record(const WorkspaceRecord &rec) {
  std::ostringstream os;
  os << "story: " << rec.story_id << '\n'
     << "path: " << rec.path.string() << '\n'
     << "remote: " << rec.remote << '\n'
     << "branch: " << rec.branch << '\n'
     << "status: " << status_name(rec.status) << '\n'
     << "owner: " << rec.owner << '\n'
     << "updated: " << rec.updated << '\n'
     << "attempts: " << rec.attempts << '\n'
     << "error: " << one_line(rec.error) << '\n';
  std::string body = os.str();
  body += std::string(kChecksumKey) + ": " + crc32_hex(body) + "\n";
  return body;
}

WorkspaceRecord parse_record(std::string_view text) {
  WorkspaceRecord rec;
  std::string body;
  std::string checksum;
  std::istringstream iss{std::string(text)};
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    const auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    const std::string key = line.substr(0, colon);
    const std::string value = strutil::trim(std::string_view(line).substr(colon + 1));
    if (key == kChecksumKey) {
      checksum = value;
      break;
    }
    body += line + "\n";
    if (key == "story")
      rec.story_id = value;
    else if (key == "path")
      rec.path = value;
    else if (key == "remote")
      rec.remote = value;
    else if (key == "branch")
      rec.branch = value;
    else if (key == "status")
      rec.status = parse_status(value).value_or(WorkspaceStatus::Failed);
    else if (key == "owner")
      rec.owner = value;
    else if (key == "updated")
      rec.updated = value;
    else if (key == "attempts")
      rec.attempts = static_cast<int>(strutil::parse_int(value).value_or(0));
    else if (key == "error")
      rec.error = value;
  }
  if (checksum.empty() || checksum != crc32_hex(body)) {
    rec.status = WorkspaceStatus::Failed;
    rec.error = "record checksum mismatch; treated as failed";
  }
  return rec;
}

Result<std::optional<std::string>> branch_for(std::string_view story_id,
                                              std::string_view strategy,
                                              std::string_view project_template) {
  std::string tmpl = strutil::trim(strategy.empty() ? project_template : strategy);
  if (tmpl.empty() || tmpl == "none")
    return std::optional<std::string>{};
  const bool keyword = std::ranges::all_of(tmpl, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
  });
  if (keyword)
    tmpl += "/{id}";

  const auto dash = story_id.rfind('-');
  const std::string prefix(dash == std::string_view::npos ? story_id : story_id.substr(0, dash));
  const std::string number(dash == std::string_view::npos ? std::string_view{}
                                                          : story_id.substr(dash + 1));
  std::string branch = strutil::replace_all(tmpl, "{id}", story_id);
  branch = strutil::replace_all(std::move(branch), "{prefix}", prefix);
  branch = strutil::replace_all(std::move(branch), "{number}", number);
  if (!is_valid_branch_name(branch)) {
    return make_error(ErrorKind::Validation,
                      "branch strategy '" + tmpl + "' yields invalid branch name '" + branch + "'");
  }
  return std::optional<std::string>{std::move(branch)};
}

bool is_transient(const Error &err) {
  if (err.kind != ErrorKind::Git || !err.git)
    return false;
  const std::string text = strutil::to_lower(err.git->stderr_text);
  return std::ranges::any_of(kTransientMarkers, [&](std::string_view m) {
    return text.find(m) != std::string::npos;
  });
}

// WorkspaceProvisioner

WorkspaceProvisioner::WorkspaceProvisioner(GitRepositoryManager &git, ScaffoldRenderer &renderer,
                                           ProvisionerOptions options)
    : git_(git), renderer_(renderer), options_(std::move(options)) {}

auto WorkspaceProvisioner::workspace_path(std::string_view id) const -> stdfs::path {
  return options_.root / std::string(id);
}

auto WorkspaceProvisioner::record_path(std::string_view id) const -> stdfs::path {
  return options_.root / consts::kRecordsDir / (std::string(id) + std::string(consts::kRecordExt));
}

auto WorkspaceProvisioner::lock_path(const stdfs::path &workspace) const -> stdfs::path {
  const auto key = stdfs::absolute(workspace).lexically_normal().string();
  return options_.root / consts::kWsLocksDir / (to_hex(sha1(key)) + std::string(consts::kLockExt));
}

auto WorkspaceProvisioner::read_record(std::string_view id) const
    -> std::optional<WorkspaceRecord> {
  const auto file = record_path(id);
  if (!fs::exists(file))
    return std::nullopt;
  return parse_record(fs::read_text(file));
}

void WorkspaceProvisioner::write_record(WorkspaceRecord &rec) const {
  rec.owner = std::to_string(::getpid());
  rec.updated = timeutil::now_iso8601();
  fs::write_text_atomic(record_path(rec.story_id), serialize_record(rec));
}

bool WorkspaceProvisioner::usable(const WorkspaceRecord &rec, std::string_view id) {
  return rec.status == WorkspaceStatus::Ready && rec.story_id == id && git_.is_worktree(rec.path);
}

Error WorkspaceProvisioner::fail(Context &ctx, WorkspaceRecord &rec, Error err) const {
  // a timeout leaves the record in `cloning`; the next call treats it as stale
  if (err.kind != ErrorKind::Timeout) {
    rec.status = WorkspaceStatus::Failed;
    rec.error = describe(err);
    try {
      write_record(rec);
    } catch (const std::exception &e) {
      ctx.log().error("cannot record failure of {}: {}", rec.story_id, e.what());
    }
  }
  ctx.log().error("provisioning {} failed: {}", rec.story_id, err.message);
  return err;
}

Result<bool> WorkspaceProvisioner::clone_with_retry(Context &ctx, const std::string &url,
                                                    const stdfs::path &dest) {
  auto backoff = options_.retry_backoff;
  int retries_left = options_.clone_retries;
  for (int attempt = 1;; ++attempt) {
    auto cloned = git_.clone_if_absent(ctx, url, dest);
    if (cloned)
      return cloned;
    Error &err = cloned.error();
    if (!is_transient(err))
      return std::move(err);

    if (retries_left-- == 0)
      return std::move(err);
    ctx.log().warn("clone attempt {} failed ({}); retrying in {}ms", attempt,
                   one_line(err.git->stderr_text), backoff.count());
    std::error_code ec;
    stdfs::remove_all(dest, ec); // partial clones are never trusted
    std::this_thread::sleep_for(backoff);
    backoff = std::min<std::chrono::milliseconds>(backoff * 2, kMaxBackoff);
  }
}

Result<void> WorkspaceProvisioner::write_scaffold(const stdfs::path &dir,
                                                  const ScaffoldVars &vars) {
  auto files = renderer_.render(vars);
  if (!files)
    return std::move(files.error());
  try {
    const auto scaffold = dir / consts::kScaffoldDir;
    for (const auto &f : files.value())
      fs::write_text_atomic(scaffold / f.relative, f.content);

    // keep the scaffold out of `git status`
    const auto exclude = dir / ".git" / "info" / "exclude";
    const std::string entry = "/" + std::string(consts::kScaffoldDir) + "/";
    std::string text = fs::exists(exclude) ? fs::read_text(exclude) : std::string{};
    if (text.find(entry) == std::string::npos) {
      if (!text.empty() && text.back() != '\n')
        text += '\n';
      text += entry + "\n";
      fs::write_text_atomic(exclude, text);
    }
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, std::string("writing scaffold: ") + e.what());
  }
  return {};
}

Result<WorkspaceRecord> WorkspaceProvisioner::provision(Context &ctx,
                                                        const ProvisionRequest &request) {
  for (;;) {
    auto rec = provision_once(ctx, request);
    if (rec || !is_transient(rec.error()))
      return rec;
    // the failed record is written and the workspace lock released before asking
    if (options_.non_interactive || !options_.confirm_retry ||
        !options_.confirm_retry(rec.error()))
      return rec;
    ctx.log().info("provisioning {} again on request", request.story.id);
  }
}

Result<WorkspaceRecord> WorkspaceProvisioner::provision_once(Context &ctx,
                                                             const ProvisionRequest &request) {
  const Story &story = request.story;
  if (!story.repository || story.repository->url.empty()) {
    return make_error(ErrorKind::Validation, "story " + story.id + " has no repository",
                      "create the story with --repo or add a remote to the project");
  }
  const std::string &url = story.repository->url;
  auto branch = branch_for(story.id, story.repository->branch_strategy, request.branch_template);
  if (!branch)
    return std::move(branch.error());

  const auto dest = workspace_path(story.id);
  try {
    if (auto rec = read_record(story.id); rec && usable(*rec, story.id)) {
      ctx.log().debug("workspace of {} already ready", story.id);
      return *rec;
    }

    auto lock = FileLock::acquire(lock_path(dest), options_.lock_timeout);
    if (!lock) {
      return make_error(ErrorKind::Busy,
                        "workspace " + dest.string() + " is being provisioned by another invocation",
                        "wait for it to finish, or raise lock_timeout_seconds");
    }

    // re-read under the lock: the other invocation may have finished
    auto existing = read_record(story.id);
    if (existing && usable(*existing, story.id)) {
      ctx.log().info("workspace of {} was provisioned concurrently", story.id);
      return *existing;
    }
    if (existing && existing->story_id != story.id) {
      return make_error(ErrorKind::StateConflict,
                        "record " + record_path(story.id).string() + " belongs to story " +
                            existing->story_id);
    }
    if (existing) {
      // cloning (holder died), failed or untrusted: start again from scratch
      ctx.log().warn("workspace of {} is {}; re-provisioning", story.id,
                     status_name(existing->status));
      std::error_code ec;
      stdfs::remove_all(dest, ec);
      if (ec) {
        return make_error(ErrorKind::Io, "cannot remove " + dest.string() + ": " + ec.message());
      }
    } else if (fs::exists(dest)) {
      if (!request.force) {
        return make_error(ErrorKind::StateConflict,
                          dest.string() + " exists but no workspace record owns it",
                          "inspect it, or re-run with --force to remove it");
      }
      ctx.log().warn("removing unowned path {} (--force)", dest.string());
      std::error_code ec;
      stdfs::remove_all(dest, ec);
      if (ec) {
        return make_error(ErrorKind::Io, "cannot remove " + dest.string() + ": " + ec.message());
      }
    }

    WorkspaceRecord rec;
    rec.story_id = story.id;
    rec.path = dest;
    rec.remote = redact_url(url);
    rec.branch = branch.value().value_or("");
    rec.status = WorkspaceStatus::Cloning;
    rec.attempts = existing ? existing->attempts + 1 : 1;
    write_record(rec);

    auto cloned = clone_with_retry(ctx, url, dest);
    if (!cloned)
      return fail(ctx, rec, std::move(cloned.error()));

    if (!rec.branch.empty()) {
      if (auto ok = git_.checkout_or_create_branch(ctx, dest, rec.branch); !ok)
        return fail(ctx, rec, std::move(ok.error()));
    }

    const ScaffoldVars vars{.story_id = story.id,
                            .title = story.title,
                            .branch = rec.branch,
                            .project = request.project_name,
                            .remote = rec.remote,
                            .story_text = story.file.empty() || !fs::exists(story.file)
                                              ? std::string{}
                                              : fs::read_text(story.file)};
    if (auto ok = write_scaffold(dest, vars); !ok)
      return fail(ctx, rec, std::move(ok.error()));

    rec.status = WorkspaceStatus::Ready;
    rec.error.clear();
    write_record(rec);
    ctx.log().info("workspace of {} ready at {} ({})", story.id, dest.string(),
                   rec.branch.empty() ? std::string("default branch") : rec.branch);
    return rec;
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
}

Result<WorkspaceRecord> WorkspaceProvisioner::status(std::string_view id) const {
  try {
    if (auto rec = read_record(id))
      return *rec;
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
  WorkspaceRecord rec;
  rec.story_id = std::string(id);
  rec.path = workspace_path(id);
  return rec;
}

Result<bool> WorkspaceProvisioner::teardown(Context &ctx, std::string_view id, bool force) {
  const auto dest = workspace_path(id);
  try {
    auto lock = FileLock::acquire(lock_path(dest), options_.lock_timeout);
    if (!lock) {
      return make_error(ErrorKind::Busy, "workspace " + dest.string() + " is in use");
    }
    const bool has_record = fs::exists(record_path(id));
    if (!has_record && fs::exists(dest) && !force) {
      return make_error(ErrorKind::StateConflict,
                        dest.string() + " exists but no workspace record owns it",
                        "remove it by hand, or re-run with --force");
    }
    bool removed = false;
    if (fs::exists(dest)) {
      std::error_code ec;
      stdfs::remove_all(dest, ec);
      if (ec) {
        return make_error(ErrorKind::Io, "cannot remove " + dest.string() + ": " + ec.message());
      }
      removed = true;
    }
    if (fs::remove_entry(record_path(id)))
      removed = true;
    if (removed)
      ctx.log().info("tore down workspace of {}", id);
    return removed;
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
}

Result<bool> WorkspaceProvisioner::fetch(Context &ctx, std::string_view id,
                                         std::chrono::seconds staleness) {
  auto rec = status(id);
  if (!rec)
    return std::move(rec.error());
  if (rec.value().status != WorkspaceStatus::Ready) {
    return make_error(ErrorKind::StateConflict,
                      "workspace of " + std::string(id) + " is " +
                          std::string(status_name(rec.value().status)),
                      "run 'storyflow workspace provision " + std::string(id) + "'");
  }
  try {
    auto lock = FileLock::acquire(lock_path(rec.value().path), options_.lock_timeout);
    if (!lock) {
      return make_error(ErrorKind::Busy, "workspace " + rec.value().path.string() + " is in use");
    }
    return git_.fetch_if_stale(ctx, rec.value().path, staleness);
  } catch (const std::exception &e) {
    return make_error(ErrorKind::Io, e.what());
  }
}

} // namespace storyflow
