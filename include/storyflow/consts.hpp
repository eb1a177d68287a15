#pragma once
#include <array>
#include <cstdint>
#include <string_view>

namespace storyflow::consts {

// Directory and file names (relative to the project path)
inline constexpr std::string_view kDataDir       = ".storyflow";
inline constexpr std::string_view kStoriesDir    = "stories";
inline constexpr std::string_view kKanbanDir     = "kanban";
inline constexpr std::string_view kLocksDir      = "locks";
inline constexpr std::string_view kTemplatesDir  = "templates";
inline constexpr std::string_view kWorkspacesDir = "workspaces";
inline constexpr std::string_view kConfigFile    = "config.yml";
inline constexpr std::string_view kReadmeFile    = "README.md";
inline constexpr std::string_view kAuditLog      = "storyflow.log";
inline constexpr std::string_view kProjectLock   = "project.lock";
inline constexpr std::string_view kStoryExt      = ".md";
inline constexpr std::string_view kLockExt       = ".lock";
inline constexpr std::string_view kPendingExt    = ".pending";

// Workspace root internals
inline constexpr std::string_view kRecordsDir    = ".records";
inline constexpr std::string_view kRecordExt     = ".record";
inline constexpr std::string_view kWsLocksDir    = ".locks";
inline constexpr std::string_view kWsConfigFile  = "config";
inline constexpr std::string_view kScaffoldDir   = ".storyflow";

// Installation home
inline constexpr std::string_view kHomeDir       = ".storyflow";
inline constexpr std::string_view kRegistryFile  = "projects";
inline constexpr std::string_view kRegistryLock  = "projects.lock";
inline constexpr std::string_view kGlobalConfig  = "config";

// Environment
inline constexpr const char *kEnvHome           = "STORYFLOW_HOME";
inline constexpr const char *kEnvLockTimeout    = "STORYFLOW_LOCK_TIMEOUT";
inline constexpr const char *kEnvNonInteractive = "STORYFLOW_NON_INTERACTIVE";
inline constexpr const char *kEnvLogLevel       = "STORYFLOW_LOG_LEVEL";

// ——— Defaults ———
inline constexpr std::array<std::string_view, 5> kDefaultStages = {
    "planning", "in-progress", "testing", "pr", "complete"};
inline constexpr std::string_view kDefaultBranchTemplate = "story/{id}";
inline constexpr std::size_t kPrefixLen = 5;
inline constexpr char kPrefixPad = 'X';

inline constexpr int kDefaultLockTimeoutSeconds  = 30;
inline constexpr int kDefaultCloneRetries        = 3;
inline constexpr int kDefaultCloneTimeoutSeconds = 300;
inline constexpr int kDefaultRetryBackoffMs      = 500;
inline constexpr int kDefaultFetchStaleSeconds   = 300;

// ——— Story markdown ———
inline constexpr std::string_view kCreatedPrefix  = "**Created:** ";
inline constexpr std::string_view kRepoPrefix     = "**Repository:** ";
inline constexpr std::string_view kStrategyPrefix = "**Branch Strategy:** ";

// ——— Exit codes ———
inline constexpr int kExitValidation = 1;
inline constexpr int kExitConflict   = 2;
inline constexpr int kExitGit        = 3;
inline constexpr int kExitTimeout    = 4;

} // namespace storyflow::consts
