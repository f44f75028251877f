#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace jobtree::consts {

// Store layout
inline constexpr std::string_view kStoreDir      = ".jobtree";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kTagsDir       = "tags";
inline constexpr std::string_view kWorktreesDir  = "worktrees";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kIndexFile     = "index";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kRegistryLock  = "worktrees.lock";
inline constexpr std::string_view kDefaultBranch = "master";

// Linked worktree bookkeeping
inline constexpr std::string_view kGitdirFile    = "gitdir";
inline constexpr std::string_view kCommondirFile = "commondir";
inline constexpr std::string_view kLinkPrefix    = "jobtreedir: ";

// Per-directory ignore file honoured by snapshots and `add -A`
inline constexpr std::string_view kIgnoreFile = ".jobtreeignore";

// Object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644;
inline constexpr std::uint32_t kModeExec    = 0100755;
inline constexpr std::uint32_t kModeSymlink = 0120000;
inline constexpr std::uint32_t kModeTree    = 0040000;

// Object ids (SHA-1)
inline constexpr std::size_t kOidRawLen = 20;
inline constexpr std::size_t kOidHexLen = 40;
inline constexpr std::size_t kFanoutDirHexLen = 2;

// Commit header prefixes
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kHeadsRefPrefix  = "refs/heads/";

inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// Isolated views
inline constexpr std::string_view kViewContainerPrefix = "jobtree-job-";
inline constexpr std::string_view kViewCodeDir         = "code";
inline constexpr std::string_view kSideContainerPrefix = "jobtree-snapshot-";

// Snapshot defaults
inline constexpr std::string_view kDefaultBranchPrefix = "slurm-job";
inline constexpr std::string_view kDefaultRemote       = "origin";

} // namespace jobtree::consts
