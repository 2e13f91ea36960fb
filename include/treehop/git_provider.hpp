#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace treehop {

struct WorktreeInfo {
  std::filesystem::path path; // working directory of the worktree
  std::string branch;         // short name; empty when detached
  std::string head;           // 40-hex commit, empty for an unborn branch
  bool is_main = false;       // the repository's own checkout
  bool is_detached = false;
  bool is_locked = false;
  bool is_prunable = false;   // administrative entry whose directory is gone
};

struct BranchInfo {
  std::string name;           // short name ("feature-x")
  std::string remote;         // "origin/feature-x" when a tracking ref exists
  std::string commit;         // 40-hex tip
  std::string author;         // from the tip commit, when it is readable
  std::int64_t time = 0;      // author timestamp (seconds since epoch), 0 if unknown
  bool is_current = false;    // checked out in the repository's main worktree
  bool is_remote_only = false;
};

// Read-only view of git repositories used by resolution and completion.
// Implementations report failures by throwing (GitRepositoryError).
class GitProvider {
public:
  virtual ~GitProvider() = default;

  virtual std::vector<WorktreeInfo> list_worktrees(const std::filesystem::path& repo_path) const = 0;
  virtual std::vector<BranchInfo> list_branches(const std::filesystem::path& repo_path) const = 0;

  // Throws GitRepositoryError if `path` is not a repository.
  virtual void validate_repository(const std::filesystem::path& path) const = 0;
};

// Portable provider that reads repositories straight from disk.
class LocalGitProvider : public GitProvider {
public:
  std::vector<WorktreeInfo> list_worktrees(const std::filesystem::path& repo_path) const override;
  std::vector<BranchInfo> list_branches(const std::filesystem::path& repo_path) const override;
  void validate_repository(const std::filesystem::path& path) const override;
};

} // namespace treehop
