#pragma once
#include "treehop/consts.hpp"
#include "treehop/git_provider.hpp"
#include "treehop/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treehop {

// A git repository opened from its main checkout, a linked worktree or a
// bare directory. Read-only.
class Repository {
public:
  // Throws GitRepositoryError if `path` is not a repository.
  static Repository open(const std::filesystem::path& path);

  // Directory the repository was opened from
  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  // Per-worktree admin dir (holds HEAD)
  [[nodiscard]] const std::filesystem::path& git_dir() const { return git_dir_; }
  // Shared admin dir (objects, refs, worktrees/)
  [[nodiscard]] const std::filesystem::path& common_dir() const { return common_dir_; }
  [[nodiscard]] bool is_bare() const { return bare_; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return common_dir_ / consts::kObjectsDir;
  }

  // Branch checked out where the repository was opened; std::nullopt when detached.
  [[nodiscard]] std::optional<std::string> current_branch() const;

  // Main checkout first (unless bare), then linked worktrees ordered by path.
  [[nodiscard]] std::vector<WorktreeInfo> worktrees() const;

  // short name -> 40-hex
  [[nodiscard]] std::map<std::string, std::string> local_branches() const;
  // "<remote>/<name>" -> 40-hex, symbolic refs (origin/HEAD) excluded
  [[nodiscard]] std::map<std::string, std::string> remote_branches() const;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents;
    std::string author;      // full author line after "author "
    std::string committer;   // full committer line
    std::string message;
  };

  // Parse a loose commit; std::nullopt if the object is not stored loose.
  // Throws GitRepositoryError for corrupt objects or non-commits.
  [[nodiscard]] std::optional<CommitInfo> read_commit(std::string_view commit_hex) const;

  // "Name <mail> 1714412345 +0300" -> {"Name", 1714412345}
  static auto parse_signature(std::string_view line) -> std::pair<std::string, std::int64_t>;

private:
  Repository(std::filesystem::path root, std::filesystem::path git_dir,
             std::filesystem::path common_dir, bool bare);

  [[nodiscard]] WorktreeInfo describe_head(const std::filesystem::path& admin_dir) const;

  std::filesystem::path root_;
  std::filesystem::path git_dir_;
  std::filesystem::path common_dir_;
  bool bare_ = false;
};

} // namespace treehop
