#pragma once
#include "treehop/config.hpp"
#include "treehop/context.hpp"
#include "treehop/git_provider.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace treehop {

// Turns a short identifier ("main", "<branch>", "<project>/<branch>") into a
// path under the configured projects or worktrees directory, relative to a
// detected Context.
class ContextResolver {
public:
  // `git` may be null: resolution works without it, completion then only
  // offers "main" and plain directory names.
  explicit ContextResolver(Config config, const GitProvider* git = nullptr);

  // Throws ResolutionError for an empty identifier, path traversal in any
  // component, or a result outside the configured base directory.
  // A malformed "<project>/<branch>" or an unknown context is not an error:
  // the result has type PathType::Invalid and explains the expected format.
  [[nodiscard]] ResolutionResult resolve_identifier(const Context& ctx,
                                                    std::string_view identifier) const;

  // Completion candidates for `partial`. Never throws because of the git
  // provider: a source that fails contributes nothing.
  [[nodiscard]] std::vector<ResolutionSuggestion>
  get_resolution_suggestions(const Context& ctx, std::string_view partial,
                             SuggestionOptions options = {}) const;

private:
  using Suggestions = std::vector<ResolutionSuggestion>;

  struct SourceFailure {
    std::string source;
    std::string message;
  };

  // Each suggestion source either yields candidates or says why it could not.
  using SourceResult = std::variant<Suggestions, SourceFailure>;
  using WorktreeList = std::variant<std::vector<WorktreeInfo>, SourceFailure>;

  ResolutionResult resolve_main(const Context& ctx) const;
  ResolutionResult resolve_worktree(const Context& ctx, const std::string& branch) const;
  ResolutionResult resolve_project(const Context& ctx, const std::string& project) const;
  ResolutionResult resolve_cross_project(const Context& ctx, const std::string& identifier) const;

  void require_under(const std::filesystem::path& base, const std::filesystem::path& target,
                     const std::string& identifier, const Context& ctx,
                     std::string_view kind) const;

  // Repository to query for a Project or Worktree context.
  std::filesystem::path repo_path_for(const Context& ctx) const;

  WorktreeList fetch_worktrees(const std::filesystem::path& repo_path) const;

  Suggestions main_source(const Context& ctx, std::string_view partial,
                          SuggestionOptions options) const;
  SourceResult worktree_source(const WorktreeList& worktrees, const std::string& project,
                               std::string_view partial, std::string_view text_prefix,
                               SuggestionOptions options) const;
  SourceResult branch_source(const std::filesystem::path& repo_path, const WorktreeList& worktrees,
                             const std::string& project, std::string_view partial,
                             std::string_view text_prefix) const;
  SourceResult project_source(std::string_view partial) const;

  void append(Suggestions& out, SourceResult result) const;

  Config config_;
  const GitProvider* git_;
};

} // namespace treehop
