#include "treehop/context_resolver.hpp"

#include "treehop/consts.hpp"
#include "treehop/errors.hpp"
#include "treehop/pathutil.hpp"
#include "treehop/util.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

namespace stdfs = std::filesystem;

namespace treehop {

namespace {

const std::vector<std::string> kBranchFormats = {
    "Use a valid project or branch name without '..' or path separators"};
const std::vector<std::string> kCrossProjectFormats = {
    "Use format 'project/branch' with valid names"};

bool has_prefix(std::string_view s, std::string_view prefix) { return s.rfind(prefix, 0) == 0; }

// "project/branch" -> {project, branch}; anything else is not a reference.
std::optional<std::pair<std::string, std::string>> split_reference(std::string_view identifier) {
  const auto parts = strutil::split(identifier, '/');
  if (parts.size() != 2 || parts[0].empty() || parts[1].empty())
    return std::nullopt;
  return std::make_pair(parts[0], parts[1]);
}

std::string context_label(const Context &ctx) { return ctx.path.string(); }

// "." names the directory it sits in, never a project or branch of its own.
bool is_dot(std::string_view component) { return component == "."; }

} // namespace

ContextResolver::ContextResolver(Config config, const GitProvider *git)
    : config_(std::move(config)), git_(git) {}

// ——— Resolution ———

ResolutionResult ContextResolver::resolve_identifier(const Context &ctx,
                                                     std::string_view identifier_in) const {
  const std::string identifier(identifier_in);
  if (identifier.empty())
    throw ResolutionError("", context_label(ctx), "empty identifier",
                          {"'main'", "'<branch>'", "'<project>/<branch>'"});

  const bool reference = identifier.find('/') != std::string::npos;
  switch (ctx.type) {
  case ContextType::Project:
  case ContextType::Worktree:
    if (identifier == consts::kMainIdentifier)
      return resolve_main(ctx);
    if (reference)
      return resolve_cross_project(ctx, identifier);
    return resolve_worktree(ctx, identifier);
  case ContextType::OutsideGit:
    if (reference)
      return resolve_cross_project(ctx, identifier);
    return resolve_project(ctx, identifier);
  case ContextType::Unknown:
    break;
  }
  return ResolutionResult{.type = PathType::Invalid,
                          .explanation = "Cannot resolve identifier '" + identifier +
                                         "' from an unknown context; expected 'main', "
                                         "'<branch>' or '<project>/<branch>'"};
}

ResolutionResult ContextResolver::resolve_main(const Context &ctx) const {
  const std::string identifier(consts::kMainIdentifier);
  if (ctx.project_name.empty() || is_dot(ctx.project_name) ||
      contains_path_traversal(ctx.project_name))
    throw ResolutionError(identifier, context_label(ctx),
                          "project name '" + ctx.project_name + "' is empty or contains path "
                          "traversal sequences",
                          kBranchFormats);

  auto path = config_.projects_dir / ctx.project_name;
  require_under(config_.projects_dir, path, identifier, ctx, "project");
  return ResolutionResult{.resolved_path = std::move(path),
                          .type = PathType::Project,
                          .project_name = ctx.project_name,
                          .explanation = "Resolved 'main' to project root '" + ctx.project_name +
                                         "'"};
}

ResolutionResult ContextResolver::resolve_worktree(const Context &ctx,
                                                   const std::string &branch) const {
  if (contains_path_traversal(ctx.project_name) || contains_path_traversal(branch))
    throw ResolutionError(branch, context_label(ctx),
                          "project or branch name contains path traversal sequences",
                          kBranchFormats);
  if (ctx.project_name.empty())
    throw ResolutionError(branch, context_label(ctx), "context has no project name",
                          kBranchFormats);
  if (is_dot(ctx.project_name) || is_dot(branch))
    throw ResolutionError(branch, context_label(ctx), "'.' is not a project or branch name",
                          kBranchFormats);

  auto path = config_.worktrees_dir / ctx.project_name / branch;
  require_under(config_.worktrees_dir, path, branch, ctx, "worktree");
  return ResolutionResult{.resolved_path = std::move(path),
                          .type = PathType::Worktree,
                          .project_name = ctx.project_name,
                          .branch_name = branch,
                          .explanation = "Resolved '" + branch + "' to worktree of project '" +
                                         ctx.project_name + "'"};
}

ResolutionResult ContextResolver::resolve_project(const Context &ctx,
                                                  const std::string &project) const {
  if (contains_path_traversal(project))
    throw ResolutionError(project, context_label(ctx),
                          "project name contains path traversal sequences",
                          {"Use a valid project name without '..' or path separators"});
  if (is_dot(project))
    throw ResolutionError(project, context_label(ctx), "'.' is not a project name",
                          {"Use a valid project name without '..' or path separators"});

  auto path = config_.projects_dir / project;
  require_under(config_.projects_dir, path, project, ctx, "project");
  return ResolutionResult{.resolved_path = std::move(path),
                          .type = PathType::Project,
                          .project_name = project,
                          .explanation = "Resolved '" + project + "' to project directory"};
}

ResolutionResult ContextResolver::resolve_cross_project(const Context &ctx,
                                                        const std::string &identifier) const {
  if (contains_path_traversal(identifier))
    throw ResolutionError(identifier, context_label(ctx),
                          "identifier contains path traversal sequences", kCrossProjectFormats);

  const auto reference = split_reference(identifier);
  if (!reference)
    return ResolutionResult{.type = PathType::Invalid,
                            .explanation = "Invalid cross-project reference format: '" +
                                           identifier + "'. Expected: project/branch"};

  const auto &[project, branch] = *reference;
  if (is_dot(project) || is_dot(branch))
    throw ResolutionError(identifier, context_label(ctx), "'.' is not a project or branch name",
                          kCrossProjectFormats);
  auto path = config_.worktrees_dir / project / branch;
  require_under(config_.worktrees_dir, path, identifier, ctx, "worktree");
  return ResolutionResult{.resolved_path = std::move(path),
                          .type = PathType::Worktree,
                          .project_name = project,
                          .branch_name = branch,
                          .explanation = "Resolved '" + identifier + "' to worktree of project '" +
                                         project + "'"};
}

void ContextResolver::require_under(const stdfs::path &base, const stdfs::path &target,
                                    const std::string &identifier, const Context &ctx,
                                    std::string_view kind) const {
  const std::string what(kind);
  if (base.empty())
    throw ResolutionError(identifier, context_label(ctx), what + "s directory is not configured");

  bool under = false;
  try {
    under = is_path_under(base, target);
  } catch (const std::exception &e) {
    throw ResolutionError(identifier, context_label(ctx),
                          "path validation failed for " + target.string() + ": " + e.what());
  }
  if (!under)
    throw ResolutionError(identifier, context_label(ctx),
                          what + " path " + target.string() + " is outside configured " + what +
                              "s directory " + base.string());
}

// ——— Suggestions ———

std::vector<ResolutionSuggestion>
ContextResolver::get_resolution_suggestions(const Context &ctx, std::string_view partial,
                                            SuggestionOptions options) const {
  Suggestions out;

  // "<project>/<branch-prefix>": complete branches of another project.
  if (const auto slash = partial.find('/'); slash != std::string_view::npos) {
    const std::string project(partial.substr(0, slash));
    const auto branch_partial = partial.substr(slash + 1);
    if (project.empty() || is_dot(project) || contains_path_traversal(project) ||
        branch_partial.find('/') != std::string_view::npos || config_.projects_dir.empty())
      return out;
    const auto repo_path = config_.projects_dir / project;
    const std::string prefix = project + "/";
    const auto worktrees = fetch_worktrees(repo_path);
    append(out, worktree_source(worktrees, project, branch_partial, prefix, options));
    if (!options.existing_only)
      append(out, branch_source(repo_path, worktrees, project, branch_partial, prefix));
    // Cross-project references cannot address branches containing '/'.
    std::erase_if(out, [](const ResolutionSuggestion &s) {
      return s.branch_name.find('/') != std::string::npos;
    });
    return out;
  }

  switch (ctx.type) {
  case ContextType::Project:
  case ContextType::Worktree: {
    append(out, main_source(ctx, partial, options));
    if (!git_ || ctx.project_name.empty())
      break;
    const auto repo_path = repo_path_for(ctx);
    const auto worktrees = fetch_worktrees(repo_path);
    append(out, worktree_source(worktrees, ctx.project_name, partial, "", options));
    if (!options.existing_only)
      append(out, branch_source(repo_path, worktrees, ctx.project_name, partial, ""));
    break;
  }
  case ContextType::OutsideGit:
    append(out, project_source(partial));
    break;
  case ContextType::Unknown:
    break;
  }
  return out;
}

stdfs::path ContextResolver::repo_path_for(const Context &ctx) const {
  if (ctx.type == ContextType::Worktree)
    return normalize_path(config_.worktrees_dir) / ctx.project_name / ctx.branch_name;
  return ctx.path;
}

ContextResolver::WorktreeList ContextResolver::fetch_worktrees(const stdfs::path &repo_path) const {
  if (!git_)
    return SourceFailure{"worktrees", "no git provider configured"};
  try {
    return git_->list_worktrees(repo_path);
  } catch (const std::exception &e) {
    return SourceFailure{"worktrees", e.what()};
  }
}

ContextResolver::Suggestions ContextResolver::main_source(const Context &ctx,
                                                          std::string_view partial,
                                                          SuggestionOptions options) const {
  // "main" is never an existing worktree.
  if (options.existing_only || !has_prefix(consts::kMainIdentifier, partial))
    return {};
  return {ResolutionSuggestion{.text = std::string(consts::kMainIdentifier),
                               .description = "Project root directory",
                               .type = PathType::Project,
                               .project_name = ctx.project_name}};
}

ContextResolver::SourceResult
ContextResolver::worktree_source(const WorktreeList &worktrees, const std::string &project,
                                 std::string_view partial, std::string_view text_prefix,
                                 SuggestionOptions options) const {
  const auto *list = std::get_if<std::vector<WorktreeInfo>>(&worktrees);
  if (!list)
    return std::get<SourceFailure>(worktrees);

  Suggestions out;
  for (const auto &wt : *list) {
    // The main checkout is reached through "main"; detached worktrees have no name.
    if (wt.is_main || wt.branch.empty() || !has_prefix(wt.branch, partial))
      continue;
    if (options.existing_only && !stdfs::exists(wt.path))
      continue;
    out.push_back(ResolutionSuggestion{.text = std::string(text_prefix) + wt.branch,
                                       .description = "Worktree for branch " + wt.branch,
                                       .type = PathType::Worktree,
                                       .project_name = project,
                                       .branch_name = wt.branch});
  }
  return out;
}

ContextResolver::SourceResult
ContextResolver::branch_source(const stdfs::path &repo_path, const WorktreeList &worktrees,
                               const std::string &project, std::string_view partial,
                               std::string_view text_prefix) const {
  // Without the worktree list we cannot tell which branches still need one.
  const auto *list = std::get_if<std::vector<WorktreeInfo>>(&worktrees);
  if (!list)
    return SourceFailure{"branches", "skipped: worktree list unavailable"};

  std::vector<BranchInfo> branches;
  try {
    branches = git_->list_branches(repo_path);
  } catch (const std::exception &e) {
    return SourceFailure{"branches", e.what()};
  }

  std::set<std::string> with_worktree;
  for (const auto &wt : *list)
    with_worktree.insert(wt.branch);

  Suggestions out;
  for (const auto &b : branches) {
    if (!has_prefix(b.name, partial) || with_worktree.contains(b.name))
      continue;
    out.push_back(ResolutionSuggestion{.text = std::string(text_prefix) + b.name,
                                       .description = "Branch " + b.name + " (create worktree)",
                                       .type = PathType::Project,
                                       .project_name = project,
                                       .branch_name = b.name});
  }
  return out;
}

ContextResolver::SourceResult ContextResolver::project_source(std::string_view partial) const {
  const auto &dir = config_.projects_dir;
  if (dir.empty())
    return Suggestions{};

  std::error_code ec;
  if (!stdfs::exists(dir, ec))
    return Suggestions{};

  std::vector<stdfs::path> candidates;
  for (stdfs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec))
      candidates.push_back(it->path());
  }
  if (ec)
    return SourceFailure{"projects", "cannot scan " + dir.string() + ": " + ec.message()};
  std::ranges::sort(candidates);

  Suggestions out;
  for (const auto &path : candidates) {
    const std::string name = path.filename().string();
    if (!has_prefix(name, partial))
      continue;
    if (config_.validate_git && git_) {
      try {
        git_->validate_repository(path);
      } catch (const std::exception &) {
        continue; // not a repository: not a project
      }
    }
    out.push_back(ResolutionSuggestion{.text = name,
                                       .description = "Project directory",
                                       .type = PathType::Project,
                                       .project_name = name});
  }
  return out;
}

void ContextResolver::append(Suggestions &out, SourceResult result) const {
  if (auto *items = std::get_if<Suggestions>(&result)) {
    out.insert(out.end(), std::make_move_iterator(items->begin()),
               std::make_move_iterator(items->end()));
    return;
  }
  const auto &failure = std::get<SourceFailure>(result);
  if (config_.verbose)
    std::cerr << "complete: " << failure.source << " unavailable: " << failure.message << "\n";
}

} // namespace treehop
