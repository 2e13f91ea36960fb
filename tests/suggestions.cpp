#include "treehop/context_resolver.hpp"
#include "treehop/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using treehop::Context;
using treehop::ContextType;
using treehop::PathType;
using treehop::ResolutionSuggestion;

// In-memory provider: canned answers per repository path, with switchable failures.
class FakeGit : public treehop::GitProvider {
public:
  std::map<fs::path, std::vector<treehop::WorktreeInfo>> worktrees;
  std::map<fs::path, std::vector<treehop::BranchInfo>> branches;
  std::set<fs::path> repositories;
  bool fail_worktrees = false;
  bool fail_branches = false;

  mutable int worktree_calls = 0;
  mutable int branch_calls = 0;
  mutable std::vector<fs::path> queried;

  std::vector<treehop::WorktreeInfo> list_worktrees(const fs::path &repo_path) const override {
    ++worktree_calls;
    queried.push_back(repo_path);
    if (fail_worktrees)
      throw treehop::GitRepositoryError(repo_path, "worktree listing failed");
    const auto it = worktrees.find(repo_path);
    if (it == worktrees.end())
      throw treehop::GitRepositoryError(repo_path, "not a git repository");
    return it->second;
  }

  std::vector<treehop::BranchInfo> list_branches(const fs::path &repo_path) const override {
    ++branch_calls;
    if (fail_branches)
      throw treehop::GitRepositoryError(repo_path, "branch listing failed");
    const auto it = branches.find(repo_path);
    return it == branches.end() ? std::vector<treehop::BranchInfo>{} : it->second;
  }

  void validate_repository(const fs::path &path) const override {
    if (!repositories.contains(path))
      throw treehop::GitRepositoryError(path, "not a git repository");
  }
};

static const ResolutionSuggestion *find(const std::vector<ResolutionSuggestion> &v,
                                        const std::string &text) {
  const auto it = std::ranges::find(v, text, &ResolutionSuggestion::text);
  return it == v.end() ? nullptr : &*it;
}

static std::string texts(const std::vector<ResolutionSuggestion> &v) {
  std::string out;
  for (const auto &s : v)
    out += s.text + " ";
  return out;
}

struct Fixture {
  fs::path root;
  treehop::Config cfg;
  FakeGit git;
  Context project;
  Context worktree;
};

static void populate(Fixture &f) {
  f.cfg.projects_dir = f.root / "Projects";
  f.cfg.worktrees_dir = f.root / "Worktrees";
  const auto repo = f.root / "Projects" / "acme";
  const auto feature_x = f.root / "Worktrees" / "acme" / "feature-x";
  fs::create_directories(repo);
  fs::create_directories(feature_x);

  f.project = Context{.type = ContextType::Project, .path = repo, .project_name = "acme"};
  f.worktree = Context{.type = ContextType::Worktree,
                       .path = feature_x,
                       .project_name = "acme",
                       .branch_name = "feature-x"};

  const std::vector<treehop::WorktreeInfo> wts = {
      {.path = repo, .branch = "master", .is_main = true},
      {.path = feature_x, .branch = "feature-x"},
      {.path = f.root / "Worktrees" / "acme" / "gone", .branch = "fix-gone", .is_prunable = true},
      {.path = f.root / "Worktrees" / "acme" / "detached", .head = "abc", .is_detached = true},
  };
  const std::vector<treehop::BranchInfo> brs = {
      {.name = "master", .is_current = true},
      {.name = "feature-x"},
      {.name = "fix-gone"},
      {.name = "feature-y", .remote = "origin/feature-y", .is_remote_only = true},
      {.name = "feat/nested"},
  };
  f.git.worktrees[repo] = wts;
  f.git.worktrees[feature_x] = wts;
  f.git.branches[repo] = brs;
  f.git.branches[feature_x] = brs;
  f.git.repositories.insert(repo);
}

static int check_worktree_and_branch_merge(Fixture &f) {
  const treehop::ContextResolver r{f.cfg, &f.git};
  const auto out = r.get_resolution_suggestions(f.project, "fe");

  const auto *x = find(out, "feature-x");
  const auto *y = find(out, "feature-y");
  if (!x || x->type != PathType::Worktree || x->branch_name != "feature-x" ||
      x->project_name != "acme") {
    std::cerr << "feature-x not offered as worktree: " << texts(out) << "\n";
    return 1;
  }
  if (!y || y->type != PathType::Project ||
      y->description.find("create worktree") == std::string::npos) {
    std::cerr << "feature-y not offered as a branch to create: " << texts(out) << "\n";
    return 1;
  }
  if (std::ranges::count(out, std::string("feature-x"), &ResolutionSuggestion::text) != 1) {
    std::cerr << "branch with a worktree offered twice\n";
    return 1;
  }
  if (find(out, "main") || find(out, "master") || find(out, "fix-gone")) {
    std::cerr << "suggestions do not match prefix 'fe': " << texts(out) << "\n";
    return 1;
  }

  // Empty prefix: main first, then worktrees; no detached or main-checkout entries.
  const auto all = r.get_resolution_suggestions(f.project, "");
  if (all.empty() || all.front().text != "main" || all.front().type != PathType::Project) {
    std::cerr << "main not offered first: " << texts(all) << "\n";
    return 1;
  }
  if (std::ranges::count(all, std::string("master"), &ResolutionSuggestion::text) != 0) {
    std::cerr << "main checkout's branch offered: " << texts(all) << "\n";
    return 1;
  }
  for (const auto &s : all) {
    if (s.text.empty()) {
      std::cerr << "detached worktree offered with empty name\n";
      return 1;
    }
  }
  return 0;
}

static int check_degradation(Fixture &f) {
  const treehop::ContextResolver r{f.cfg, &f.git};

  f.git.fail_branches = true;
  auto out = r.get_resolution_suggestions(f.project, "fe");
  f.git.fail_branches = false;
  if (!find(out, "feature-x") || find(out, "feature-y")) {
    std::cerr << "branch failure: expected worktrees only, got " << texts(out) << "\n";
    return 1;
  }

  f.git.fail_worktrees = true;
  const int branch_calls = f.git.branch_calls;
  out = r.get_resolution_suggestions(f.project, "");
  f.git.fail_worktrees = false;
  if (out.size() != 1 || out.front().text != "main") {
    std::cerr << "worktree failure: expected only main, got " << texts(out) << "\n";
    return 1;
  }
  if (f.git.branch_calls != branch_calls) {
    std::cerr << "worktree failure: branches still queried\n";
    return 1;
  }

  // No provider at all
  const treehop::ContextResolver offline{f.cfg};
  out = offline.get_resolution_suggestions(f.project, "m");
  if (out.size() != 1 || out.front().text != "main") {
    std::cerr << "null provider: expected only main, got " << texts(out) << "\n";
    return 1;
  }
  out = offline.get_resolution_suggestions(f.project, "fe");
  if (!out.empty()) {
    std::cerr << "null provider: unexpected suggestions " << texts(out) << "\n";
    return 1;
  }
  return 0;
}

static int check_existing_only(Fixture &f) {
  const treehop::ContextResolver r{f.cfg, &f.git};
  const int branch_calls = f.git.branch_calls;
  const auto out = r.get_resolution_suggestions(f.project, "", {.existing_only = true});
  if (out.size() != 1 || out.front().text != "feature-x") {
    std::cerr << "existing-only: expected feature-x, got " << texts(out) << "\n";
    return 1;
  }
  if (f.git.branch_calls != branch_calls) {
    std::cerr << "existing-only: branches queried\n";
    return 1;
  }
  return 0;
}

static int check_repo_path(Fixture &f) {
  const treehop::ContextResolver r{f.cfg, &f.git};
  f.git.queried.clear();
  (void)r.get_resolution_suggestions(f.worktree, "");
  if (f.git.queried.empty() || f.git.queried.front() != f.worktree.path) {
    std::cerr << "worktree context: provider not queried at the worktree root\n";
    return 1;
  }
  f.git.queried.clear();
  (void)r.get_resolution_suggestions(f.project, "");
  if (f.git.queried.empty() || f.git.queried.front() != f.project.path) {
    std::cerr << "project context: provider not queried at the project root\n";
    return 1;
  }
  return 0;
}

static int check_outside_git(Fixture &f) {
  fs::create_directories(f.root / "Projects" / "notes");
  fs::create_directories(f.root / "Projects" / "acme-docs");
  const Context outside{.type = ContextType::OutsideGit, .path = f.root};

  const treehop::ContextResolver validating{f.cfg, &f.git};
  auto out = validating.get_resolution_suggestions(outside, "");
  if (out.size() != 1 || out.front().text != "acme" || out.front().type != PathType::Project) {
    std::cerr << "validated discovery: expected acme, got " << texts(out) << "\n";
    return 1;
  }

  auto cfg = f.cfg;
  cfg.validate_git = false;
  const treehop::ContextResolver lenient{cfg, &f.git};
  out = lenient.get_resolution_suggestions(outside, "ac");
  if (out.size() != 2 || out[0].text != "acme" || out[1].text != "acme-docs") {
    std::cerr << "unvalidated discovery: expected acme acme-docs, got " << texts(out) << "\n";
    return 1;
  }

  auto missing = f.cfg;
  missing.projects_dir = f.root / "NoSuchDir";
  const treehop::ContextResolver empty{missing, &f.git};
  if (!empty.get_resolution_suggestions(outside, "").empty()) {
    std::cerr << "missing projects dir produced suggestions\n";
    return 1;
  }
  return 0;
}

static int check_cross_project(Fixture &f) {
  const treehop::ContextResolver r{f.cfg, &f.git};
  const Context outside{.type = ContextType::OutsideGit, .path = f.root};

  const auto out = r.get_resolution_suggestions(outside, "acme/fe");
  if (!find(out, "acme/feature-x") || !find(out, "acme/feature-y") || out.size() != 2) {
    std::cerr << "cross-project completion: got " << texts(out) << "\n";
    return 1;
  }
  if (find(out, "acme/feat/nested")) {
    std::cerr << "branch containing '/' offered as cross-project reference\n";
    return 1;
  }
  if (!r.get_resolution_suggestions(outside, "../x").empty() ||
      !r.get_resolution_suggestions(outside, "./fe").empty() ||
      !r.get_resolution_suggestions(outside, "nosuch/fe").empty()) {
    std::cerr << "cross-project completion for invalid project produced suggestions\n";
    return 1;
  }
  return 0;
}

int main() {
  Fixture f;
  f.root = fs::weakly_canonical(fs::temp_directory_path()) /
           ("treehop_suggest_" + std::to_string(std::random_device{}()));

  int rc = 0;
  try {
    populate(f);
    rc = check_worktree_and_branch_merge(f);
    if (rc == 0)
      rc = check_degradation(f);
    if (rc == 0)
      rc = check_existing_only(f);
    if (rc == 0)
      rc = check_repo_path(f);
    if (rc == 0)
      rc = check_outside_git(f);
    if (rc == 0)
      rc = check_cross_project(f);
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }

  std::error_code ec;
  fs::remove_all(f.root, ec);
  if (rc == 0)
    std::cout << "suggestions OK\n";
  return rc;
}
