#include "cli/registry.hpp"
#include "treehop/config.hpp"
#include "treehop/context_detector.hpp"
#include "treehop/git_provider.hpp"
#include "treehop/pathutil.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace {

void print_worktrees(const treehop::GitProvider &git, const std::filesystem::path &repo,
                     const std::string &project) {
  std::cout << project << " (" << repo.string() << ")\n";
  for (const auto &wt : git.list_worktrees(repo)) {
    const std::string name = wt.is_main       ? "main"
                             : wt.is_detached ? "(detached " + wt.head.substr(0, 7) + ")"
                                              : wt.branch;
    std::cout << "  " << name;
    if (wt.is_main && !wt.branch.empty())
      std::cout << " [" << wt.branch << "]";
    if (wt.is_locked)
      std::cout << " (locked)";
    if (wt.is_prunable)
      std::cout << " (prunable)";
    std::cout << "\t" << wt.path.string() << "\n";
  }
}

} // namespace

int cmd_list(int argc, char ** /*argv*/) {
  if (argc != 1)
    return treehop::cli::usage_error("list");
  try {
    const auto config = treehop::load_config();
    const treehop::ContextDetector detector{config};
    const treehop::LocalGitProvider git;

    const auto ctx = detector.detect_context(std::filesystem::current_path());
    if (ctx.type == treehop::ContextType::Project) {
      print_worktrees(git, ctx.path, ctx.project_name);
      return 0;
    }
    if (ctx.type == treehop::ContextType::Worktree) {
      print_worktrees(git, treehop::normalize_path(config.worktrees_dir) / ctx.project_name /
                               ctx.branch_name,
                      ctx.project_name);
      return 0;
    }

    // Outside git: every repository under the projects directory.
    std::vector<std::filesystem::path> projects;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(config.projects_dir, ec), end;
         !ec && it != end; it.increment(ec)) {
      if (it->is_directory() && treehop::has_git_directory(it->path()))
        projects.push_back(it->path());
    }
    if (ec) {
      std::cerr << "list: cannot scan " << config.projects_dir.string() << ": " << ec.message()
                << "\n";
      return 1;
    }
    std::ranges::sort(projects);
    for (const auto &p : projects)
      print_worktrees(git, p, p.filename().string());
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "list: " << e.what() << "\n";
    return 1;
  }
}
