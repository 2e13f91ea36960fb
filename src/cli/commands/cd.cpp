#include "cli/registry.hpp"
#include "treehop/config.hpp"
#include "treehop/context_detector.hpp"
#include "treehop/context_resolver.hpp"
#include "treehop/errors.hpp"
#include "treehop/git_provider.hpp"

#include <filesystem>
#include <iostream>
#include <string>

// Prints the target directory; the shell wrapper performs the actual cd.
int cmd_cd(int argc, char **argv) {
  if (argc != 2)
    return treehop::cli::usage_error("cd");
  const std::string identifier = argv[1];

  try {
    const auto config = treehop::load_config();
    const treehop::ContextDetector detector{config};
    const treehop::LocalGitProvider git;
    const treehop::ContextResolver resolver{config, &git};

    const auto ctx = detector.detect_context(std::filesystem::current_path());
    const auto result = resolver.resolve_identifier(ctx, identifier);
    if (result.type == treehop::PathType::Invalid) {
      std::cerr << "cd: " << result.explanation << "\n";
      return 1;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(result.resolved_path, ec)) {
      if (result.type == treehop::PathType::Worktree)
        std::cerr << "cd: worktree '" << result.project_name << "/" << result.branch_name
                  << "' does not exist (" << result.resolved_path.string() << ")\n";
      else
        std::cerr << "cd: project '" << result.project_name << "' does not exist ("
                  << result.resolved_path.string() << ")\n";
      return 1;
    }

    std::cout << result.resolved_path.string() << "\n";
    return 0;
  } catch (const treehop::ResolutionError &e) {
    std::cerr << "cd: " << e.what() << "\n";
    for (const auto &hint : e.suggestions())
      std::cerr << "  hint: " << hint << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "cd: " << e.what() << "\n";
    return 1;
  }
}
