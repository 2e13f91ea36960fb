#include "cli/registry.hpp"
#include "treehop/config.hpp"
#include "treehop/context_detector.hpp"
#include "treehop/context_resolver.hpp"
#include "treehop/git_provider.hpp"

#include <filesystem>
#include <iostream>
#include <string>

// One "text<TAB>description" line per candidate, for shell completion scripts.
int cmd_complete(int argc, char **argv) {
  treehop::SuggestionOptions options;
  std::string partial;
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--existing") {
      options.existing_only = true;
    } else if (arg.rfind("--", 0) == 0 || ++positional > 1) {
      return treehop::cli::usage_error("complete");
    } else {
      partial = arg;
    }
  }

  try {
    const auto config = treehop::load_config();
    const treehop::ContextDetector detector{config};
    const treehop::LocalGitProvider git;
    const treehop::ContextResolver resolver{config, &git};

    const auto ctx = detector.detect_context(std::filesystem::current_path());
    for (const auto &s : resolver.get_resolution_suggestions(ctx, partial, options))
      std::cout << s.text << "\t" << s.description << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "complete: " << e.what() << "\n";
    return 1;
  }
}
