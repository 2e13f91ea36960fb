#include "cli/registry.hpp"
#include "treehop/config.hpp"
#include "treehop/context_detector.hpp"

#include <filesystem>
#include <iostream>

int cmd_context(int argc, char **argv) {
  if (argc > 2)
    return treehop::cli::usage_error("context");
  try {
    const auto config = treehop::load_config();
    const std::filesystem::path dir = argc >= 2 ? argv[1] : std::filesystem::current_path();

    const treehop::ContextDetector detector{config};
    const auto ctx = detector.detect_context(dir);

    std::cout << "type:    " << treehop::to_string(ctx.type) << "\n";
    std::cout << "path:    " << ctx.path.string() << "\n";
    if (!ctx.project_name.empty())
      std::cout << "project: " << ctx.project_name << "\n";
    if (!ctx.branch_name.empty())
      std::cout << "branch:  " << ctx.branch_name << "\n";
    std::cout << ctx.explanation << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "context: " << e.what() << "\n";
    return 1;
  }
}
