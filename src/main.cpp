#include "cli/registry.hpp"

#include <iostream>
#include <string_view>

int main(int argc, char **argv) {
  namespace cli = treehop::cli;
  cli::register_all_commands();

  if (argc < 2) {
    cli::print_usage(std::cerr);
    return cli::kExitUsage;
  }
  const std::string_view name = argv[1];
  if (name == "help" || name == "-h" || name == "--help") {
    cli::print_usage(std::cout);
    return 0;
  }

  const auto *cmd = cli::find_command(name);
  if (!cmd) {
    std::cerr << "treehop: unknown command '" << name << "'\n";
    cli::print_usage(std::cerr);
    return cli::kExitUsage;
  }
  return cmd->run(argc - 1, argv + 1);
}
