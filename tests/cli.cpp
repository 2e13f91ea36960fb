#include "cli/registry.hpp"

#include <iostream>
#include <sstream>
#include <string>

static int fake_run(int, char **) { return 7; }

static int check_registered_commands() {
  treehop::cli::register_all_commands();
  for (const char *name : {"context", "cd", "list", "complete"}) {
    const auto *cmd = treehop::cli::find_command(name);
    if (!cmd || !cmd->run || cmd->summary.empty()) {
      std::cerr << "command '" << name << "' not registered\n";
      return 1;
    }
  }
  if (treehop::cli::find_command("checkout")) {
    std::cerr << "unknown command found\n";
    return 1;
  }

  std::ostringstream usage;
  treehop::cli::print_usage(usage);
  const std::string text = usage.str();
  for (const char *synopsis : {"usage: treehop <command>", "context [dir]", "complete [--existing] <partial>",
                               "cd <main|branch|project|project/branch>", "  list  "}) {
    if (text.find(synopsis) == std::string::npos) {
      std::cerr << "usage lacks '" << synopsis << "':\n" << text;
      return 1;
    }
  }
  // Registration order is kept.
  if (text.find("context [dir]") > text.find("complete [--existing]")) {
    std::cerr << "usage not in registration order\n";
    return 1;
  }
  return 0;
}

static int check_usage_errors() {
  if (treehop::cli::usage_error("cd") != treehop::cli::kExitUsage ||
      treehop::cli::usage_error("no-such-command") != treehop::cli::kExitUsage) {
    std::cerr << "usage_error does not return the usage exit status\n";
    return 1;
  }
  // Malformed command lines are rejected before any configuration is read.
  char prog[] = "complete";
  char bad_flag[] = "--bogus";
  char *argv[] = {prog, bad_flag, nullptr};
  const auto *complete = treehop::cli::find_command("complete");
  if (!complete || complete->run(2, argv) != treehop::cli::kExitUsage) {
    std::cerr << "complete accepted an unknown flag\n";
    return 1;
  }
  char cd[] = "cd";
  char *cd_argv[] = {cd, nullptr};
  if (treehop::cli::find_command("cd")->run(1, cd_argv) != treehop::cli::kExitUsage) {
    std::cerr << "cd without identifier did not exit with usage status\n";
    return 1;
  }
  return 0;
}

static int check_replace() {
  treehop::cli::register_command({.name = "list", .summary = "replaced", .run = fake_run});
  const auto *cmd = treehop::cli::find_command("list");
  if (!cmd || cmd->summary != "replaced" || cmd->run(0, nullptr) != 7) {
    std::cerr << "re-registering did not replace the command\n";
    return 1;
  }
  return 0;
}

int main() {
  int rc = check_registered_commands();
  if (rc == 0)
    rc = check_usage_errors();
  if (rc == 0)
    rc = check_replace();
  if (rc == 0)
    std::cout << "cli OK\n";
  return rc;
}
