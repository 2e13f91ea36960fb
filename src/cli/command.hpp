#pragma once
#include <string_view>

namespace treehop::cli {

// Handler receives argv starting at the subcommand name.
using command_fn = int (*)(int argc, char** argv);

// Exit status for a malformed command line.
inline constexpr int kExitUsage = 2;

struct Command {
  std::string_view name;
  std::string_view args;    // synopsis after the name, e.g. "[--existing] <partial>"
  std::string_view summary;
  command_fn run = nullptr;
};

} // namespace treehop::cli
