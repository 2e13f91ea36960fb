#pragma once
#include "cli/command.hpp"

#include <iosfwd>
#include <string_view>

namespace treehop::cli {

// Commands are listed in registration order. Re-registering a name replaces it.
void register_command(const Command& cmd);
const Command* find_command(std::string_view name);

// "usage: treehop <command> [args]" followed by one synopsis line per command.
void print_usage(std::ostream& os);

// Prints "usage: treehop <name> <args>" to stderr and returns kExitUsage.
int usage_error(std::string_view name);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace treehop::cli
