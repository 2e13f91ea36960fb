#include "cli/registry.hpp"

#include "treehop/consts.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace treehop::cli {

namespace {

std::vector<Command> &commands() {
  static std::vector<Command> all;
  return all;
}

std::string synopsis(const Command &cmd) {
  std::string out(cmd.name);
  if (!cmd.args.empty())
    out.append(" ").append(cmd.args);
  return out;
}

} // namespace

void register_command(const Command &cmd) {
  auto &all = commands();
  const auto it = std::ranges::find(all, cmd.name, &Command::name);
  if (it != all.end())
    *it = cmd;
  else
    all.push_back(cmd);
}

const Command *find_command(std::string_view name) {
  const auto &all = commands();
  const auto it = std::ranges::find(all, name, &Command::name);
  return it == all.end() ? nullptr : &*it;
}

void print_usage(std::ostream &os) {
  os << "usage: " << consts::kAppName << " <command> [args]\n\ncommands:\n";
  std::size_t width = 0;
  for (const auto &cmd : commands())
    width = std::max(width, synopsis(cmd).size());
  for (const auto &cmd : commands()) {
    const std::string line = synopsis(cmd);
    os << "  " << line << std::string(width - line.size() + 2, ' ') << cmd.summary << "\n";
  }
}

int usage_error(std::string_view name) {
  if (const auto *cmd = find_command(name))
    std::cerr << "usage: " << consts::kAppName << " " << synopsis(*cmd) << "\n";
  else
    print_usage(std::cerr);
  return kExitUsage;
}

} // namespace treehop::cli
