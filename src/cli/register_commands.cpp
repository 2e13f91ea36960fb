#include "cli/registry.hpp"

int cmd_context(int, char **);
int cmd_cd(int, char **);
int cmd_list(int, char **);
int cmd_complete(int, char **);

namespace treehop::cli {

void register_all_commands() {
  register_command({.name = "context",
                    .args = "[dir]",
                    .summary = "Show whether dir (default: cwd) is a project, worktree or neither",
                    .run = ::cmd_context});
  register_command({.name = "cd",
                    .args = "<main|branch|project|project/branch>",
                    .summary = "Print the directory an identifier resolves to",
                    .run = ::cmd_cd});
  register_command({.name = "list",
                    .summary = "List worktrees of the current project, or of every project",
                    .run = ::cmd_list});
  register_command({.name = "complete",
                    .args = "[--existing] <partial>",
                    .summary = "Print completion candidates as text<TAB>description",
                    .run = ::cmd_complete});
}

} // namespace treehop::cli
