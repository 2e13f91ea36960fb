#include "treehop/context.hpp"

namespace treehop {

std::string_view to_string(ContextType type) {
  switch (type) {
  case ContextType::Project:
    return "project";
  case ContextType::Worktree:
    return "worktree";
  case ContextType::OutsideGit:
    return "outside-git";
  case ContextType::Unknown:
    break;
  }
  return "unknown";
}

std::string_view to_string(PathType type) {
  switch (type) {
  case PathType::Project:
    return "project";
  case PathType::Worktree:
    return "worktree";
  case PathType::Invalid:
    break;
  }
  return "invalid";
}

} // namespace treehop
