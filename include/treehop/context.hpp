#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace treehop {

enum class ContextType : std::uint8_t { Unknown, Project, Worktree, OutsideGit };

enum class PathType : std::uint8_t { Project, Worktree, Invalid };

// Where the user currently is. Immutable once the detector hands it out.
struct Context {
  ContextType type = ContextType::Unknown;
  std::filesystem::path path; // project root, worktree dir, or the normalized input
  std::string project_name;   // empty for OutsideGit
  std::string branch_name;    // Worktree only
  std::string explanation;

  bool operator==(const Context&) const = default;
};

// A concrete target for an identifier. Never cached.
struct ResolutionResult {
  std::filesystem::path resolved_path; // empty when type == Invalid
  PathType type = PathType::Invalid;
  std::string project_name;
  std::string branch_name;
  std::string explanation;
};

// One completion candidate.
struct ResolutionSuggestion {
  std::string text;
  std::string description;
  PathType type = PathType::Invalid;
  std::string project_name;
  std::string branch_name;
};

struct SuggestionOptions {
  bool existing_only = false; // only worktrees whose directory still exists
};

std::string_view to_string(ContextType type);
std::string_view to_string(PathType type);

} // namespace treehop
