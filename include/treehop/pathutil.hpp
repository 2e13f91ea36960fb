#pragma once
#include <filesystem>
#include <string_view>

namespace treehop {

// Lexically clean `path`, make it absolute against the working directory and
// resolve symlinks. When symlinks cannot be resolved the absolute, unresolved
// form is returned instead. Normalizing a normalized path is a no-op.
// Throws std::runtime_error if no absolute form can be computed.
std::filesystem::path normalize_path(const std::filesystem::path& path);

// Is `target` inside `base` (or equal to it)? Both sides are symlink-resolved
// independently before comparing, so a link placed inside `base` that points
// elsewhere is judged by where it points.
//   both empty  -> true
//   one empty   -> throws std::invalid_argument
// is_path_under("/foo/bar", "/foo") is false.
bool is_path_under(const std::filesystem::path& base, const std::filesystem::path& target);

// True if `s` contains "..", either literally or after one or two rounds of
// percent-decoding ("%2e%2e", "%252e%252e").
bool contains_path_traversal(std::string_view s);

// `dir/.git` is a regular file containing "gitdir:" (a linked worktree root).
bool is_linked_worktree_root(const std::filesystem::path& dir);

// `dir/.git` is a directory (a main checkout).
bool has_git_directory(const std::filesystem::path& dir);

} // namespace treehop
