#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace treehop {

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Read <git_dir>/HEAD without its trailing newline
// (e.g. "ref: refs/heads/main" or a 40-hex id). std::nullopt if missing.
std::optional<std::string> read_HEAD(const std::filesystem::path& git_dir);

// "ref: refs/heads/x" -> "refs/heads/x"; std::nullopt for a detached id.
std::optional<std::string> symbolic_target(std::string_view ref_text);

// "refs/heads/feature/x" -> "feature/x"; other names are returned unchanged.
std::string short_branch_name(std::string_view refname);

// Resolve a ref to a 40-hex id: loose file first (following symbolic refs),
// then packed-refs. std::nullopt if the ref does not exist.
std::optional<std::string> read_ref(const std::filesystem::path& common_dir,
                                    const std::string& refname);

// All refs whose name starts with `prefix` (e.g. "refs/heads/") -> 40-hex id.
// Loose refs shadow packed ones; symbolic refs are skipped.
std::map<std::string, std::string> list_refs(const std::filesystem::path& common_dir,
                                             std::string_view prefix);

// Parse <common_dir>/packed-refs; empty map if the file is absent.
std::map<std::string, std::string> read_packed_refs(const std::filesystem::path& common_dir);

} // namespace treehop
