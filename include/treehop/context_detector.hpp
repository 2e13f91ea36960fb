#pragma once
#include "treehop/config.hpp"
#include "treehop/context.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace treehop {

// Time-bounded cache of "is this directory a linked worktree root" answers,
// keyed by normalized path. Safe for concurrent use.
class WorktreeCache {
public:
  using Clock = std::chrono::steady_clock;

  explicit WorktreeCache(std::chrono::milliseconds ttl) : ttl_(ttl) {}

  [[nodiscard]] std::optional<bool> lookup(const std::filesystem::path& key) const;
  // Also drops every expired entry.
  void store(const std::filesystem::path& key, bool valid);

  // Drop every entry whose key lies under `repo_path` (already normalized).
  void invalidate_under(const std::filesystem::path& repo_path);
  void clear();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::chrono::milliseconds ttl() const { return ttl_; }

private:
  struct Entry {
    bool valid;
    Clock::time_point expires_at;
  };

  std::chrono::milliseconds ttl_;
  mutable std::shared_mutex mu_;
  std::map<std::filesystem::path, Entry> entries_;
};

// Classifies a directory as Worktree, Project or OutsideGit, in that order.
class ContextDetector {
public:
  // Filesystem check run for a candidate worktree root on cache miss.
  using WorktreeProbe = std::function<bool(const std::filesystem::path&)>;

  explicit ContextDetector(Config config, WorktreeProbe probe = {});

  // Throws ContextDetectionError if `dir` is empty, missing or unreadable.
  [[nodiscard]] Context detect_context(const std::filesystem::path& dir) const;

  // Call after creating, deleting or pruning worktrees of `repo_path`.
  void invalidate_cache_for_repo(const std::filesystem::path& repo_path);
  void clear_cache();
  [[nodiscard]] std::size_t cache_size() const { return cache_.size(); }

  [[nodiscard]] const Config& config() const { return config_; }

private:
  [[nodiscard]] std::optional<Context> detect_worktree(const std::filesystem::path& dir) const;
  [[nodiscard]] std::optional<Context> detect_project(const std::filesystem::path& dir) const;
  [[nodiscard]] bool is_valid_worktree(const std::filesystem::path& root) const;

  Config config_;
  WorktreeProbe probe_;
  mutable WorktreeCache cache_;
};

} // namespace treehop
