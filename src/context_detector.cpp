#include "treehop/context_detector.hpp"

#include "treehop/consts.hpp"
#include "treehop/errors.hpp"
#include "treehop/pathutil.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;

namespace treehop {

// ——— WorktreeCache ———

std::optional<bool> WorktreeCache::lookup(const stdfs::path &key) const {
  std::shared_lock lock(mu_);
  const auto it = entries_.find(key);
  if (it == entries_.end() || it->second.expires_at <= Clock::now())
    return std::nullopt;
  return it->second.valid;
}

void WorktreeCache::store(const stdfs::path &key, bool valid) {
  const auto now = Clock::now();
  std::unique_lock lock(mu_);
  std::erase_if(entries_, [now](const auto &kv) { return kv.second.expires_at <= now; });
  entries_[key] = Entry{.valid = valid, .expires_at = now + ttl_};
}

void WorktreeCache::invalidate_under(const stdfs::path &repo_path) {
  std::unique_lock lock(mu_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (is_path_under(repo_path, it->first))
      it = entries_.erase(it);
    else
      ++it;
  }
}

void WorktreeCache::clear() {
  std::unique_lock lock(mu_);
  entries_.clear();
}

std::size_t WorktreeCache::size() const {
  std::shared_lock lock(mu_);
  return entries_.size();
}

// ——— ContextDetector ———

namespace {

std::chrono::milliseconds ttl_from(const Config &config) {
  return std::min(parse_duration(config.cache_ttl).value_or(consts::kDefaultCacheTtl),
                  consts::kMaxCacheTtl);
}

} // namespace

ContextDetector::ContextDetector(Config config, WorktreeProbe probe)
    : config_(std::move(config)),
      probe_(probe ? std::move(probe) : WorktreeProbe{&is_linked_worktree_root}),
      cache_(ttl_from(config_)) {}

Context ContextDetector::detect_context(const stdfs::path &dir) const {
  if (dir.empty())
    throw ContextDetectionError("", "empty directory path");

  std::error_code ec;
  const auto st = stdfs::status(dir, ec);
  if (ec && ec != std::errc::no_such_file_or_directory)
    throw ContextDetectionError(dir.string(), "cannot access directory: " + ec.message());
  if (!stdfs::exists(st))
    throw ContextDetectionError(dir.string(), "directory does not exist");

  stdfs::path normalized;
  try {
    normalized = normalize_path(dir);
  } catch (const std::exception &e) {
    throw ContextDetectionError(dir.string(), std::string("failed to normalize directory: ") +
                                                  e.what());
  }

  if (auto ctx = detect_worktree(normalized))
    return *ctx;
  if (auto ctx = detect_project(normalized))
    return *ctx;

  return Context{.type = ContextType::OutsideGit,
                 .path = normalized,
                 .explanation = "Not in a git repository or worktree"};
}

std::optional<Context> ContextDetector::detect_worktree(const stdfs::path &dir) const {
  const auto worktrees = normalize_path(config_.worktrees_dir);

  const auto rel = dir.lexically_relative(worktrees);
  if (rel.empty() || rel == "." || *rel.begin() == "..")
    return std::nullopt;

  const std::vector<stdfs::path> parts(rel.begin(), rel.end());
  if (parts.size() < 2)
    return std::nullopt; // directly under worktrees/<project>

  const std::string project = parts[0].string();
  const std::string branch = parts[1].string();
  const auto root = worktrees / project / branch;

  // Validate the worktree root, not the (possibly deeper) input directory.
  if (!is_valid_worktree(root))
    return std::nullopt;

  return Context{.type = ContextType::Worktree,
                 .path = dir,
                 .project_name = project,
                 .branch_name = branch,
                 .explanation = "In worktree for project '" + project + "' on branch '" + branch +
                                "'"};
}

std::optional<Context> ContextDetector::detect_project(const stdfs::path &dir) const {
  for (auto current = dir;; current = current.parent_path()) {
    if (has_git_directory(current)) {
      const std::string project = current.filename().string();
      return Context{.type = ContextType::Project,
                     .path = current,
                     .project_name = project,
                     .explanation = "In project directory '" + project + "'"};
    }
    if (current == current.parent_path())
      break;
  }
  return std::nullopt;
}

bool ContextDetector::is_valid_worktree(const stdfs::path &root) const {
  if (auto cached = cache_.lookup(root))
    return *cached;
  const bool valid = probe_(root);
  cache_.store(root, valid);
  return valid;
}

void ContextDetector::invalidate_cache_for_repo(const stdfs::path &repo_path) {
  if (repo_path.empty())
    return;
  cache_.invalidate_under(normalize_path(repo_path));
}

void ContextDetector::clear_cache() { cache_.clear(); }

} // namespace treehop
