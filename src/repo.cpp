#include "treehop/repo.hpp"

#include "treehop/consts.hpp"
#include "treehop/errors.hpp"
#include "treehop/fs.hpp"
#include "treehop/hash.hpp"
#include "treehop/pathutil.hpp"
#include "treehop/refs.hpp"
#include "treehop/util.hpp"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <sstream>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

// "<admin>/../.." normalizes to "<dir>/"; callers compare file names.
stdfs::path clean_target(const stdfs::path &p) {
  auto n = p.lexically_normal();
  if (!n.has_filename() && n.has_relative_path())
    n = n.parent_path();
  return n;
}

// A directory that is itself an admin dir (bare repo, or a path to .git).
bool looks_like_git_dir(const stdfs::path &p) {
  namespace c = treehop::consts;
  return treehop::fs::is_regular_file(p / c::kHeadFile) &&
         treehop::fs::is_directory(p / c::kObjectsDir) &&
         treehop::fs::is_directory(p / c::kRefsDir);
}

// Read a one-line pointer file ("gitdir", "commondir") relative to `base`.
std::optional<stdfs::path> read_pointer(const stdfs::path &file, const stdfs::path &base) {
  auto text = treehop::fs::read_text(file);
  if (!text)
    return std::nullopt;
  treehop::strutil::rstrip_newlines(*text);
  const stdfs::path target = treehop::strutil::trim(*text);
  if (target.empty())
    return std::nullopt;
  return clean_target(target.is_absolute() ? target : base / target);
}

// Contents of a worktree's .git file: "gitdir: <path>".
std::optional<stdfs::path> read_gitdir_file(const stdfs::path &dotgit) {
  const auto text = treehop::fs::read_text(dotgit);
  if (!text)
    return std::nullopt;
  std::istringstream iss(*text);
  std::string line;
  while (std::getline(iss, line)) {
    if (line.rfind(treehop::consts::kGitDirMarker, 0) != 0)
      continue;
    const stdfs::path target =
        treehop::strutil::trim(std::string_view(line).substr(treehop::consts::kGitDirMarker.size()));
    if (target.empty())
      return std::nullopt;
    return clean_target(target.is_absolute() ? target : dotgit.parent_path() / target);
  }
  return std::nullopt;
}

} // namespace

namespace treehop {

Repository::Repository(stdfs::path root, stdfs::path git_dir, stdfs::path common_dir, bool bare)
    : root_(std::move(root)), git_dir_(std::move(git_dir)), common_dir_(std::move(common_dir)),
      bare_(bare) {}

Repository Repository::open(const stdfs::path &path) {
  if (path.empty())
    throw GitRepositoryError(path, "empty repository path");
  const auto root = normalize_path(path);
  if (!fs::is_directory(root))
    throw GitRepositoryError(root, "not a directory");

  const auto dotgit = root / consts::kGitDir;
  stdfs::path git_dir;
  bool bare = false;
  if (fs::is_directory(dotgit)) {
    git_dir = dotgit;
  } else if (fs::is_regular_file(dotgit)) {
    auto target = read_gitdir_file(dotgit);
    if (!target)
      throw GitRepositoryError(root, "malformed .git file (no gitdir: line)");
    git_dir = *target;
  } else if (looks_like_git_dir(root)) {
    git_dir = root;
    bare = root.filename() != consts::kGitDir;
  } else {
    throw GitRepositoryError(root, "not a git repository");
  }

  if (!fs::is_regular_file(git_dir / consts::kHeadFile))
    throw GitRepositoryError(root, "missing HEAD in " + git_dir.string());

  auto common_dir = read_pointer(git_dir / consts::kCommonDirFile, git_dir).value_or(git_dir);
  if (!fs::is_directory(common_dir / consts::kObjectsDir) ||
      !fs::is_directory(common_dir / consts::kRefsDir))
    throw GitRepositoryError(root, "missing objects/ or refs/ in " + common_dir.string());

  return Repository{root, git_dir, common_dir, bare};
}

std::optional<std::string> Repository::current_branch() const {
  const auto head = read_HEAD(git_dir_);
  if (!head)
    return std::nullopt;
  const auto target = symbolic_target(*head);
  if (!target)
    return std::nullopt;
  return short_branch_name(*target);
}

WorktreeInfo Repository::describe_head(const stdfs::path &admin_dir) const {
  WorktreeInfo info;
  const auto head = read_HEAD(admin_dir);
  if (!head)
    return info;
  if (auto target = symbolic_target(*head)) {
    info.branch = short_branch_name(*target);
    info.head = read_ref(common_dir_, *target).value_or("");
  } else {
    info.is_detached = true;
    info.head = *head;
  }
  return info;
}

std::vector<WorktreeInfo> Repository::worktrees() const {
  std::vector<WorktreeInfo> out;

  // The main checkout lives next to a common dir named ".git".
  if (!bare_ && common_dir_.filename() == consts::kGitDir) {
    auto main = describe_head(common_dir_);
    main.path = common_dir_.parent_path();
    main.is_main = true;
    out.push_back(std::move(main));
  }

  const auto admin_root = common_dir_ / consts::kWorktreesDir;
  if (!fs::is_directory(admin_root))
    return out;

  std::vector<WorktreeInfo> linked;
  std::error_code ec;
  for (stdfs::directory_iterator it(admin_root, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_directory())
      continue;
    const auto admin = it->path();
    const auto dotgit = read_pointer(admin / consts::kGitDirFile, admin);
    if (!dotgit)
      continue; // half-written entry

    auto info = describe_head(admin);
    info.path = dotgit->parent_path();
    info.is_locked = fs::exists(admin / consts::kLockedFile);
    info.is_prunable = !fs::exists(*dotgit);
    linked.push_back(std::move(info));
  }
  std::ranges::sort(linked, [](const WorktreeInfo &a, const WorktreeInfo &b) {
    return a.path < b.path;
  });
  out.insert(out.end(), std::make_move_iterator(linked.begin()),
             std::make_move_iterator(linked.end()));
  return out;
}

std::map<std::string, std::string> Repository::local_branches() const {
  std::map<std::string, std::string> out;
  for (auto &[refname, hex] : list_refs(common_dir_, consts::kHeadsPrefix))
    out[short_branch_name(refname)] = hex;
  return out;
}

std::map<std::string, std::string> Repository::remote_branches() const {
  std::map<std::string, std::string> out;
  for (auto &[refname, hex] : list_refs(common_dir_, consts::kRemotesPrefix)) {
    const std::string name = refname.substr(consts::kRemotesPrefix.size());
    const auto slash = name.find('/');
    if (slash == std::string::npos || name.substr(slash + 1) == consts::kHeadFile)
      continue;
    out[name] = hex;
  }
  return out;
}

std::optional<Repository::CommitInfo> Repository::read_commit(std::string_view commit_hex) const {
  const ObjectStore store{objects_dir()};
  const auto obj = store.read(commit_hex);
  if (!obj)
    return std::nullopt;
  if (obj->type != consts::kTypeCommit)
    throw GitRepositoryError(store.path_for(commit_hex), "object is not a commit");

  CommitInfo info;
  const std::string text(obj->data.begin(), obj->data.end());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t eol = text.find('\n', pos);
    const std::string_view line =
        std::string_view(text).substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
    pos = eol == std::string::npos ? text.size() : eol + 1;
    if (line.empty()) {
      info.message = text.substr(pos);
      break;
    }
    if (line.rfind(consts::kTreePrefix, 0) == 0)
      info.tree_hex = line.substr(consts::kTreePrefix.size());
    else if (line.rfind(consts::kParentPrefix, 0) == 0)
      info.parents.emplace_back(line.substr(consts::kParentPrefix.size()));
    else if (line.rfind(consts::kAuthorPrefix, 0) == 0)
      info.author = line.substr(consts::kAuthorPrefix.size());
    else if (line.rfind(consts::kCommitterPrefix, 0) == 0)
      info.committer = line.substr(consts::kCommitterPrefix.size());
  }
  return info;
}

std::pair<std::string, std::int64_t> Repository::parse_signature(std::string_view line) {
  std::string name;
  std::int64_t when = 0;
  const auto lt = line.find(" <");
  const auto gt = line.find('>');
  name = strutil::trim(line.substr(0, lt));
  if (gt == std::string_view::npos)
    return {name, when};

  std::string_view rest = line.substr(gt + 1);
  while (!rest.empty() && rest.front() == ' ')
    rest.remove_prefix(1);
  const auto space = rest.find(' ');
  const auto stamp = rest.substr(0, space);
  if (const auto res = std::from_chars(stamp.data(), stamp.data() + stamp.size(), when);
      res.ec != std::errc{})
    when = 0;
  return {name, when};
}

// ——— LocalGitProvider ———

std::vector<WorktreeInfo> LocalGitProvider::list_worktrees(const stdfs::path &repo_path) const {
  return Repository::open(repo_path).worktrees();
}

std::vector<BranchInfo> LocalGitProvider::list_branches(const stdfs::path &repo_path) const {
  const auto repo = Repository::open(repo_path);
  const auto current = repo.current_branch();
  const auto local = repo.local_branches();
  const auto remote = repo.remote_branches();

  // Author and time are extras: a corrupt tip leaves them empty, the branch stays listed.
  auto fill_tip = [&repo](BranchInfo &b) {
    if (b.commit.empty())
      return;
    std::optional<Repository::CommitInfo> commit;
    try {
      commit = repo.read_commit(b.commit);
    } catch (const GitRepositoryError &) {
      return;
    }
    if (commit) {
      auto [author, when] = Repository::parse_signature(commit->author);
      b.author = std::move(author);
      b.time = when;
    }
  };

  std::vector<BranchInfo> out;
  for (const auto &[name, hex] : local) {
    BranchInfo b{.name = name, .commit = hex, .is_current = current && *current == name};
    for (const auto &[remote_name, _] : remote) {
      if (remote_name.substr(remote_name.find('/') + 1) == name) {
        b.remote = remote_name;
        break;
      }
    }
    fill_tip(b);
    out.push_back(std::move(b));
  }

  std::map<std::string, bool> seen;
  for (const auto &[remote_name, hex] : remote) {
    const std::string name = remote_name.substr(remote_name.find('/') + 1);
    if (local.contains(name) || seen[name])
      continue;
    seen[name] = true;
    BranchInfo b{.name = name, .remote = remote_name, .commit = hex, .is_remote_only = true};
    fill_tip(b);
    out.push_back(std::move(b));
  }
  return out;
}

void LocalGitProvider::validate_repository(const stdfs::path &path) const {
  (void)Repository::open(path);
}

} // namespace treehop
