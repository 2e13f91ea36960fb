#include "treehop/pathutil.hpp"

#include "treehop/consts.hpp"
#include "treehop/fs.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace stdfs = std::filesystem;

namespace {

// "/a/b/" -> "/a/b"; keeps "/" alone.
stdfs::path drop_trailing_separator(stdfs::path p) {
  if (!p.has_filename() && p.has_relative_path())
    return p.parent_path();
  return p;
}

stdfs::path clean(const stdfs::path &p) {
  return drop_trailing_separator(p.lexically_normal());
}

// Resolves every existing prefix of `abs`; on failure returns `abs` untouched.
stdfs::path resolve_or_keep(const stdfs::path &abs) {
  std::error_code ec;
  auto resolved = stdfs::weakly_canonical(abs, ec);
  if (ec || resolved.empty())
    return abs;
  return clean(resolved);
}

// Like normalize_path, but without the lexical pass before resolution: "link/.."
// must mean the parent of wherever the link points.
stdfs::path resolve_physical(const stdfs::path &p) {
  std::error_code ec;
  auto abs = stdfs::absolute(p, ec);
  if (ec)
    throw std::runtime_error("failed to make path absolute " + p.string() + ": " + ec.message());
  auto resolved = stdfs::weakly_canonical(abs, ec);
  if (ec || resolved.empty())
    return clean(abs);
  return clean(resolved);
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

// Query-string unescape: "%XX" -> byte, '+' -> ' '. A malformed escape
// makes the whole input undecodable.
std::optional<std::string> percent_decode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '%') {
      if (i + 2 >= s.size())
        return std::nullopt;
      const int hi = hex_value(s[i + 1]);
      const int lo = hex_value(s[i + 2]);
      if (hi < 0 || lo < 0)
        return std::nullopt;
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else if (c == '+') {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

} // namespace

namespace treehop {

stdfs::path normalize_path(const stdfs::path &path) {
  std::error_code ec;
  auto abs = stdfs::absolute(clean(path), ec);
  if (ec)
    throw std::runtime_error("failed to normalize path " + path.string() + ": " + ec.message());
  return resolve_or_keep(clean(abs));
}

bool is_path_under(const stdfs::path &base, const stdfs::path &target) {
  if (base.empty() && target.empty())
    return true;
  if (base.empty() || target.empty())
    throw std::invalid_argument("is_path_under: base and target must both be set (base='" +
                                base.string() + "', target='" + target.string() + "')");

  const auto resolved_base = resolve_physical(base);
  const auto resolved_target = resolve_physical(target);

  const auto rel = resolved_target.lexically_relative(resolved_base);
  if (rel.empty())
    return false; // no common root
  if (rel == ".")
    return true;
  return *rel.begin() != "..";
}

bool contains_path_traversal(std::string_view s) {
  if (s.find("..") != std::string_view::npos)
    return true;

  const auto once = percent_decode(s);
  if (!once || *once == s)
    return false;
  if (once->find("..") != std::string::npos)
    return true;

  const auto twice = percent_decode(*once);
  return twice && *twice != *once && twice->find("..") != std::string::npos;
}

bool is_linked_worktree_root(const stdfs::path &dir) {
  const auto git_path = dir / consts::kGitDir;
  if (!fs::is_regular_file(git_path))
    return false;
  const auto content = fs::read_text(git_path);
  return content && content->find(consts::kGitDirMarker) != std::string::npos;
}

bool has_git_directory(const stdfs::path &dir) { return fs::is_directory(dir / consts::kGitDir); }

} // namespace treehop
