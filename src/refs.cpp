#include "treehop/refs.hpp"

#include "treehop/consts.hpp"
#include "treehop/fs.hpp"
#include "treehop/hash.hpp"
#include "treehop/util.hpp"

#include <sstream>

namespace stdfs = std::filesystem;

namespace treehop {

namespace {

// Symbolic refs can chain (refs/remotes/origin/HEAD -> refs/remotes/origin/main).
constexpr int kMaxSymrefDepth = 5;

std::optional<std::string> read_loose(const stdfs::path &common_dir, const std::string &refname) {
  auto text = fs::read_text(common_dir / refname);
  if (!text)
    return std::nullopt;
  strutil::rstrip_newlines(*text);
  return text;
}

} // namespace

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsPrefix) + std::string(branch);
}

std::optional<std::string> read_HEAD(const stdfs::path &git_dir) {
  return read_loose(git_dir, std::string(consts::kHeadFile));
}

std::optional<std::string> symbolic_target(std::string_view ref_text) {
  if (ref_text.rfind(consts::kRefPrefix, 0) != 0)
    return std::nullopt;
  return strutil::trim(ref_text.substr(consts::kRefPrefix.size()));
}

std::string short_branch_name(std::string_view refname) {
  if (refname.rfind(consts::kHeadsPrefix, 0) == 0)
    return std::string(refname.substr(consts::kHeadsPrefix.size()));
  return std::string(refname);
}

std::optional<std::string> read_ref(const stdfs::path &common_dir, const std::string &refname) {
  std::string name = refname;
  for (int depth = 0; depth < kMaxSymrefDepth; ++depth) {
    if (auto loose = read_loose(common_dir, name)) {
      if (auto target = symbolic_target(*loose)) {
        name = *target;
        continue;
      }
      if (looks_hex40(*loose))
        return loose;
      return std::nullopt;
    }
    const auto packed = read_packed_refs(common_dir);
    if (const auto it = packed.find(name); it != packed.end())
      return it->second;
    return std::nullopt;
  }
  return std::nullopt;
}

std::map<std::string, std::string> list_refs(const stdfs::path &common_dir,
                                             std::string_view prefix) {
  std::map<std::string, std::string> out;
  for (auto &[name, hex] : read_packed_refs(common_dir)) {
    if (name.rfind(prefix, 0) == 0)
      out[name] = hex;
  }

  const auto base = common_dir / prefix;
  if (!fs::is_directory(base))
    return out;

  std::error_code ec;
  for (auto it = stdfs::recursive_directory_iterator(base, ec);
       !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file())
      continue;
    const std::string refname =
        std::string(prefix) + stdfs::relative(it->path(), base).generic_string();
    auto text = read_loose(common_dir, refname);
    if (text && looks_hex40(*text))
      out[refname] = *text;
  }
  return out;
}

std::map<std::string, std::string> read_packed_refs(const stdfs::path &common_dir) {
  std::map<std::string, std::string> out;
  const auto text = fs::read_text(common_dir / consts::kPackedRefs);
  if (!text)
    return out;

  std::istringstream iss(*text);
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty() || line[0] == '#' || line[0] == '^')
      continue; // header, or peeled tag line
    const auto space = line.find(' ');
    if (space == std::string::npos)
      continue;
    const std::string hex = line.substr(0, space);
    if (looks_hex40(hex))
      out[line.substr(space + 1)] = hex;
  }
  return out;
}

} // namespace treehop
