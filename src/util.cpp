#include "treehop/util.hpp"

#include <cctype>

namespace treehop::strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split(std::string_view str, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = str.find(sep, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(str.substr(start));
      break;
    }
    out.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

std::string to_lower(std::string_view sv) {
  std::string out(sv);
  for (auto &c : out)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace treehop::strutil
