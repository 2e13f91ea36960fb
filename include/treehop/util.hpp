#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace treehop::strutil {

// Strip trailing CR/LF characters in place
void rstrip_newlines(std::string& str);

// Strip spaces, tabs and CR from both ends
auto trim(std::string_view sv) -> std::string;

// Split on `sep`, keeping empty fields ("a//b" -> {"a", "", "b"})
auto split(std::string_view str, char sep) -> std::vector<std::string>;

auto to_lower(std::string_view sv) -> std::string;

} // namespace treehop::strutil
