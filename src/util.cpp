// Small string helpers shared by the settings loader and the CLI
#include "treemirror/util.hpp"

#include <algorithm>
#include <cctype>

namespace treemirror::strutil {

std::string trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string to_lower(std::string_view sv) {
  std::string s(sv);
  std::ranges::transform(s, s.begin(),
                         [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return s;
}

bool starts_with_icase(std::string_view sv, std::string_view prefix) {
  if (sv.size() < prefix.size()) {
    return false;
  }
  return to_lower(sv.substr(0, prefix.size())) == to_lower(prefix);
}

} // namespace treemirror::strutil
