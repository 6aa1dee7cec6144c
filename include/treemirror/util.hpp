#pragma once
#include <string>
#include <string_view>

namespace treemirror {

// String helpers
namespace strutil {
  // Strip spaces, tabs and CR/LF from both ends
  auto trim(std::string_view sv) -> std::string;

  // ASCII lowercase copy
  auto to_lower(std::string_view sv) -> std::string;

  // Does `sv` start with `prefix`, ignoring ASCII case?
  auto starts_with_icase(std::string_view sv, std::string_view prefix) -> bool;
}

}
