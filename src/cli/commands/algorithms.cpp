#include "treemirror/consts.hpp"
#include "treemirror/fingerprint.hpp"

#include <iostream>

int cmd_algorithms(int /*argc*/, char ** /*argv*/) {
  for (const auto &name : treemirror::supported_algorithms()) {
    std::cout << name << (name == treemirror::consts::kDefaultAlgorithm ? "  (default)" : "")
              << "\n";
  }
  return 0;
}
