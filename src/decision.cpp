#include "treemirror/decision.hpp"

namespace treemirror {

char status_code(Decision d) {
  return d == Decision::Create   ? 'A'
         : d == Decision::Update ? 'M'
         : d == Decision::Delete ? 'D'
                                 : ' ';
}

} // namespace treemirror
