/***
 * Name: pyp::tmpl::IsBlockStart
 * Purpose: Recognize the opening line of a verbatim Python block.
 * Inputs: line
 * Outputs: true when the first non-blank characters are `<%`
 * Theory of Operation: Anything after `<%` on the same line is ignored.
 */
#include "pyp/template/syntax.h"

#include <string_view>

#include "pyp/template/detail/scan.h"

namespace pyp::tmpl {

auto IsBlockStart(std::string_view line) -> bool {
  constexpr std::string_view kMarker{"<%"};
  return detail::SkipBlanks(line).substr(0, kMarker.size()) == kMarker;
}

}  // namespace pyp::tmpl
