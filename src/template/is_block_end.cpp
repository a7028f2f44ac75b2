/***
 * Name: pyp::tmpl::IsBlockEnd
 * Purpose: Recognize the closing line of a verbatim Python block.
 * Inputs: line
 * Outputs: true when the first non-blank characters are `%>`
 * Theory of Operation: Only consulted while a `<%` block is open.
 */
#include "pyp/template/syntax.h"

#include <string_view>

#include "pyp/template/detail/scan.h"

namespace pyp::tmpl {

auto IsBlockEnd(std::string_view line) -> bool {
  constexpr std::string_view kMarker{"%>"};
  return detail::SkipBlanks(line).substr(0, kMarker.size()) == kMarker;
}

}  // namespace pyp::tmpl
