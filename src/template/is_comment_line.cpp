/***
 * Name: pyp::tmpl::IsCommentLine
 * Purpose: Recognize a template comment line (`##` after optional blanks).
 * Inputs: line
 * Outputs: true when the first non-blank characters are `##`
 * Theory of Operation: Comment lines produce no code and no line-map entry.
 */
#include "pyp/template/syntax.h"

#include <string_view>

#include "pyp/template/detail/scan.h"

namespace pyp::tmpl {

auto IsCommentLine(std::string_view line) -> bool {
  constexpr std::string_view kMarker{"##"};
  return detail::SkipBlanks(line).substr(0, kMarker.size()) == kMarker;
}

}  // namespace pyp::tmpl
