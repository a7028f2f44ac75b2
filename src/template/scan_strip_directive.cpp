/***
 * Name: pyp::tmpl::detail::StripDirective
 * Purpose: Recognize a `%` directive line and return what follows the marker.
 * Inputs: line
 * Outputs: Text after `%` and any blanks; nullopt when the line is not a directive
 * Theory of Operation: Blanks are allowed on both sides of the marker, so
 *   "  %  for x in y:" yields "for x in y:".
 */
#include "pyp/template/detail/scan.h"

#include <optional>
#include <string_view>

namespace pyp::tmpl::detail {

auto StripDirective(std::string_view line) -> std::optional<std::string_view> {
  std::string_view rest = SkipBlanks(line);
  if (rest.empty() || rest.front() != '%') {
    return std::nullopt;
  }
  rest.remove_prefix(1);
  return SkipBlanks(rest);
}

}  // namespace pyp::tmpl::detail
