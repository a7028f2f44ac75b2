/***
 * Name: pyp::tmpl::MatchControlEnd
 * Purpose: Recognize a block-closing directive such as `% endfor`.
 * Inputs: line
 * Outputs: The keyword being closed
 * Theory of Operation: The word after `%` must be `end` immediately followed by a
 *   block keyword; `% endiffy` is not a closing directive.
 */
#include "pyp/template/syntax.h"

#include <optional>
#include <string_view>

#include "pyp/template/detail/scan.h"

namespace pyp::tmpl {

auto MatchControlEnd(std::string_view line) -> std::optional<ControlKeyword> {
  const auto rest = detail::StripDirective(line);
  if (!rest) {
    return std::nullopt;
  }
  constexpr std::string_view kEnd{"end"};
  const std::string_view word = detail::LeadingIdentifier(*rest);
  if (word.size() <= kEnd.size() || word.substr(0, kEnd.size()) != kEnd) {
    return std::nullopt;
  }
  return detail::KeywordFromName(word.substr(kEnd.size()));
}

}  // namespace pyp::tmpl
