/***
 * Name: pyp::tmpl::MatchControlStart
 * Purpose: Recognize a block-opening directive such as `% for x in xs:`.
 * Inputs: line
 * Outputs: keyword and the Python statement (keyword through the last `:`)
 * Theory of Operation: The word after `%` must be exactly a block keyword and the
 *   line must contain a colon; text after the last colon is not part of the
 *   statement.
 */
#include "pyp/template/syntax.h"

#include <optional>
#include <string>
#include <string_view>

#include "pyp/template/detail/scan.h"

namespace pyp::tmpl {

auto MatchControlStart(std::string_view line) -> std::optional<ControlStart> {
  const auto rest = detail::StripDirective(line);
  if (!rest) {
    return std::nullopt;
  }
  const auto keyword = detail::KeywordFromName(detail::LeadingIdentifier(*rest));
  if (!keyword) {
    return std::nullopt;
  }
  const auto colon = rest->rfind(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  return ControlStart{*keyword, std::string(rest->substr(0, colon + 1))};
}

}  // namespace pyp::tmpl
