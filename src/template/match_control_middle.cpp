/***
 * Name: pyp::tmpl::MatchControlMiddle
 * Purpose: Recognize a clause directive such as `% elif x > 0:` or `% except:`.
 * Inputs: line
 * Outputs: middle keyword and the Python clause header
 * Theory of Operation: Same shape as MatchControlStart with the middle keyword set.
 */
#include "pyp/template/syntax.h"

#include <optional>
#include <string>
#include <string_view>

#include "pyp/template/detail/scan.h"

namespace pyp::tmpl {

auto MatchControlMiddle(std::string_view line) -> std::optional<ControlMiddle> {
  const auto rest = detail::StripDirective(line);
  if (!rest) {
    return std::nullopt;
  }
  const auto keyword = detail::MiddleKeywordFromName(detail::LeadingIdentifier(*rest));
  if (!keyword) {
    return std::nullopt;
  }
  const auto colon = rest->rfind(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  return ControlMiddle{*keyword, std::string(rest->substr(0, colon + 1))};
}

}  // namespace pyp::tmpl
