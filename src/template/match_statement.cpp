/***
 * Name: pyp::tmpl::MatchStatement
 * Purpose: Recognize a raw Python statement line (`% x = 5`).
 * Inputs: line
 * Outputs: The statement text, passed through unchanged
 * Theory of Operation: Checked after every other `%` form, so it accepts anything.
 */
#include "pyp/template/syntax.h"

#include <optional>
#include <string>
#include <string_view>

#include "pyp/template/detail/scan.h"

namespace pyp::tmpl {

auto MatchStatement(std::string_view line) -> std::optional<std::string> {
  const auto rest = detail::StripDirective(line);
  if (!rest) {
    return std::nullopt;
  }
  return std::string(*rest);
}

}  // namespace pyp::tmpl
