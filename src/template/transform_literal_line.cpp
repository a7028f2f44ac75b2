/***
 * Name: pyp::tmpl::TransformLiteralLine
 * Purpose: Convert one literal template line into a single emission statement.
 * Inputs:
 *   - line: literal text, possibly with `${expr}` markers
 *   - target: Print (`_PRINT`) or Accumulate (`_OUTPUT.append`, inside pypdef)
 * Outputs: Python statement text
 * Theory of Operation:
 *   Without markers: `_PRINT('<escaped line>')`.
 *   With markers: `%` is doubled, each marker becomes `%s`, quotes are escaped,
 *   and the expressions form the format tuple:
 *     `Hello ${name}!` -> `_PRINT('Hello %s!' % ((name),))`
 */
#include "pyp/template/literal_line.h"

#include <cstddef>
#include <string>
#include <string_view>

#include "pyp/template/syntax.h"

namespace pyp::tmpl {

static std::string PercentFormat(std::string_view line) {
  std::string format;
  std::size_t pos = 0;
  while (pos < line.size()) {
    if (line.compare(pos, 2, "${") == 0) {
      const std::size_t close = line.find('}', pos + 2);
      if (close != std::string_view::npos) {
        format += "%s";
        pos = close + 1;
        continue;
      }
    }
    if (line[pos] == '%') {
      format += "%%";
    } else {
      format += line[pos];
    }
    ++pos;
  }
  return format;
}

auto TransformLiteralLine(std::string_view line, EmitTarget target) -> std::string {
  std::string call(target == EmitTarget::Accumulate ? std::string(kAccumulator) + ".append" : std::string(kPrintFunction));
  const auto exprs = FindExpressions(line);
  if (exprs.empty()) {
    return call + "('" + EscapeQuotes(line) + "')";
  }
  std::string args;
  for (std::size_t i = 0; i < exprs.size(); ++i) {
    if (i != 0U) {
      args += ',';
    }
    args += "(" + exprs[i] + ")";
  }
  return call + "('" + EscapeQuotes(PercentFormat(line)) + "' % (" + args + ",))";
}

}  // namespace pyp::tmpl
