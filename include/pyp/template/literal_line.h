/***
 * Name: pyp::tmpl (literal lines)
 * Purpose: Turn one literal template line into one Python emission statement.
 * Inputs: Line text; whether the line is inside a pypdef
 * Outputs: `_PRINT(...)` or `_OUTPUT.append(...)` statement text
 * Theory of Operation: The line becomes a single-quoted %-format string; every
 *   `${expr}` becomes `%s` and its text, unparsed, becomes the matching tuple
 *   element, left to right.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pyp {
namespace tmpl {

enum class EmitTarget { Print, Accumulate };

/*** EscapeQuotes: `\` -> `\\`, `'` -> `\'`, `"` -> `\"`. */
std::string EscapeQuotes(std::string_view text);

/*** FindExpressions: Inner texts of every `${...}` on the line, in order. */
std::vector<std::string> FindExpressions(std::string_view line);

/*** TransformLiteralLine: Build the emission statement for a literal line. */
std::string TransformLiteralLine(std::string_view line, EmitTarget target);

}  // namespace tmpl
}  // namespace pyp
