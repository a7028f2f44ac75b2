/***
 * Name: pyp::diagnostics::FromParseError
 * Purpose: Convert a ParseError into a printable Diagnostic.
 * Inputs:
 *   - error: the parse error (message, preprocessed line text, line number)
 *   - template_lines: original template lines
 *   - input_name: template name shown in `File "..."`
 * Outputs: Diagnostic of kind Parse
 * Theory of Operation: Prefers the original line text; falls back to the text
 *   carried by the error when the number is outside the template.
 */
#include "pyp/diagnostics/diagnostic.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pyp::diagnostics {

auto FromParseError(const exceptions::ParseError& error, const std::vector<std::string>& template_lines,
                    const std::string& input_name) -> Diagnostic {
  Diagnostic diag;
  diag.kind = Diagnostic::Kind::Parse;
  diag.file = input_name;
  diag.line = error.line_number();
  const auto index = static_cast<std::size_t>(error.line_number() - 1);
  diag.line_text = error.line_number() >= 1 && index < template_lines.size() ? template_lines[index] : error.line();
  diag.type = "ParseError";
  diag.message = error.what();
  return diag;
}

}  // namespace pyp::diagnostics
