/***
 * Name: pyp::tmpl::EscapeQuotes
 * Purpose: Make text safe inside a single-quoted Python string literal.
 * Inputs: text
 * Outputs: text with `\`, `'` and `"` backslash-escaped
 */
#include "pyp/template/literal_line.h"

#include <string>
#include <string_view>

namespace pyp::tmpl {

auto EscapeQuotes(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (const char chr : text) {
    if (chr == '\\' || chr == '\'' || chr == '"') {
      out += '\\';
    }
    out += chr;
  }
  return out;
}

}  // namespace pyp::tmpl
