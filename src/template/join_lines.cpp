/***
 * Name: pyp::tmpl::JoinLines
 * Purpose: Join generated lines into program text.
 * Inputs: lines
 * Outputs: lines separated by '\n'; line k of the result is generated line k + 1
 */
#include "pyp/template/codegen.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pyp::tmpl {

auto JoinLines(const std::vector<std::string>& lines) -> std::string {
  std::string text;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i != 0U) {
      text += '\n';
    }
    text += lines[i];
  }
  return text;
}

}  // namespace pyp::tmpl
