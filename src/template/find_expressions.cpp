/***
 * Name: pyp::tmpl::FindExpressions
 * Purpose: Collect the inner text of every `${...}` on a line.
 * Inputs: line
 * Outputs: Expression texts, left to right, exactly as written
 * Theory of Operation: Each expression ends at the first `}` after its `${`.
 */
#include "pyp/template/literal_line.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pyp::tmpl {

auto FindExpressions(std::string_view line) -> std::vector<std::string> {
  std::vector<std::string> exprs;
  std::size_t pos = line.find("${");
  while (pos != std::string_view::npos) {
    const std::size_t close = line.find('}', pos + 2);
    if (close == std::string_view::npos) {
      break;
    }
    exprs.emplace_back(line.substr(pos + 2, close - pos - 2));
    pos = line.find("${", close + 1);
  }
  return exprs;
}

}  // namespace pyp::tmpl
