/***
 * Name: pyp::tmpl::SplitLines
 * Purpose: Split template text into physical lines.
 * Inputs: text
 * Outputs: count('\n') + 1 strings (a trailing newline yields a final empty line)
 * Theory of Operation: One trailing '\r' per line is dropped so CRLF templates
 *   number and render like LF templates.
 */
#include "pyp/template/preprocess.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pyp::tmpl {

auto SplitLines(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::size_t begin = 0;
  while (true) {
    const std::size_t end = text.find('\n', begin);
    std::string_view line = text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    if (end == std::string_view::npos) {
      break;
    }
    begin = end + 1;
  }
  return lines;
}

}  // namespace pyp::tmpl
