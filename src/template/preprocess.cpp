/***
 * Name: pyp::tmpl::Preprocess
 * Purpose: Fold multi-line `${...}` expressions and number every physical line.
 * Inputs:
 *   - text: raw template text
 * Outputs:
 *   - One SourceLine per physical line; line i has SourceLine::line == i
 * Theory of Operation:
 *   Scans characters left to right. An expression runs from `${` to the first
 *   following `}`; its newlines become spaces and, for each one, the current line
 *   is closed and a padding line is opened. Text that followed the closing `}`
 *   lands on the last padding line, which keeps its physical line number and is
 *   only a placeholder if that text is blank. A `${` with no closing `}` is
 *   ordinary text.
 */
#include "pyp/template/preprocess.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pyp::tmpl {

static bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](char chr) { return std::isspace(static_cast<unsigned char>(chr)) != 0; });
}

auto Preprocess(std::string_view text) -> std::vector<SourceLine> {
  std::vector<SourceLine> lines;
  std::string current;
  bool padding = false;

  auto close_line = [&]() {
    if (!current.empty() && current.back() == '\r') {
      current.pop_back();
    }
    const int number = static_cast<int>(lines.size()) + 1;
    const bool placeholder = padding && IsBlank(current);
    lines.push_back(SourceLine{current, number, placeholder});
    current.clear();
  };

  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text.compare(pos, 2, "${") == 0) {
      const std::size_t close = text.find('}', pos + 2);
      if (close != std::string_view::npos) {
        std::string inner(text.substr(pos + 2, close - pos - 2));
        const auto newlines = std::count(inner.begin(), inner.end(), '\n');
        std::replace(inner.begin(), inner.end(), '\n', ' ');
        std::replace(inner.begin(), inner.end(), '\r', ' ');
        current += "${";
        current += inner;
        current += '}';
        for (std::ptrdiff_t i = 0; i < newlines; ++i) {
          close_line();
          padding = true;
        }
        pos = close + 1;
        continue;
      }
    }
    if (text[pos] == '\n') {
      close_line();
      padding = false;
    } else {
      current += text[pos];
    }
    ++pos;
  }
  close_line();
  return lines;
}

}  // namespace pyp::tmpl
