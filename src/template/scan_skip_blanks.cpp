/***
 * Name: pyp::tmpl::detail::SkipBlanks
 * Purpose: Remove leading whitespace from a view.
 * Inputs: text
 * Outputs: text without its whitespace prefix
 */
#include "pyp/template/detail/scan.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace pyp::tmpl::detail {

auto SkipBlanks(std::string_view text) -> std::string_view {
  std::size_t index = 0;
  while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
    ++index;
  }
  text.remove_prefix(index);
  return text;
}

}  // namespace pyp::tmpl::detail
