/***
 * Name: pyp::support::TrimLeadingSpaces
 * Purpose: Remove leading ASCII whitespace from a string_view.
 * Inputs: text (by ref)
 * Outputs: text with prefix removed
 */
#include "pyp/support/parse_util.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string_view>

namespace pyp::support {

void TrimLeadingSpaces(std::string_view& text) {
  const auto first = std::find_if(text.begin(), text.end(),
                                  [](char chr) { return std::isspace(static_cast<unsigned char>(chr)) == 0; });
  text.remove_prefix(static_cast<std::size_t>(first - text.begin()));
}

}  // namespace pyp::support
