/***
 * Name: pyp::tmpl::detail::LeadingIdentifier
 * Purpose: Return the identifier that starts a view.
 * Inputs: text
 * Outputs: Longest [A-Za-z0-9_] prefix; empty if none
 */
#include "pyp/template/detail/scan.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace pyp::tmpl::detail {

auto LeadingIdentifier(std::string_view text) -> std::string_view {
  std::size_t length = 0;
  while (length < text.size()) {
    const auto uchar = static_cast<unsigned char>(text[length]);
    if (std::isalnum(uchar) == 0 && uchar != '_') {
      break;
    }
    ++length;
  }
  return text.substr(0, length);
}

}  // namespace pyp::tmpl::detail
