/***
 * Name: pyp::support::ConsumeSign
 * Purpose: Consume a leading '+' or '-'.
 * Inputs: text (by ref), is_negative (by ref)
 * Outputs: is_negative set; returns true when a sign character was consumed
 */
#include "pyp/support/parse_util.h"

#include <string_view>

namespace pyp::support {

auto ConsumeSign(std::string_view& text, bool& is_negative) -> bool {
  is_negative = false;
  if (text.empty() || (text.front() != '+' && text.front() != '-')) {
    return false;
  }
  is_negative = text.front() == '-';
  text.remove_prefix(1);
  return true;
}

}  // namespace pyp::support
