/***
 * Name: pyp::support::ParseIntLiteralStrict
 * Purpose: Parse a base-10 integer without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the literal (e.g. the value of --seed)
 * Outputs:
 *   - out_val: parsed integer on success (untouched on failure)
 *   - err: optional error message on failure
 * Theory of Operation: Trim, optional sign, then strict digit parsing.
 */
#include "pyp/support/parse.h"

#include <cctype>
#include <string>
#include <string_view>

#include "pyp/support/parse_util.h"

namespace pyp::support {

auto ParseIntLiteralStrict(std::string_view text, long long& out_val, std::string* err) -> bool {
  TrimLeadingSpaces(text);
  bool is_negative = false;
  ConsumeSign(text, is_negative);
  if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())) == 0) {
    if (err != nullptr) {
      *err = "invalid integer literal";
    }
    return false;
  }
  long long value = 0;
  if (!ParseDigitsStrict(text, is_negative, value, err)) {
    return false;
  }
  out_val = value;
  return true;
}

}  // namespace pyp::support
