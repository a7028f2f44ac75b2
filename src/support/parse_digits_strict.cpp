/***
 * Name: pyp::support::ParseDigitsStrict
 * Purpose: Parse base-10 digits into a signed 64-bit value with range checks.
 * Inputs: text view (no sign), sign, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 * Theory of Operation: Negative values accumulate downward so the minimum value
 *   parses without overflow. Only whitespace may follow the digits.
 */
#include "pyp/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>

namespace pyp::support {

static bool Fail(std::string* err, const char* message) {
  if (err != nullptr) {
    *err = message;
  }
  return false;
}

auto ParseDigitsStrict(std::string_view text, bool is_negative, long long& value, std::string* err) -> bool {
  constexpr long long kBase10 = 10;
  constexpr long long kMax = std::numeric_limits<long long>::max();
  constexpr long long kMin = std::numeric_limits<long long>::min();
  value = 0;
  std::size_t index = 0;
  for (; index < text.size(); ++index) {
    const char digit_char = text[index];
    if (std::isspace(static_cast<unsigned char>(digit_char)) != 0) {
      break;
    }
    if (std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      return Fail(err, "invalid character in integer literal");
    }
    const long long digit = digit_char - '0';
    const bool overflows = is_negative ? value < (kMin + digit) / kBase10 : value > (kMax - digit) / kBase10;
    if (overflows) {
      return Fail(err, "integer out of range");
    }
    value = is_negative ? (value * kBase10) - digit : (value * kBase10) + digit;
  }
  for (; index < text.size(); ++index) {
    if (std::isspace(static_cast<unsigned char>(text[index])) == 0) {
      return Fail(err, "unexpected text after integer literal");
    }
  }
  return true;
}

}  // namespace pyp::support
