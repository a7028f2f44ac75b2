/***
 * Name: pyp::tmpl::detail::MiddleKeywordFromName
 * Purpose: Map a directive word onto a middle keyword.
 * Inputs: name (exact, case-sensitive)
 * Outputs: MiddleKeyword or nullopt
 */
#include "pyp/template/detail/scan.h"

#include <array>
#include <optional>
#include <string_view>

namespace pyp::tmpl::detail {

auto MiddleKeywordFromName(std::string_view name) -> std::optional<MiddleKeyword> {
  constexpr std::array kKeywords{MiddleKeyword::Elif, MiddleKeyword::Else, MiddleKeyword::Except,
                                 MiddleKeyword::Finally};
  for (const auto keyword : kKeywords) {
    if (MiddleKeywordName(keyword) == name) {
      return keyword;
    }
  }
  return std::nullopt;
}

}  // namespace pyp::tmpl::detail
