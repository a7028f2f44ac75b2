/***
 * Name: pyp::tmpl::detail::KeywordFromName
 * Purpose: Map a directive word onto a block keyword.
 * Inputs: name (exact, case-sensitive)
 * Outputs: ControlKeyword or nullopt
 * Theory of Operation: Linear scan over the closed keyword set via KeywordName().
 */
#include "pyp/template/detail/scan.h"

#include <array>
#include <optional>
#include <string_view>

namespace pyp::tmpl::detail {

auto KeywordFromName(std::string_view name) -> std::optional<ControlKeyword> {
  constexpr std::array kKeywords{ControlKeyword::For,   ControlKeyword::If,  ControlKeyword::Try,
                                 ControlKeyword::While, ControlKeyword::Def, ControlKeyword::Class,
                                 ControlKeyword::With,  ControlKeyword::Pypdef};
  for (const auto keyword : kKeywords) {
    if (KeywordName(keyword) == name) {
      return keyword;
    }
  }
  return std::nullopt;
}

}  // namespace pyp::tmpl::detail
