/***
 * Name: pyp::tmpl::KeywordName
 * Purpose: Template spelling of a block keyword.
 * Inputs: keyword
 * Outputs: Keyword text as written after `%` (and after `%end`)
 */
#include "pyp/template/syntax.h"

#include <string_view>

namespace pyp::tmpl {

auto KeywordName(ControlKeyword keyword) -> std::string_view {
  switch (keyword) {
    case ControlKeyword::For: return "for";
    case ControlKeyword::If: return "if";
    case ControlKeyword::Try: return "try";
    case ControlKeyword::While: return "while";
    case ControlKeyword::Def: return "def";
    case ControlKeyword::Class: return "class";
    case ControlKeyword::With: return "with";
    case ControlKeyword::Pypdef: return "pypdef";
  }
  return "";
}

}  // namespace pyp::tmpl
