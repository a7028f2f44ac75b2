/***
 * Name: pyp::tmpl::MiddleKeywordName
 * Purpose: Template spelling of a middle keyword.
 * Inputs: keyword
 * Outputs: Keyword text as written after `%`
 */
#include "pyp/template/syntax.h"

#include <string_view>

namespace pyp::tmpl {

auto MiddleKeywordName(MiddleKeyword keyword) -> std::string_view {
  switch (keyword) {
    case MiddleKeyword::Elif: return "elif";
    case MiddleKeyword::Else: return "else";
    case MiddleKeyword::Except: return "except";
    case MiddleKeyword::Finally: return "finally";
  }
  return "";
}

}  // namespace pyp::tmpl
